/**
 * @file IssueJson.cpp
 * @brief Implementation of IssueJson.
 */

#include "infrastructure/IssueJson.hpp"

namespace clara::infrastructure {

using json = nlohmann::json;

namespace {

std::optional<std::string> OptionalString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<std::string>();
}

json AdjudicationToJson(const domain::Adjudication& adjudication) {
    json j = {{"accept", adjudication.accept}};
    if (adjudication.fix) j["fix"] = *adjudication.fix;
    if (adjudication.comment) j["comment"] = *adjudication.comment;
    return j;
}

domain::Adjudication AdjudicationFromJson(const json& j) {
    domain::Adjudication adjudication;
    adjudication.accept = j.value("accept", true);
    adjudication.fix = OptionalString(j, "fix");
    adjudication.comment = OptionalString(j, "comment");
    return adjudication;
}

} // namespace

json IssueJson::FromRecord(const domain::IssueRecord& record) {
    json j = {
        {"tool", record.tool},
        {"type", record.type},
        {"col", record.col},
        {"severity", domain::SeverityToString(record.severity)},
        {"message", record.message}
    };
    if (record.code) j["code"] = *record.code;
    if (record.suggestion) j["suggestion"] = *record.suggestion;
    if (record.adjudication) j["adjudication"] = AdjudicationToJson(*record.adjudication);
    return j;
}

domain::IssueRecord IssueJson::ToRecord(const json& j) {
    domain::IssueRecord record;
    record.tool = j.at("tool").get<std::string>();
    record.type = j.at("type").get<std::string>();
    record.col = j.value("col", 0);
    record.severity = domain::SeverityFromString(j.at("severity").get<std::string>());
    record.message = j.at("message").get<std::string>();
    record.code = OptionalString(j, "code");
    record.suggestion = OptionalString(j, "suggestion");
    auto adjudication = j.find("adjudication");
    if (adjudication != j.end() && adjudication->is_object()) {
        record.adjudication = AdjudicationFromJson(*adjudication);
    }
    return record;
}

json IssueJson::FromIssue(const domain::Issue& issue) {
    json j = {
        {"tool", issue.tool},
        {"type", issue.type},
        {"file", issue.file.empty() ? json(nullptr) : json(issue.file)},
        {"line", issue.line},
        {"col", issue.col},
        {"severity", domain::SeverityToString(issue.severity)},
        {"message", issue.message}
    };
    if (issue.code) j["code"] = *issue.code;
    if (issue.suggestion) j["suggestion"] = *issue.suggestion;
    if (issue.adjudication) j["adjudication"] = AdjudicationToJson(*issue.adjudication);
    if (issue.suppressed) {
        j["suppressed"] = true;
        j["suppression"] = {{"rule", issue.suppressionRule}};
    }
    return j;
}

} // namespace clara::infrastructure
