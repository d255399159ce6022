/**
 * @file LlmResponseParser.cpp
 * @brief Implementation of LlmResponseParser.
 */

#include "infrastructure/LlmResponseParser.hpp"
#include <nlohmann/json.hpp>

namespace clara::infrastructure {

using json = nlohmann::json;

namespace {

json ExtractList(const std::string& content) {
    json data = json::parse(content, nullptr, false);
    if (!data.is_discarded()) {
        if (data.is_array()) return data;
        if (data.is_object()) {
            for (const char* key : {"items", "suggestions", "results"}) {
                if (data.contains(key) && data[key].is_array()) return data[key];
            }
        }
    }

    // Thinking blocks or code fences around the payload.
    size_t start = content.find('[');
    size_t end = content.rfind(']');
    if (start == std::string::npos || end == std::string::npos || end < start) {
        return json::array();
    }
    json span = json::parse(content.substr(start, end - start + 1), nullptr, false);
    if (span.is_discarded() || !span.is_array()) return json::array();
    return span;
}

domain::IssueRecord MakeRecord() {
    domain::IssueRecord record;
    record.tool = "llm";
    record.type = "clarity";
    record.severity = domain::Severity::Note;
    record.message = "Suggestion";
    return record;
}

} // namespace

std::vector<domain::IssueRecord> LlmResponseParser::Parse(const std::string& content) {
    std::vector<domain::IssueRecord> records;
    if (content.empty()) return records;

    for (const auto& item : ExtractList(content)) {
        if (item.is_string()) {
            auto record = MakeRecord();
            record.suggestion = item.get<std::string>();
            records.push_back(std::move(record));
        } else if (item.is_object()) {
            auto record = MakeRecord();
            if (item.contains("rationale") && item["rationale"].is_string()) {
                record.message = item["rationale"].get<std::string>();
            }
            if (item.contains("suggestion") && item["suggestion"].is_string()) {
                record.suggestion = item["suggestion"].get<std::string>();
            }
            records.push_back(std::move(record));
        }
    }
    return records;
}

} // namespace clara::infrastructure
