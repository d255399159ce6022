/**
 * @file IssueJson.hpp
 * @brief JSON mapping of issues shared by the cache file and the report.
 */

#pragma once
#include <nlohmann/json.hpp>
#include "domain/Issue.hpp"

namespace clara::infrastructure {

class IssueJson {
public:
    /** @brief {tool, type, col, severity, message, code?, suggestion?, adjudication?} */
    static nlohmann::json FromRecord(const domain::IssueRecord& record);

    /**
     * @brief Parses a cached issue record.
     * @throws nlohmann::json::exception when a required key is missing or mistyped.
     */
    static domain::IssueRecord ToRecord(const nlohmann::json& j);

    /** @brief Report form: record fields plus file, line and suppression state. */
    static nlohmann::json FromIssue(const domain::Issue& issue);
};

} // namespace clara::infrastructure
