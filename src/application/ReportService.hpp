/**
 * @file ReportService.hpp
 * @brief Summary counts, exit status and the JSON report of a run.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/Issue.hpp"

namespace clara::application {

struct ReportSummary {
    int errors = 0;
    int warnings = 0;
    int notes = 0;
};

class ReportService {
public:
    /** @brief Counts active issues by severity; suppressed issues are skipped. */
    static ReportSummary Summarize(const std::vector<domain::Issue>& issues);

    /**
     * @brief 2 with errors, 1 with warnings, else 0.
     * @param severityThreshold "error" ignores warnings; "note" treats notes as warnings.
     */
    static int ExitCode(const ReportSummary& summary, const std::string& severityThreshold = "warning");

    /** @brief {"version": "1.0", "summary": {...}, "issues": [...]} over every issue. */
    static nlohmann::json BuildReport(const std::vector<domain::Issue>& issues, const ReportSummary& summary);

    /**
     * @brief Writes the report to a file, or to stdout when no path is given.
     * @return false if the file could not be written.
     */
    static bool Write(const nlohmann::json& report, const std::optional<std::string>& destination);
};

} // namespace clara::application
