/**
 * @file ReportService.cpp
 * @brief Implementation of ReportService.
 */

#include "application/ReportService.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/IssueJson.hpp"
#include <iostream>

namespace clara::application {

using json = nlohmann::json;

ReportSummary ReportService::Summarize(const std::vector<domain::Issue>& issues) {
    ReportSummary summary;
    for (const auto& issue : issues) {
        if (issue.suppressed) continue;
        switch (issue.severity) {
            case domain::Severity::Error: ++summary.errors; break;
            case domain::Severity::Warning: ++summary.warnings; break;
            case domain::Severity::Note: ++summary.notes; break;
        }
    }
    return summary;
}

int ReportService::ExitCode(const ReportSummary& summary, const std::string& severityThreshold) {
    if (summary.errors > 0) return 2;
    if (severityThreshold == "error") return 0;
    if (summary.warnings > 0) return 1;
    if (severityThreshold == "note" && summary.notes > 0) return 1;
    return 0;
}

json ReportService::BuildReport(const std::vector<domain::Issue>& issues, const ReportSummary& summary) {
    json list = json::array();
    for (const auto& issue : issues) {
        list.push_back(infrastructure::IssueJson::FromIssue(issue));
    }
    return {
        {"version", "1.0"},
        {"summary", {
            {"errors", summary.errors},
            {"warnings", summary.warnings},
            {"notes", summary.notes}
        }},
        {"issues", list}
    };
}

bool ReportService::Write(const json& report, const std::optional<std::string>& destination) {
    const std::string text = report.dump(2, ' ', false, json::error_handler_t::replace);
    if (!destination) {
        std::cout << text << std::endl;
        return true;
    }
    if (!infrastructure::AtomicFileWriter::Write(*destination, text)) {
        std::cerr << "[ReportService] Failed to write report to " << *destination << std::endl;
        return false;
    }
    return true;
}

} // namespace clara::application
