/**
 * @file ValeChecker.cpp
 * @brief Implementation of ValeChecker.
 */

#include "infrastructure/tools/ValeChecker.hpp"
#include "infrastructure/ProcessRunner.hpp"
#include <nlohmann/json.hpp>

namespace clara::infrastructure::tools {

using json = nlohmann::json;

namespace {
std::string Trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}
}

ValeChecker::ValeChecker(std::string configFile, std::string binary)
    : m_configFile(std::move(configFile)), m_binary(std::move(binary)) {}

domain::ToolRun ValeChecker::check(const std::vector<std::string>& files) {
    domain::ToolRun run;
    run.tool = name();
    if (files.empty()) return run;

    // --no-exit: alerts are read from stdout, not from the exit status.
    std::vector<std::string> argv = {m_binary, "--no-exit", "--output=JSON", "--config=" + m_configFile};
    argv.insert(argv.end(), files.begin(), files.end());

    auto result = ProcessRunner::Run(argv);
    if (!result) {
        run.failure = "Failed to start vale";
        return run;
    }
    if (result->exitCode == 127) {
        run.failure = "vale binary not found";
        return run;
    }

    try {
        run.issues = ParseOutput(result->stdoutText);
    } catch (const json::exception& e) {
        std::string err = Trim(result->stderrText);
        run.failure = err.empty() ? std::string("Vale produced unreadable output: ") + e.what()
                                  : "Vale execution failed: " + err;
    }
    return run;
}

std::vector<domain::Issue> ValeChecker::ParseOutput(const std::string& output) {
    std::vector<domain::Issue> issues;
    json data = json::parse(output);
    if (!data.is_object()) return issues;

    for (const auto& [filename, alerts] : data.items()) {
        if (!alerts.is_array()) continue;
        for (const auto& alert : alerts) {
            domain::Issue issue;
            issue.tool = "vale";
            issue.type = "style";
            issue.file = filename;
            issue.line = alert.value("Line", 0);
            if (alert.contains("Span") && alert["Span"].is_array() && !alert["Span"].empty() &&
                alert["Span"][0].is_number_integer()) {
                issue.col = alert["Span"][0].get<int>();
            }
            issue.severity = domain::SeverityFromString(alert.value("Severity", std::string("warning")));
            issue.message = alert.value("Message", std::string());
            if (alert.contains("Check") && alert["Check"].is_string()) {
                issue.code = alert["Check"].get<std::string>();
            }
            issues.push_back(std::move(issue));
        }
    }
    return issues;
}

} // namespace clara::infrastructure::tools
