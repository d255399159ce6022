/**
 * @file ChktexChecker.cpp
 * @brief Implementation of ChktexChecker.
 */

#include "infrastructure/tools/ChktexChecker.hpp"
#include "infrastructure/ProcessRunner.hpp"
#include <filesystem>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace clara::infrastructure::tools {

namespace {
const std::regex kLinePattern(R"(^(.*?):(\d+):(\d+):(Warning|Error):(\d+):(.*)$)");

std::string Trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}
}

ChktexChecker::ChktexChecker(std::string rcFile) : m_rcFile(std::move(rcFile)) {}

domain::ToolRun ChktexChecker::check(const std::vector<std::string>& files) {
    domain::ToolRun run;
    run.tool = name();
    if (files.empty()) return run;

    std::vector<std::string> argv = {"chktex", "-q", "-I", "-v0"};
    if (std::filesystem::exists(m_rcFile)) {
        argv.push_back("-l");
        argv.push_back(m_rcFile);
    }
    argv.push_back("-f%f:%l:%c:%k:%n:%m\n");
    argv.insert(argv.end(), files.begin(), files.end());

    auto result = ProcessRunner::Run(argv);
    if (!result) {
        run.failure = "Failed to start chktex";
        return run;
    }
    if (result->exitCode == 127) {
        run.failure = "chktex binary not found";
        return run;
    }

    run.issues = ParseOutput(result->stdoutText);
    return run;
}

std::vector<domain::Issue> ChktexChecker::ParseOutput(const std::string& output) {
    std::vector<domain::Issue> issues;
    std::istringstream stream(output);
    std::string raw;
    while (std::getline(stream, raw)) {
        std::string line = Trim(raw);
        if (line.empty()) continue;

        std::smatch m;
        if (!std::regex_match(line, m, kLinePattern)) continue;

        domain::Issue issue;
        issue.tool = "chktex";
        issue.type = "latex_lint";
        issue.file = m[1].str();
        try {
            issue.line = std::stoi(m[2].str());
            issue.col = std::stoi(m[3].str());
        } catch (const std::out_of_range&) {
            continue;
        }
        issue.severity = (m[4].str() == "Error") ? domain::Severity::Error : domain::Severity::Warning;
        issue.code = "chktex:" + m[5].str();
        issue.message = Trim(m[6].str());
        issues.push_back(std::move(issue));
    }
    return issues;
}

} // namespace clara::infrastructure::tools
