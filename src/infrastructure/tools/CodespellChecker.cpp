/**
 * @file CodespellChecker.cpp
 * @brief Implementation of CodespellChecker.
 */

#include "infrastructure/tools/CodespellChecker.hpp"
#include "infrastructure/ProcessRunner.hpp"
#include <regex>
#include <sstream>
#include <stdexcept>

namespace clara::infrastructure::tools {

namespace {
const std::regex kLinePattern(R"(^(.*?):(\d+):\s+(.*)$)");

std::string Trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}
}

domain::ToolRun CodespellChecker::check(const std::vector<std::string>& files) {
    domain::ToolRun run;
    run.tool = name();
    if (files.empty()) return run;

    std::vector<std::string> argv = {"codespell"};
    argv.insert(argv.end(), files.begin(), files.end());

    // Non-zero exit only means typos were found.
    auto result = ProcessRunner::Run(argv);
    if (!result) {
        run.failure = "Failed to start codespell";
        return run;
    }
    if (result->exitCode == 127) {
        run.failure = "codespell binary not found";
        return run;
    }

    run.issues = ParseOutput(result->stdoutText + result->stderrText);
    return run;
}

std::vector<domain::Issue> CodespellChecker::ParseOutput(const std::string& output) {
    std::vector<domain::Issue> issues;
    std::istringstream stream(output);
    std::string raw;
    while (std::getline(stream, raw)) {
        std::string line = Trim(raw);
        if (line.empty()) continue;

        std::smatch m;
        if (!std::regex_match(line, m, kLinePattern)) continue;

        domain::Issue issue;
        issue.tool = "codespell";
        issue.type = "typo";
        issue.file = m[1].str();
        try {
            issue.line = std::stoi(m[2].str());
        } catch (const std::out_of_range&) {
            continue;
        }
        issue.severity = domain::Severity::Warning;
        issue.message = m[3].str();
        issues.push_back(std::move(issue));
    }
    return issues;
}

} // namespace clara::infrastructure::tools
