/**
 * @file LatexindentChecker.cpp
 * @brief Implementation of LatexindentChecker.
 */

#include "infrastructure/tools/LatexindentChecker.hpp"
#include "infrastructure/ProcessRunner.hpp"
#include <filesystem>

namespace clara::infrastructure::tools {

LatexindentChecker::LatexindentChecker(std::string settingsFile, std::string binary)
    : m_settingsFile(std::move(settingsFile)), m_binary(std::move(binary)) {}

std::optional<domain::Issue> LatexindentChecker::FormattingIssue(const std::string& file, int exitCode) {
    if (exitCode == 0) return std::nullopt;

    domain::Issue issue;
    issue.tool = "latexindent";
    issue.type = "formatting";
    issue.file = file;
    issue.line = 0;
    issue.severity = domain::Severity::Warning;
    issue.message = "File is not formatted correctly. Run latexindent to correct it.";
    return issue;
}

domain::ToolRun LatexindentChecker::check(const std::vector<std::string>& files) {
    domain::ToolRun run;
    run.tool = name();
    if (files.empty()) return run;

    // -k: check mode, -s: silent, -c: keep backups and logs out of the project.
    std::vector<std::string> base = {m_binary};
    if (std::filesystem::exists(m_settingsFile)) {
        base.push_back("-l=" + m_settingsFile);
    }
    std::error_code ec;
    const auto scratch = std::filesystem::temp_directory_path(ec);
    base.push_back("-c=" + (ec ? std::string("/tmp") : scratch.string()));
    base.push_back("-k");
    base.push_back("-s");

    for (const auto& file : files) {
        std::vector<std::string> argv = base;
        argv.push_back(file);

        auto result = ProcessRunner::Run(argv);
        if (!result) {
            run.failure = "Failed to start latexindent";
            return run;
        }
        if (result->exitCode == 127) {
            run.failure = "latexindent binary not found";
            return run;
        }
        if (result->exitCode < 0) {
            run.failure = "latexindent did not exit normally on " + file;
            return run;
        }
        if (auto issue = FormattingIssue(file, result->exitCode)) {
            run.issues.push_back(std::move(*issue));
        }
    }
    return run;
}

} // namespace clara::infrastructure::tools
