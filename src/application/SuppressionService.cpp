/**
 * @file SuppressionService.cpp
 * @brief Implementation of SuppressionService.
 */

#include "application/SuppressionService.hpp"
#include "infrastructure/LatexText.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <regex>

namespace clara::application {

namespace {
const std::regex kDirective(R"(\bclara:\s*(ignore-next-line|ignore-start|ignore-end|ignore-file)\b)",
                            std::regex::icase);
}

SuppressionService::SuppressionService(std::shared_ptr<domain::DocumentRepository> repository)
    : m_repository(std::move(repository)) {}

std::optional<std::string> SuppressionService::ParseDirective(const std::string& line) {
    size_t percent = infrastructure::LatexText::FindUnescapedPercent(line);
    if (percent == std::string::npos) return std::nullopt;

    const std::string comment = line.substr(percent + 1);
    std::smatch m;
    if (!std::regex_search(comment, m, kDirective)) return std::nullopt;

    std::string directive = m[1].str();
    std::transform(directive.begin(), directive.end(), directive.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return directive;
}

FileSuppressions SuppressionService::Scan(const std::vector<std::string>& lines) {
    FileSuppressions result;
    int activeStart = 0;

    for (size_t i = 0; i < lines.size(); ++i) {
        const int lineNo = static_cast<int>(i) + 1;
        auto directive = ParseDirective(lines[i]);
        if (!directive) continue;

        if (*directive == "ignore-file") {
            result.ignoreFile = true;
        } else if (*directive == "ignore-next-line") {
            result.ranges.push_back({lineNo + 1, lineNo + 1, "ignore-next-line"});
        } else if (*directive == "ignore-start") {
            if (activeStart == 0) activeStart = lineNo;
        } else if (*directive == "ignore-end") {
            if (activeStart != 0) {
                result.ranges.push_back({activeStart, lineNo, "ignore-block"});
                activeStart = 0;
            }
        }
    }
    if (activeStart != 0) {
        result.ranges.push_back({activeStart, static_cast<int>(lines.size()), "ignore-block"});
    }
    return result;
}

std::vector<domain::Issue> SuppressionService::apply(std::vector<domain::Issue>& issues) const {
    std::map<std::string, FileSuppressions> byFile;
    std::vector<domain::Issue> active;

    for (auto& issue : issues) {
        if (issue.file.empty()) {
            active.push_back(issue);
            continue;
        }

        auto it = byFile.find(issue.file);
        if (it == byFile.end()) {
            FileSuppressions scanned;
            if (auto document = m_repository->load(issue.file)) {
                scanned = Scan(document->getLines());
            }
            it = byFile.emplace(issue.file, std::move(scanned)).first;
        }
        const FileSuppressions& info = it->second;

        std::optional<std::string> rule;
        if (info.ignoreFile) {
            rule = "ignore-file";
        } else if (issue.line > 0) {
            for (const auto& range : info.ranges) {
                if (range.start <= issue.line && issue.line <= range.end) {
                    rule = range.rule;
                    break;
                }
            }
        }

        if (rule) {
            issue.suppressed = true;
            issue.suppressionRule = *rule;
        } else {
            active.push_back(issue);
        }
    }
    return active;
}

} // namespace clara::application
