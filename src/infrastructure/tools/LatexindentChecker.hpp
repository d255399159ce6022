/**
 * @file LatexindentChecker.hpp
 * @brief Layout check via latexindent in check mode.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/ReviewTools.hpp"

namespace clara::infrastructure::tools {

/**
 * @class LatexindentChecker
 * @brief Runs latexindent once per file without modifying it.
 *
 * A file latexindent would change is reported as a whole-file finding
 * (line 0), which the cache replaces each time the document is re-checked.
 */
class LatexindentChecker : public domain::LineChecker {
public:
    explicit LatexindentChecker(std::string settingsFile = "configs/.latexindent.yaml",
                                std::string binary = "latexindent");

    std::string name() const override { return "latexindent"; }
    domain::ToolRun check(const std::vector<std::string>& files) override;

    /** @brief Formatting warning for a non-zero exit status, nothing otherwise. */
    static std::optional<domain::Issue> FormattingIssue(const std::string& file, int exitCode);

private:
    std::string m_settingsFile;
    std::string m_binary;
};

} // namespace clara::infrastructure::tools
