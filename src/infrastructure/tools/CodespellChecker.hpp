/**
 * @file CodespellChecker.hpp
 * @brief Typo detection via the codespell binary.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/ReviewTools.hpp"

namespace clara::infrastructure::tools {

class CodespellChecker : public domain::LineChecker {
public:
    std::string name() const override { return "codespell"; }
    domain::ToolRun check(const std::vector<std::string>& files) override;

    /** @brief Parses "file:line: typo ==> correction" lines. */
    static std::vector<domain::Issue> ParseOutput(const std::string& output);
};

} // namespace clara::infrastructure::tools
