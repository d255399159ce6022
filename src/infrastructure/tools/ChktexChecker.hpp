/**
 * @file ChktexChecker.hpp
 * @brief LaTeX lint via the chktex binary.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/ReviewTools.hpp"

namespace clara::infrastructure::tools {

class ChktexChecker : public domain::LineChecker {
public:
    explicit ChktexChecker(std::string rcFile = "configs/.chktexrc");

    std::string name() const override { return "chktex"; }
    domain::ToolRun check(const std::vector<std::string>& files) override;

    /** @brief Parses "file:line:col:Kind:num:message" lines; anything else is ignored. */
    static std::vector<domain::Issue> ParseOutput(const std::string& output);

private:
    std::string m_rcFile;
};

} // namespace clara::infrastructure::tools
