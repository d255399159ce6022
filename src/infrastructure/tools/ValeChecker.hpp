/**
 * @file ValeChecker.hpp
 * @brief Prose style checks via the vale binary.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/ReviewTools.hpp"

namespace clara::infrastructure::tools {

class ValeChecker : public domain::LineChecker {
public:
    explicit ValeChecker(std::string configFile = "configs/vale.ini", std::string binary = "vale");

    std::string name() const override { return "vale"; }
    domain::ToolRun check(const std::vector<std::string>& files) override;

    /**
     * @brief Maps vale's JSON output ({file: [alert...]}) to issues.
     * @throws nlohmann::json::exception when the output is not JSON.
     */
    static std::vector<domain::Issue> ParseOutput(const std::string& output);

private:
    std::string m_configFile;
    std::string m_binary;
};

} // namespace clara::infrastructure::tools
