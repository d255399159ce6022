/**
 * @file ClaraApp.hpp
 * @brief Main application class for the clara command-line tool.
 */

#pragma once

#include <memory>
#include <vector>
#include "app/CommandLine.hpp"
#include "domain/ReviewTools.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace clara::app {

/**
 * @class ClaraApp
 * @brief Wires configuration, tools and services for one invocation and runs it.
 */
class ClaraApp {
public:
    explicit ClaraApp(CommandLine commandLine);

    /**
     * @brief Runs the selected command.
     * @return Exit code: 2 errors, 1 warnings, 0 clean.
     */
    int Run();

    /** @brief Line checkers enabled by the configuration. */
    static std::vector<std::shared_ptr<domain::LineChecker>> BuildCheckers(const infrastructure::ClaraConfig& config);

    /** @brief Reviewer for the configured provider; nullptr for unknown providers. */
    static std::shared_ptr<domain::SegmentReviewer> BuildReviewer(const infrastructure::ClaraConfig& config);

private:
    std::vector<std::string> resolveFiles() const;

    CommandLine m_commandLine;
    infrastructure::ClaraConfig m_config;
};

} // namespace clara::app
