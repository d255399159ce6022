/**
 * @file CommandLine.hpp
 * @brief Argument parsing for the clara executable.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace clara::app {

enum class Command {
    ReviewAuto, ///< Incremental run backed by the review cache.
    Check       ///< Full run, cache untouched.
};

struct CommandLine {
    Command command = Command::ReviewAuto;
    std::vector<std::string> files;
    std::optional<std::string> jsonOut;
    std::string configPath = "clara.json";
    bool withLlm = false;
    bool fast = false;
    bool noCache = false;
    bool showHelp = false;

    /**
     * @brief Parses argv.
     * @param error Set to a description of the problem on failure.
     * @return nullopt on a usage error.
     */
    static std::optional<CommandLine> Parse(const std::vector<std::string>& args, std::string& error);

    static std::string Usage();
};

} // namespace clara::app
