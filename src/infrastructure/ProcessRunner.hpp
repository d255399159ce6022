/**
 * @file ProcessRunner.hpp
 * @brief Runs external command-line tools through the shell and captures their output.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace clara::infrastructure {

struct CommandResult {
    int exitCode = -1;       ///< Exit status, or -1 when the process did not exit normally.
    std::string stdoutText;
    std::string stderrText;
};

class ProcessRunner {
public:
    /**
     * @brief Runs argv[0] with the remaining arguments, single-quoted.
     * @return nullopt when the shell could not be started. A missing binary
     *         shows up as exit code 127.
     */
    static std::optional<CommandResult> Run(const std::vector<std::string>& argv);

    /** @brief Quotes an argument for /bin/sh. */
    static std::string Quote(const std::string& arg);

    static std::string BuildCommand(const std::vector<std::string>& argv);

private:
    static std::string GetTempFilePath(const std::string& suffix);
};

} // namespace clara::infrastructure
