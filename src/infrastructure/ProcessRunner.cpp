/**
 * @file ProcessRunner.cpp
 * @brief Implementation of ProcessRunner.
 */

#include "infrastructure/ProcessRunner.hpp"
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <sys/wait.h>

namespace clara::infrastructure {

std::string ProcessRunner::Quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

std::string ProcessRunner::BuildCommand(const std::vector<std::string>& argv) {
    std::string cmd;
    for (const auto& arg : argv) {
        if (!cmd.empty()) cmd.push_back(' ');
        cmd += Quote(arg);
    }
    return cmd;
}

std::string ProcessRunner::GetTempFilePath(const std::string& suffix) {
    auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    std::string name = "clara_" + std::to_string(now) + suffix;
    return (std::filesystem::temp_directory_path() / name).string();
}

std::optional<CommandResult> ProcessRunner::Run(const std::vector<std::string>& argv) {
    if (argv.empty()) return std::nullopt;

    const std::string errPath = GetTempFilePath(".stderr");
    const std::string cmd = BuildCommand(argv) + " 2>" + Quote(errPath);

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        std::cerr << "[ProcessRunner] Failed to start: " << argv.front() << std::endl;
        return std::nullopt;
    }

    CommandResult result;
    char buffer[4096];
    size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        result.stdoutText.append(buffer, n);
    }
    int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }

    {
        std::ifstream err(errPath, std::ios::binary);
        if (err) {
            std::stringstream ss;
            ss << err.rdbuf();
            result.stderrText = ss.str();
        }
    }
    std::error_code ec;
    std::filesystem::remove(errPath, ec);

    return result;
}

} // namespace clara::infrastructure
