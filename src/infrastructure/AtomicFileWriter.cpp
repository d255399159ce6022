/**
 * @file AtomicFileWriter.cpp
 * @brief Implementation of AtomicFileWriter.
 */

#include "infrastructure/AtomicFileWriter.hpp"
#include <chrono>
#include <fstream>
#include <iostream>

namespace clara::infrastructure {

namespace fs = std::filesystem;

namespace {

void RemoveQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        std::cerr << "[AtomicFileWriter] Could not remove temp file " << path << ": " << ec.message() << std::endl;
    }
}

} // namespace

bool AtomicFileWriter::Write(const fs::path& target, const std::string& content) {
    // Temp path: <target>.<ticks>.tmp
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = target;
    tempPath += "." + std::to_string(ticks) + ".tmp";

    // 1. Ensure directory exists
    try {
        if (target.has_parent_path() && !fs::exists(target.parent_path())) {
            fs::create_directories(target.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[AtomicFileWriter] Error creating directories: " << e.what() << std::endl;
        return false;
    }

    // 2. Write to temp
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            std::cerr << "[AtomicFileWriter] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[AtomicFileWriter] Write failed during output: " << tempPath << std::endl;
            ofs.close();
            RemoveQuietly(tempPath);
            return false;
        }
    }

    // 3. Atomic rename
    try {
        fs::rename(tempPath, target);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[AtomicFileWriter] Rename failed: " << e.what() << std::endl;
        RemoveQuietly(tempPath);
        return false;
    }
    return true;
}

} // namespace clara::infrastructure
