/**
 * @file FileRepository.cpp
 * @brief Implementation of the FileRepository class.
 */
#include "infrastructure/FileRepository.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace clara::infrastructure {

FileRepository::FileRepository(fs::path rootPath)
    : m_rootPath(std::move(rootPath)) {}

std::string FileRepository::locate(const std::string& path) const {
    fs::path p(path);
    if (p.is_absolute() || m_rootPath.empty() || m_rootPath == ".") {
        return path;
    }
    return (m_rootPath / p).string();
}

std::optional<domain::Document> FileRepository::load(const std::string& path) const {
    const std::string location = locate(path);
    std::error_code ec;
    if (!fs::is_regular_file(location, ec)) {
        std::cerr << "[FileRepository] Not a readable file: " << location << std::endl;
        return std::nullopt;
    }

    std::ifstream in(location, std::ios::binary);
    if (!in) {
        std::cerr << "[FileRepository] Failed to open " << location << std::endl;
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        std::cerr << "[FileRepository] Read error on " << location << std::endl;
        return std::nullopt;
    }
    return domain::Document(path, buffer.str());
}

} // namespace clara::infrastructure
