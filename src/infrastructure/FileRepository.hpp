/**
 * @file FileRepository.hpp
 * @brief Filesystem-based implementation of the DocumentRepository.
 */

#pragma once
#include "domain/DocumentRepository.hpp"
#include <filesystem>
#include <string>

namespace clara::infrastructure {

/**
 * @class FileRepository
 * @brief Reads LaTeX sources relative to a project root.
 */
class FileRepository : public domain::DocumentRepository {
public:
    /**
     * @brief Constructor for FileRepository.
     * @param rootPath Directory that relative document paths are resolved against.
     */
    explicit FileRepository(std::filesystem::path rootPath = ".");

    /** @brief Reads the whole file. @see domain::DocumentRepository::load */
    std::optional<domain::Document> load(const std::string& path) const override;

    /** @brief Root-relative paths become root/path; "." leaves them untouched. */
    std::string locate(const std::string& path) const override;

private:
    std::filesystem::path m_rootPath; ///< Project root.
};

} // namespace clara::infrastructure
