/**
 * @file DocumentRepository.hpp
 * @brief Interface for reading documents under review.
 */

#pragma once
#include <optional>
#include <string>
#include "domain/Document.hpp"

namespace clara::domain {

/**
 * @class DocumentRepository
 * @brief Abstract storage of documents.
 */
class DocumentRepository {
public:
    virtual ~DocumentRepository() = default;

    /**
     * @brief Reads a document.
     * @param path Path as used for cache keys and issue reporting.
     * @return The document, or nullopt when it cannot be read.
     */
    virtual std::optional<Document> load(const std::string& path) const = 0;

    /** @brief Location handed to external tools for a document path. */
    virtual std::string locate(const std::string& path) const = 0;
};

} // namespace clara::domain
