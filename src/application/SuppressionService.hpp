/**
 * @file SuppressionService.hpp
 * @brief In-source suppression directives ("% clara: ignore-...").
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/DocumentRepository.hpp"
#include "domain/Issue.hpp"

namespace clara::application {

struct SuppressionRange {
    int start = 0; ///< First suppressed line, inclusive.
    int end = 0;   ///< Last suppressed line, inclusive.
    std::string rule;
};

struct FileSuppressions {
    bool ignoreFile = false;
    std::vector<SuppressionRange> ranges;
};

/**
 * @class SuppressionService
 * @brief Marks issues covered by ignore-next-line, ignore-start/ignore-end blocks
 *        or ignore-file directives written in LaTeX comments.
 */
class SuppressionService {
public:
    explicit SuppressionService(std::shared_ptr<domain::DocumentRepository> repository);

    /**
     * @brief Sets suppressed/suppressionRule on matching issues.
     * @return The issues that remain active.
     */
    std::vector<domain::Issue> apply(std::vector<domain::Issue>& issues) const;

    /** @brief Collects directives; an unterminated block runs to the last line. */
    static FileSuppressions Scan(const std::vector<std::string>& lines);

    /** @brief Lower-cased directive found in the line's comment, if any. */
    static std::optional<std::string> ParseDirective(const std::string& line);

private:
    std::shared_ptr<domain::DocumentRepository> m_repository;
};

} // namespace clara::application
