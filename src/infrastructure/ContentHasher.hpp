/**
 * @file ContentHasher.hpp
 * @brief Stable content digests used for change detection.
 */

#pragma once
#include <string>

namespace clara::infrastructure {

/**
 * @class ContentHasher
 * @brief SHA-256 based fingerprints, hex encoded and truncated.
 *
 * Digests are a change-detection aid, not a security boundary; the short
 * prefixes are collision-safe enough for the line count of one document.
 */
class ContentHasher {
public:
    /** @brief Digest of a line with surrounding whitespace trimmed (16 hex chars). */
    static std::string HashLine(const std::string& line);

    /** @brief Digest of the raw, untrimmed document content (32 hex chars). */
    static std::string HashDocument(const std::string& content);

    /** @brief Digest of the exact segment text, whitespace-sensitive (16 hex chars). */
    static std::string HashSegment(const std::string& text);

    /** @brief Full lowercase hex SHA-256 of the input. */
    static std::string Sha256Hex(const std::string& data);

private:
    static std::string Trim(const std::string& text);
};

} // namespace clara::infrastructure
