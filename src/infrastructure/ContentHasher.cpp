/**
 * @file ContentHasher.cpp
 * @brief Implementation of ContentHasher.
 */

#include "infrastructure/ContentHasher.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace clara::infrastructure {

namespace {
constexpr size_t kLineDigestLength = 16;
constexpr size_t kDocumentDigestLength = 32;
constexpr size_t kSegmentDigestLength = 16;
}

std::string ContentHasher::Sha256Hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digestLength, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    static const char* kHex = "0123456789abcdef";
    std::string hex;
    hex.reserve(digestLength * 2);
    for (unsigned int i = 0; i < digestLength; ++i) {
        hex.push_back(kHex[digest[i] >> 4]);
        hex.push_back(kHex[digest[i] & 0x0f]);
    }
    return hex;
}

std::string ContentHasher::Trim(const std::string& text) {
    const char* whitespace = " \t\r\n\v\f";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

std::string ContentHasher::HashLine(const std::string& line) {
    return Sha256Hex(Trim(line)).substr(0, kLineDigestLength);
}

std::string ContentHasher::HashDocument(const std::string& content) {
    return Sha256Hex(content).substr(0, kDocumentDigestLength);
}

std::string ContentHasher::HashSegment(const std::string& text) {
    return Sha256Hex(text).substr(0, kSegmentDigestLength);
}

} // namespace clara::infrastructure
