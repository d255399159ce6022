/**
 * @file AtomicFileWriter.hpp
 * @brief Whole-file writes that never leave a half-written target behind.
 */

#pragma once
#include <filesystem>
#include <string>

namespace clara::infrastructure {

/**
 * @class AtomicFileWriter
 * @brief Writes to a sibling temp file and renames it over the target.
 *
 * A reader of the target sees either the previous content or the new content.
 */
class AtomicFileWriter {
public:
    /**
     * @brief Replaces the file content.
     * @param target Destination path; missing parent directories are created.
     * @param content Bytes to write.
     * @return false if any step failed (the target is then untouched).
     */
    static bool Write(const std::filesystem::path& target, const std::string& content);
};

} // namespace clara::infrastructure
