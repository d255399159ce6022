/**
 * @file ReviewCache.hpp
 * @brief Value types of the incremental review cache.
 *
 * A CacheSnapshot is the complete state persisted at the end of a run. Each
 * DocumentSnapshot records the digest of every line and of every LLM review
 * segment together with the findings they produced, so the next run can skip
 * content that has not changed.
 */

#pragma once
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "domain/Issue.hpp"

namespace clara::domain {

/** @brief Persisted format version. Any mismatch on load means "no cache". */
inline constexpr const char* kCacheFormatVersion = "1.1";

struct LineRecord {
    int lineNumber = 0;
    std::string contentHash; ///< Empty when the line must be re-checked next run.
    std::vector<IssueRecord> issues;
};

struct SegmentRecord {
    std::string segmentHash;
    int startLine = 0;
    std::vector<IssueRecord> issues;
};

struct DocumentSnapshot {
    std::string fileHash; ///< Empty disables the whole-file fast path.
    int lineCount = 0;
    std::map<int, LineRecord> lines;
    std::map<std::string, SegmentRecord> segments;
    std::vector<IssueRecord> fileIssues; ///< Whole-file findings (line 0), e.g. formatting.
};

struct CacheSnapshot {
    std::string version = kCacheFormatVersion;
    std::string timestamp;
    std::map<std::string, DocumentSnapshot> files;

    const DocumentSnapshot* find(const std::string& path) const {
        auto it = files.find(path);
        return it != files.end() ? &it->second : nullptr;
    }
};

enum class LineStatus {
    Unchanged,
    New
};

/**
 * @struct LineClassification
 * @brief Per-run verdict for one current line.
 */
struct LineClassification {
    int currentLine = 0;
    std::optional<int> previousLine; ///< Set iff status is Unchanged.
    LineStatus status = LineStatus::New;
    std::string contentHash;
};

/**
 * @struct LineChangeSet
 * @brief Result of comparing current lines with a previous DocumentSnapshot.
 */
struct LineChangeSet {
    std::vector<LineClassification> classifications;
    std::set<int> deleted; ///< Previous line numbers nobody claimed.

    std::set<int> linesNeedingCheck() const {
        std::set<int> result;
        for (const auto& c : classifications) {
            if (c.status == LineStatus::New) result.insert(c.currentLine);
        }
        return result;
    }
};

} // namespace clara::domain
