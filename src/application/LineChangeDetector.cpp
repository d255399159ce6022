/**
 * @file LineChangeDetector.cpp
 * @brief Implementation of LineChangeDetector.
 */

#include "application/LineChangeDetector.hpp"
#include "infrastructure/ContentHasher.hpp"
#include <unordered_map>
#include <unordered_set>

namespace clara::application {

using infrastructure::ContentHasher;

namespace {

struct Candidates {
    std::vector<int> lines; ///< Ascending previous line numbers.
    size_t next = 0;        ///< Index of the first unclaimed entry.
};

} // namespace

domain::LineChangeSet LineChangeDetector::Detect(const std::vector<std::string>& currentLines,
                                                 const domain::DocumentSnapshot* previous) {
    domain::LineChangeSet result;
    result.classifications.reserve(currentLines.size());

    if (previous == nullptr) {
        for (size_t i = 0; i < currentLines.size(); ++i) {
            domain::LineClassification c;
            c.currentLine = static_cast<int>(i) + 1;
            c.status = domain::LineStatus::New;
            c.contentHash = ContentHasher::HashLine(currentLines[i]);
            result.classifications.push_back(std::move(c));
        }
        return result;
    }

    // std::map iterates in ascending line order, so each list is sorted.
    // Records with an empty digest were invalidated and never match.
    std::unordered_map<std::string, Candidates> byHash;
    for (const auto& [lineNo, record] : previous->lines) {
        if (record.contentHash.empty()) continue;
        byHash[record.contentHash].lines.push_back(lineNo);
    }

    std::unordered_set<int> claimed;

    for (size_t i = 0; i < currentLines.size(); ++i) {
        domain::LineClassification c;
        c.currentLine = static_cast<int>(i) + 1;
        c.contentHash = ContentHasher::HashLine(currentLines[i]);

        auto it = byHash.find(c.contentHash);
        if (it != byHash.end() && it->second.next < it->second.lines.size()) {
            int matched = it->second.lines[it->second.next++];
            claimed.insert(matched);
            c.previousLine = matched;
            c.status = domain::LineStatus::Unchanged;
        } else {
            c.status = domain::LineStatus::New;
        }
        result.classifications.push_back(std::move(c));
    }

    for (const auto& entry : previous->lines) {
        if (claimed.count(entry.first) == 0) {
            result.deleted.insert(entry.first);
        }
    }
    return result;
}

} // namespace clara::application
