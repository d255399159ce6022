/**
 * @file LineChangeDetector.hpp
 * @brief Line-level change detection against a previous DocumentSnapshot.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/ReviewCache.hpp"

namespace clara::application {

/**
 * @class LineChangeDetector
 * @brief Classifies current lines as unchanged or new by trimmed-content digest.
 *
 * Matching is a greedy multiset pairing, not a sequence alignment: each current
 * line claims the lowest unclaimed previous line with the same digest. It runs
 * in O(n) and may pair the "wrong" instance among identical duplicates, which
 * is harmless because paired lines are content-identical. It never labels
 * differing content as unchanged.
 */
class LineChangeDetector {
public:
    /**
     * @param currentLines Lines of the document as it is now (index 0 is line 1).
     * @param previous Cached state of the same document, or nullptr when absent.
     */
    static domain::LineChangeSet Detect(const std::vector<std::string>& currentLines,
                                        const domain::DocumentSnapshot* previous);
};

} // namespace clara::application
