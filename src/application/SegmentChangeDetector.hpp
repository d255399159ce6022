/**
 * @file SegmentChangeDetector.hpp
 * @brief Content-addressed change detection for LLM review segments.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/Document.hpp"
#include "domain/ReviewCache.hpp"

namespace clara::application {

struct SegmentClassification {
    domain::Segment segment;
    std::string segmentHash;
    bool cached = false; ///< Exact text was reviewed in the previous run.
};

/**
 * @class SegmentChangeDetector
 * @brief A segment is cached iff its exact-text digest is a key of the previous
 *        segment map. Position plays no role.
 */
class SegmentChangeDetector {
public:
    static std::vector<SegmentClassification> Classify(const std::vector<domain::Segment>& segments,
                                                       const domain::DocumentSnapshot* previous);
};

} // namespace clara::application
