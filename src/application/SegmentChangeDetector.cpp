/**
 * @file SegmentChangeDetector.cpp
 * @brief Implementation of SegmentChangeDetector.
 */

#include "application/SegmentChangeDetector.hpp"
#include "infrastructure/ContentHasher.hpp"

namespace clara::application {

std::vector<SegmentClassification> SegmentChangeDetector::Classify(const std::vector<domain::Segment>& segments,
                                                                   const domain::DocumentSnapshot* previous) {
    std::vector<SegmentClassification> result;
    result.reserve(segments.size());
    for (const auto& segment : segments) {
        SegmentClassification c;
        c.segment = segment;
        c.segmentHash = infrastructure::ContentHasher::HashSegment(segment.text);
        c.cached = previous != nullptr && previous->segments.count(c.segmentHash) > 0;
        result.push_back(std::move(c));
    }
    return result;
}

} // namespace clara::application
