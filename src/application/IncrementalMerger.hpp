/**
 * @file IncrementalMerger.hpp
 * @brief Combines cached and fresh findings per document and builds the next cache snapshot.
 */

#pragma once
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "application/SegmentChangeDetector.hpp"
#include "domain/Document.hpp"
#include "domain/Issue.hpp"
#include "domain/ReviewCache.hpp"

namespace clara::application {

/**
 * @struct SegmentFindings
 * @brief Issues produced by a successful review of one segment.
 */
struct SegmentFindings {
    domain::Segment segment;
    std::vector<domain::Issue> issues;
};

struct MergeResult {
    std::vector<domain::Issue> issues;
    domain::DocumentSnapshot snapshot;
    size_t cachedIssueCount = 0;
    size_t freshIssueCount = 0;
};

/**
 * @class IncrementalMerger
 * @brief Drives one run of the incremental cache.
 *
 * Usage per document: analyze(), then ask needsCheck()/needsReview() what to
 * run, then hand the fresh results to mergeAndSnapshot(). buildSnapshot()
 * collects every merged document into the replacement CacheSnapshot.
 */
class IncrementalMerger {
public:
    explicit IncrementalMerger(std::optional<domain::CacheSnapshot> previous);
    IncrementalMerger(const IncrementalMerger&) = delete;
    IncrementalMerger& operator=(const IncrementalMerger&) = delete;

    /**
     * @brief Classifies the document's lines and segments against the previous run.
     *
     * An identical whole-document digest short-circuits line detection.
     */
    void analyze(const domain::Document& document, const std::vector<domain::Segment>& segments);

    bool isAnalyzed(const std::string& path) const;

    /** @brief True when the whole document matches the previous run byte for byte. */
    bool isUnchanged(const std::string& path) const;

    /** @brief Line numbers (1-based, current) that need fresh line-oriented checks. */
    std::set<int> needsCheck(const std::string& path) const;

    /** @brief Segments whose exact text has not been reviewed before, one per distinct text. */
    std::vector<domain::Segment> needsReview(const std::string& path) const;

    /** @brief Number of segments analyzed for the document. */
    size_t segmentCount(const std::string& path) const;

    /**
     * @brief Merges carried-over and fresh issues and records the document's next snapshot.
     * @param freshLineIssues Output of the line checkers; entries for other files or
     *        for lines outside needsCheck() are dropped. Line 0 entries are whole-file
     *        findings and replace the cached ones whenever needsCheck() is non-empty.
     * @param freshSegments Successful reviews; segments absent here stay uncached.
     * @param lineChecksComplete false if a line checker failed for this document; the
     *        lines due for checking are then recorded so that the next run re-checks them.
     * @throws std::invalid_argument if the document was not analyzed.
     */
    MergeResult mergeAndSnapshot(const std::string& path,
                                 const std::vector<domain::Issue>& freshLineIssues,
                                 const std::vector<SegmentFindings>& freshSegments,
                                 bool lineChecksComplete = true);

    /** @brief Replacement snapshot holding every merged document, keyed by path. */
    domain::CacheSnapshot buildSnapshot() const;

    bool hasPrevious() const { return m_previous.has_value(); }

private:
    struct DocumentPlan {
        std::string fileHash;
        bool unchanged = false;
        const domain::DocumentSnapshot* previous = nullptr;
        int lineCount = 0;
        domain::LineChangeSet lineChanges;
        std::vector<SegmentClassification> segments;
    };

    const DocumentPlan& planFor(const std::string& path) const;
    void mergeLines(const std::string& path, const DocumentPlan& plan,
                    const std::vector<domain::Issue>& freshLineIssues,
                    bool lineChecksComplete, MergeResult& result) const;
    void mergeSegments(const std::string& path, const DocumentPlan& plan,
                       const std::vector<SegmentFindings>& freshSegments,
                       MergeResult& result) const;

    std::optional<domain::CacheSnapshot> m_previous;
    std::map<std::string, DocumentPlan> m_plans;
    std::map<std::string, domain::DocumentSnapshot> m_next;
};

} // namespace clara::application
