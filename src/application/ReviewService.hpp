/**
 * @file ReviewService.hpp
 * @brief Orchestrates one review run: cache load, checks, LLM review, merge, cache save.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "domain/DocumentRepository.hpp"
#include "domain/Issue.hpp"
#include "domain/ReviewTools.hpp"
#include "infrastructure/CacheStore.hpp"

namespace clara::application {

struct ReviewOptions {
    bool useCache = true;  ///< Start from the persisted snapshot when there is one.
    bool saveCache = true; ///< Replace the persisted snapshot at the end of the run.
    bool runLlm = true;    ///< Review fresh segments with the LLM reviewer.
};

struct ReviewOutcome {
    std::vector<domain::Issue> issues; ///< Cached and fresh findings plus tool failures.
    size_t documentCount = 0;          ///< Documents that could be read.
    size_t segmentCount = 0;
    size_t reviewedSegmentCount = 0;
    bool cacheSaved = false;
};

/**
 * @class ReviewService
 * @brief Runs the line checkers on changed lines only and the reviewer on unseen
 *        segments only, then carries every other finding over from the cache.
 *
 * Failed tools are reported as tool_failure issues and their work is left
 * unrecorded so the next run repeats it. Unreadable documents are skipped.
 */
class ReviewService {
public:
    ReviewService(std::shared_ptr<domain::DocumentRepository> repository,
                  std::vector<std::shared_ptr<domain::LineChecker>> checkers,
                  std::shared_ptr<domain::SegmentSource> segmentSource,
                  std::shared_ptr<domain::SegmentReviewer> reviewer,
                  std::unique_ptr<infrastructure::CacheStore> cacheStore);

    ReviewOutcome run(const std::vector<std::string>& files, const ReviewOptions& options);

private:
    std::vector<domain::Issue> runCheckers(const std::vector<std::string>& files,
                                           std::vector<domain::Issue>& failures,
                                           bool& complete);
    std::string toDocumentPath(const std::string& reported,
                               const std::vector<std::string>& files) const;

    std::shared_ptr<domain::DocumentRepository> m_repository;
    std::vector<std::shared_ptr<domain::LineChecker>> m_checkers;
    std::shared_ptr<domain::SegmentSource> m_segmentSource;
    std::shared_ptr<domain::SegmentReviewer> m_reviewer;
    std::unique_ptr<infrastructure::CacheStore> m_cacheStore;
};

} // namespace clara::application
