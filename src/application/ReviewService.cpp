/**
 * @file ReviewService.cpp
 * @brief Implementation of ReviewService.
 */

#include "application/ReviewService.hpp"
#include "application/IncrementalMerger.hpp"
#include <filesystem>
#include <iostream>
#include <map>
#include <set>

namespace fs = std::filesystem;

namespace clara::application {

ReviewService::ReviewService(std::shared_ptr<domain::DocumentRepository> repository,
                             std::vector<std::shared_ptr<domain::LineChecker>> checkers,
                             std::shared_ptr<domain::SegmentSource> segmentSource,
                             std::shared_ptr<domain::SegmentReviewer> reviewer,
                             std::unique_ptr<infrastructure::CacheStore> cacheStore)
    : m_repository(std::move(repository)), m_checkers(std::move(checkers)),
      m_segmentSource(std::move(segmentSource)), m_reviewer(std::move(reviewer)),
      m_cacheStore(std::move(cacheStore)) {}

std::string ReviewService::toDocumentPath(const std::string& reported,
                                          const std::vector<std::string>& files) const {
    for (const auto& file : files) {
        if (reported == file || reported == m_repository->locate(file)) return file;
    }
    std::error_code ec;
    const fs::path canonical = fs::weakly_canonical(reported, ec);
    if (ec) return reported;
    for (const auto& file : files) {
        std::error_code fileEc;
        if (fs::weakly_canonical(m_repository->locate(file), fileEc) == canonical && !fileEc) return file;
    }
    return reported;
}

std::vector<domain::Issue> ReviewService::runCheckers(const std::vector<std::string>& files,
                                                      std::vector<domain::Issue>& failures,
                                                      bool& complete) {
    std::vector<domain::Issue> issues;
    complete = true;
    if (files.empty()) return issues;

    std::vector<std::string> located;
    located.reserve(files.size());
    for (const auto& file : files) {
        located.push_back(m_repository->locate(file));
    }

    for (const auto& checker : m_checkers) {
        domain::ToolRun run;
        try {
            run = checker->check(located);
        } catch (const std::exception& e) {
            run.tool = checker->name();
            run.failure = e.what();
        }
        if (run.tool.empty()) run.tool = checker->name();

        for (auto& issue : run.issues) {
            issue.file = toDocumentPath(issue.file, files);
            issues.push_back(std::move(issue));
        }
        if (!run.succeeded()) {
            std::cerr << "[ReviewService] " << run.tool << " failed: " << *run.failure << std::endl;
            failures.push_back(domain::Issue::ToolFailure(run.tool, *run.failure));
            complete = false;
        }
    }
    return issues;
}

ReviewOutcome ReviewService::run(const std::vector<std::string>& files, const ReviewOptions& options) {
    ReviewOutcome outcome;

    std::optional<domain::CacheSnapshot> previous;
    if (options.useCache && m_cacheStore) {
        previous = m_cacheStore->load();
        if (previous) {
            std::cout << "[cache] Loaded cache with " << previous->files.size() << " file(s)" << std::endl;
        }
    }
    const bool incremental = previous.has_value();
    IncrementalMerger merger(std::move(previous));

    // Phase 1: classify every readable document against the previous run.
    std::vector<std::string> documents;
    for (const auto& file : files) {
        if (merger.isAnalyzed(file)) continue;
        auto document = m_repository->load(file);
        if (!document) {
            std::cerr << "[ReviewService] Skipping unreadable document: " << file << std::endl;
            continue;
        }
        std::vector<domain::Segment> segments;
        if (m_segmentSource) {
            segments = m_segmentSource->extract(*document);
        }
        merger.analyze(*document, segments);
        documents.push_back(file);
        outcome.segmentCount += merger.segmentCount(file);
    }
    outcome.documentCount = documents.size();

    // Phase 2: line checks for documents with lines due for checking.
    std::vector<std::string> toCheck;
    for (const auto& path : documents) {
        if (!merger.needsCheck(path).empty()) toCheck.push_back(path);
    }
    if (incremental) {
        if (toCheck.empty()) {
            std::cout << "[cache] No changes detected, using cached results." << std::endl;
        } else {
            std::cout << "[cache] Checking " << toCheck.size() << " changed file(s)..." << std::endl;
        }
    }

    std::vector<domain::Issue> failures;
    bool lineChecksComplete = true;
    std::vector<domain::Issue> freshLineIssues = runCheckers(toCheck, failures, lineChecksComplete);

    // Phase 3: LLM review of segments never reviewed before.
    std::map<std::string, std::vector<SegmentFindings>> findings;
    if (options.runLlm && m_reviewer) {
        std::vector<domain::Segment> fresh;
        for (const auto& path : documents) {
            auto pending = merger.needsReview(path);
            fresh.insert(fresh.end(), pending.begin(), pending.end());
        }
        if (incremental) {
            if (fresh.empty()) {
                std::cout << "[cache] All " << outcome.segmentCount << " segment(s) cached, skipping LLM" << std::endl;
            } else {
                std::cout << "[cache] LLM reviewing " << fresh.size() << " of "
                          << outcome.segmentCount << " segment(s)" << std::endl;
            }
        }

        std::set<std::string> reportedFailures;
        for (const auto& segment : fresh) {
            domain::ToolRun run;
            try {
                run = m_reviewer->review(segment);
            } catch (const std::exception& e) {
                run.failure = e.what();
            }
            if (run.tool.empty()) run.tool = m_reviewer->name();

            if (run.succeeded()) {
                findings[segment.file].push_back(SegmentFindings{segment, std::move(run.issues)});
                ++outcome.reviewedSegmentCount;
            } else if (reportedFailures.insert(*run.failure).second) {
                std::cerr << "[ReviewService] " << run.tool << " failed: " << *run.failure << std::endl;
                failures.push_back(domain::Issue::ToolFailure(run.tool, *run.failure));
            }
        }
    }

    // Phase 4: merge cached and fresh findings per document.
    static const std::vector<SegmentFindings> kNoFindings;
    const std::set<std::string> checked(toCheck.begin(), toCheck.end());
    for (const auto& path : documents) {
        auto it = findings.find(path);
        const auto& segmentFindings = (it != findings.end()) ? it->second : kNoFindings;
        const bool complete = lineChecksComplete || checked.count(path) == 0;

        MergeResult merged = merger.mergeAndSnapshot(path, freshLineIssues, segmentFindings, complete);
        if (incremental) {
            if (merger.isUnchanged(path)) {
                std::cout << "[cache] " << path << ": unchanged, " << merged.cachedIssueCount
                          << " cached issues" << std::endl;
            } else {
                std::cout << "[cache] " << path << ": " << merged.freshIssueCount << " new, "
                          << merged.cachedIssueCount << " cached" << std::endl;
            }
        }
        outcome.issues.insert(outcome.issues.end(), merged.issues.begin(), merged.issues.end());
    }
    outcome.issues.insert(outcome.issues.end(), failures.begin(), failures.end());

    if (options.saveCache && m_cacheStore) {
        domain::CacheSnapshot snapshot = merger.buildSnapshot();
        outcome.cacheSaved = m_cacheStore->save(snapshot);
        if (outcome.cacheSaved) {
            std::cout << "[cache] Saved cache for " << snapshot.files.size() << " file(s), "
                      << outcome.segmentCount << " segment(s)" << std::endl;
        } else {
            std::cerr << "[cache] Failed to save cache to " << m_cacheStore->getPath() << std::endl;
        }
    }
    return outcome;
}

} // namespace clara::application
