/**
 * @file IncrementalMerger.cpp
 * @brief Implementation of IncrementalMerger.
 */

#include "application/IncrementalMerger.hpp"
#include "application/LineChangeDetector.hpp"
#include "infrastructure/ContentHasher.hpp"
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace clara::application {

using infrastructure::ContentHasher;

IncrementalMerger::IncrementalMerger(std::optional<domain::CacheSnapshot> previous)
    : m_previous(std::move(previous)) {}

void IncrementalMerger::analyze(const domain::Document& document, const std::vector<domain::Segment>& segments) {
    DocumentPlan plan;
    plan.fileHash = ContentHasher::HashDocument(document.getContent());
    plan.previous = m_previous ? m_previous->find(document.getPath()) : nullptr;
    plan.lineCount = document.lineCount();

    // Fast path before any line-level work.
    if (plan.previous != nullptr && !plan.previous->fileHash.empty() &&
        plan.previous->fileHash == plan.fileHash) {
        plan.unchanged = true;
    } else {
        plan.lineChanges = LineChangeDetector::Detect(document.getLines(), plan.previous);
    }

    plan.segments = SegmentChangeDetector::Classify(segments, plan.previous);
    m_plans[document.getPath()] = std::move(plan);
}

bool IncrementalMerger::isAnalyzed(const std::string& path) const {
    return m_plans.count(path) > 0;
}

const IncrementalMerger::DocumentPlan& IncrementalMerger::planFor(const std::string& path) const {
    auto it = m_plans.find(path);
    if (it == m_plans.end()) {
        throw std::invalid_argument("document was not analyzed: " + path);
    }
    return it->second;
}

bool IncrementalMerger::isUnchanged(const std::string& path) const {
    return planFor(path).unchanged;
}

std::set<int> IncrementalMerger::needsCheck(const std::string& path) const {
    const auto& plan = planFor(path);
    if (plan.unchanged) return {};
    return plan.lineChanges.linesNeedingCheck();
}

std::vector<domain::Segment> IncrementalMerger::needsReview(const std::string& path) const {
    std::vector<domain::Segment> result;
    std::unordered_set<std::string> seen;
    for (const auto& c : planFor(path).segments) {
        if (c.cached) continue;
        if (seen.insert(c.segmentHash).second) {
            result.push_back(c.segment);
        }
    }
    return result;
}

size_t IncrementalMerger::segmentCount(const std::string& path) const {
    return planFor(path).segments.size();
}

MergeResult IncrementalMerger::mergeAndSnapshot(const std::string& path,
                                                const std::vector<domain::Issue>& freshLineIssues,
                                                const std::vector<SegmentFindings>& freshSegments,
                                                bool lineChecksComplete) {
    const auto& plan = planFor(path);

    MergeResult result;
    result.snapshot.lineCount = plan.lineCount;
    mergeLines(path, plan, freshLineIssues, lineChecksComplete, result);
    mergeSegments(path, plan, freshSegments, result);

    m_next[path] = result.snapshot;
    return result;
}

void IncrementalMerger::mergeLines(const std::string& path, const DocumentPlan& plan,
                                   const std::vector<domain::Issue>& freshLineIssues,
                                   bool lineChecksComplete, MergeResult& result) const {
    auto& snapshot = result.snapshot;

    if (plan.unchanged) {
        snapshot.fileHash = plan.fileHash;
        snapshot.lines = plan.previous->lines;
        snapshot.fileIssues = plan.previous->fileIssues;
        for (const auto& cached : plan.previous->fileIssues) {
            result.issues.push_back(cached.attach(path, 0));
            ++result.cachedIssueCount;
        }
        for (const auto& [lineNo, record] : plan.previous->lines) {
            for (const auto& cached : record.issues) {
                result.issues.push_back(cached.attach(path, lineNo));
                ++result.cachedIssueCount;
            }
        }
        return;
    }

    std::set<int> requested = plan.lineChanges.linesNeedingCheck();
    std::map<int, std::vector<const domain::Issue*>> freshByLine;
    for (const auto& issue : freshLineIssues) {
        if (issue.file == path && requested.count(issue.line) > 0) {
            freshByLine[issue.line].push_back(&issue);
        }
    }

    // Whole-file findings are replaced when the document was checked, carried otherwise.
    if (!requested.empty()) {
        for (const auto& issue : freshLineIssues) {
            if (issue.file == path && issue.line == 0) {
                snapshot.fileIssues.push_back(issue.toRecord());
                result.issues.push_back(issue);
                ++result.freshIssueCount;
            }
        }
    } else if (plan.previous != nullptr) {
        snapshot.fileIssues = plan.previous->fileIssues;
        for (const auto& cached : plan.previous->fileIssues) {
            result.issues.push_back(cached.attach(path, 0));
            ++result.cachedIssueCount;
        }
    }

    snapshot.fileHash = lineChecksComplete ? plan.fileHash : std::string();

    for (const auto& c : plan.lineChanges.classifications) {
        domain::LineRecord record;
        record.lineNumber = c.currentLine;
        record.contentHash = c.contentHash;

        if (c.status == domain::LineStatus::Unchanged) {
            const auto& previous = plan.previous->lines.at(*c.previousLine);
            for (const auto& cached : previous.issues) {
                record.issues.push_back(cached);
                result.issues.push_back(cached.attach(path, c.currentLine));
                ++result.cachedIssueCount;
            }
        } else {
            auto fresh = freshByLine.find(c.currentLine);
            if (fresh != freshByLine.end()) {
                for (const auto* issue : fresh->second) {
                    record.issues.push_back(issue->toRecord());
                    result.issues.push_back(*issue);
                    ++result.freshIssueCount;
                }
            }
            if (!lineChecksComplete) {
                record.contentHash.clear();
            }
        }
        snapshot.lines[c.currentLine] = std::move(record);
    }
}

void IncrementalMerger::mergeSegments(const std::string& path, const DocumentPlan& plan,
                                      const std::vector<SegmentFindings>& freshSegments,
                                      MergeResult& result) const {
    std::unordered_map<std::string, const SegmentFindings*> reviewed;
    for (const auto& findings : freshSegments) {
        reviewed.emplace(ContentHasher::HashSegment(findings.segment.text), &findings);
    }

    auto& snapshot = result.snapshot;
    for (const auto& c : plan.segments) {
        const int startLine = c.segment.startLine;
        domain::SegmentRecord record;
        record.segmentHash = c.segmentHash;
        record.startLine = startLine;

        if (c.cached) {
            const auto& previous = plan.previous->segments.at(c.segmentHash);
            record.issues = previous.issues;
            for (const auto& cached : previous.issues) {
                result.issues.push_back(cached.attach(path, startLine));
                ++result.cachedIssueCount;
            }
        } else {
            auto it = reviewed.find(c.segmentHash);
            if (it == reviewed.end()) {
                continue; // Not reviewed this run, stays uncached.
            }
            for (const auto& issue : it->second->issues) {
                domain::IssueRecord stored = issue.toRecord();
                result.issues.push_back(stored.attach(path, startLine));
                record.issues.push_back(std::move(stored));
                ++result.freshIssueCount;
            }
        }
        snapshot.segments.emplace(c.segmentHash, std::move(record));
    }
}

domain::CacheSnapshot IncrementalMerger::buildSnapshot() const {
    domain::CacheSnapshot snapshot;
    snapshot.files = m_next;
    return snapshot;
}

} // namespace clara::application
