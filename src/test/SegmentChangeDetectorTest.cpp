#include <cassert>
#include <iostream>

#include "application/IncrementalMerger.hpp"
#include "application/SegmentChangeDetector.hpp"
#include "infrastructure/ContentHasher.hpp"

using namespace clara;
using application::SegmentChangeDetector;
using infrastructure::ContentHasher;

namespace {

domain::DocumentSnapshot SnapshotWithSegment(const std::string& text, int startLine) {
    domain::DocumentSnapshot doc;
    domain::SegmentRecord record;
    record.segmentHash = ContentHasher::HashSegment(text);
    record.startLine = startLine;
    domain::IssueRecord issue;
    issue.tool = "llm";
    issue.type = "clarity";
    issue.message = "Split this sentence.";
    record.issues.push_back(issue);
    doc.segments[record.segmentHash] = record;
    return doc;
}

void TestExactTextIsCached() {
    auto previous = SnapshotWithSegment("The method works. It is fast.", 3);
    auto result = SegmentChangeDetector::Classify(
        {{"The method works. It is fast.", "a.tex", 3},
         {"The method works. It is fast!", "a.tex", 3}},
        &previous);

    assert(result.size() == 2);
    assert(result[0].cached);
    assert(!result[1].cached);
    assert(result[0].segmentHash == ContentHasher::HashSegment("The method works. It is fast."));
}

void TestNoPreviousMeansFresh() {
    auto result = SegmentChangeDetector::Classify({{"Text.", "a.tex", 1}}, nullptr);
    assert(result.size() == 1 && !result[0].cached);
}

void TestCachedIssuesFollowTheSegment() {
    domain::CacheSnapshot previous;
    previous.files["a.tex"] = SnapshotWithSegment("Stable paragraph.", 3);
    // The document grew at the top; the segment now starts at line 10.
    previous.files["a.tex"].fileHash = "stale";

    application::IncrementalMerger merger(previous);
    domain::Document doc("a.tex", "x\n");
    merger.analyze(doc, {{"Stable paragraph.", "a.tex", 10}});
    assert(merger.needsReview("a.tex").empty());

    auto merged = merger.mergeAndSnapshot("a.tex", {}, {});
    assert(merged.issues.size() == 1);
    assert(merged.issues[0].line == 10);
    assert(merged.issues[0].file == "a.tex");
    assert(merged.snapshot.segments.begin()->second.startLine == 10);
}

} // namespace

int main() {
    std::cout << "[Test] Starting SegmentChangeDetector Test..." << std::endl;

    TestExactTextIsCached();
    TestNoPreviousMeansFresh();
    TestCachedIssuesFollowTheSegment();

    std::cout << "[PASS] SegmentChangeDetector Test." << std::endl;
    return 0;
}
