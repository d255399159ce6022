#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "application/LineChangeDetector.hpp"
#include "infrastructure/ContentHasher.hpp"

using namespace clara;
using application::LineChangeDetector;
using infrastructure::ContentHasher;

namespace {

domain::DocumentSnapshot SnapshotOf(const std::vector<std::string>& lines) {
    domain::DocumentSnapshot doc;
    doc.lineCount = static_cast<int>(lines.size());
    for (size_t i = 0; i < lines.size(); ++i) {
        domain::LineRecord record;
        record.lineNumber = static_cast<int>(i) + 1;
        record.contentHash = ContentHasher::HashLine(lines[i]);
        doc.lines[record.lineNumber] = record;
    }
    return doc;
}

void TestWithoutPrevious() {
    auto changes = LineChangeDetector::Detect({"a", "b"}, nullptr);
    assert(changes.classifications.size() == 2);
    assert(changes.linesNeedingCheck() == (std::set<int>{1, 2}));
    assert(changes.deleted.empty());
}

void TestInsertAtTop() {
    auto previous = SnapshotOf({"Hello.", "World."});
    auto changes = LineChangeDetector::Detect({"Intro.", "Hello.", "World."}, &previous);

    assert(changes.linesNeedingCheck() == std::set<int>{1});
    assert(changes.classifications[1].status == domain::LineStatus::Unchanged);
    assert(*changes.classifications[1].previousLine == 1);
    assert(*changes.classifications[2].previousLine == 2);
    assert(changes.deleted.empty());
}

void TestDeletion() {
    auto previous = SnapshotOf({"one", "two", "three"});
    auto changes = LineChangeDetector::Detect({"one", "three"}, &previous);

    assert(changes.linesNeedingCheck().empty());
    assert(changes.deleted == std::set<int>{2});
    assert(*changes.classifications[1].previousLine == 3);
}

void TestDuplicates() {
    auto previous = SnapshotOf({"x", "y", "x"});
    auto changes = LineChangeDetector::Detect({"x", "x", "x"}, &previous);

    // Each previous line is claimed at most once, lowest number first.
    assert(*changes.classifications[0].previousLine == 1);
    assert(*changes.classifications[1].previousLine == 3);
    assert(changes.classifications[2].status == domain::LineStatus::New);
    assert(changes.deleted == std::set<int>{2});
}

void TestInvalidatedLinesNeverMatch() {
    auto previous = SnapshotOf({"alpha", "beta"});
    previous.lines[2].contentHash.clear();
    auto changes = LineChangeDetector::Detect({"alpha", "beta"}, &previous);

    assert(changes.linesNeedingCheck() == std::set<int>{2});
    assert(changes.deleted == std::set<int>{2});
}

void TestWhitespaceOnlyEdit() {
    auto previous = SnapshotOf({"  indented"});
    auto changes = LineChangeDetector::Detect({"indented  "}, &previous);
    assert(changes.linesNeedingCheck().empty());
}

} // namespace

int main() {
    std::cout << "[Test] Starting LineChangeDetector Test..." << std::endl;

    TestWithoutPrevious();
    TestInsertAtTop();
    TestDeletion();
    TestDuplicates();
    TestInvalidatedLinesNeverMatch();
    TestWhitespaceOnlyEdit();

    std::cout << "[PASS] LineChangeDetector Test." << std::endl;
    return 0;
}
