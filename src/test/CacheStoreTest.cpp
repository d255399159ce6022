#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "infrastructure/CacheStore.hpp"

using namespace clara;
using infrastructure::CacheStore;
namespace fs = std::filesystem;

namespace {

const std::string kTestRoot = "test_cache_store_root";

void WriteFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

domain::CacheSnapshot SampleSnapshot() {
    domain::IssueRecord lint;
    lint.tool = "chktex";
    lint.type = "latex_lint";
    lint.col = 4;
    lint.severity = domain::Severity::Warning;
    lint.message = "Intersentence spacing";
    lint.code = "chktex:13";

    domain::IssueRecord clarity;
    clarity.tool = "llm";
    clarity.type = "clarity";
    clarity.severity = domain::Severity::Note;
    clarity.message = "Sentence is long";
    clarity.suggestion = "Split after the comma.";
    clarity.adjudication = domain::Adjudication{false, std::nullopt, std::string("keep")};

    domain::DocumentSnapshot doc;
    doc.fileHash = "0123456789abcdef0123456789abcdef";
    doc.lineCount = 2;
    doc.lines[1] = domain::LineRecord{1, "aaaaaaaaaaaaaaaa", {lint}};
    doc.lines[2] = domain::LineRecord{2, "", {}};
    doc.segments["bbbbbbbbbbbbbbbb"] = domain::SegmentRecord{"bbbbbbbbbbbbbbbb", 1, {clarity}};

    domain::IssueRecord layout;
    layout.tool = "latexindent";
    layout.type = "formatting";
    layout.severity = domain::Severity::Warning;
    layout.message = "File is not formatted correctly.";
    doc.fileIssues.push_back(layout);

    domain::CacheSnapshot snapshot;
    snapshot.files["chapters/intro.tex"] = doc;
    return snapshot;
}

void TestMissingFileMeansNoCache() {
    CacheStore store(fs::path(kTestRoot) / "absent.json");
    assert(!store.load().has_value());
}

void TestRoundTrip() {
    CacheStore store(fs::path(kTestRoot) / "out" / "nested" / ".review_cache.json");
    auto snapshot = SampleSnapshot();
    assert(store.save(snapshot));
    assert(!snapshot.timestamp.empty());
    assert(snapshot.timestamp.back() == 'Z');

    auto loaded = store.load();
    assert(loaded.has_value());
    assert(loaded->version == "1.1");
    assert(loaded->timestamp == snapshot.timestamp);

    const auto* doc = loaded->find("chapters/intro.tex");
    assert(doc != nullptr);
    const auto& original = snapshot.files.at("chapters/intro.tex");
    assert(doc->fileHash == original.fileHash);
    assert(doc->lineCount == 2);
    assert(doc->lines.at(1).issues == original.lines.at(1).issues);
    assert(doc->lines.at(2).contentHash.empty());
    assert(doc->segments.at("bbbbbbbbbbbbbbbb").startLine == 1);
    assert(doc->segments.at("bbbbbbbbbbbbbbbb").issues == original.segments.at("bbbbbbbbbbbbbbbb").issues);
    assert(doc->fileIssues == original.fileIssues);

    // Only the cache file remains; the temporary sibling was renamed.
    size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(store.getPath().parent_path())) {
        (void)entry;
        ++entries;
    }
    assert(entries == 1);
}

void TestOutdatedVersionIsIgnored() {
    fs::path path = fs::path(kTestRoot) / "old.json";
    WriteFile(path, R"({"version": "0.9", "timestamp": "x", "files": {}})");

    std::ostringstream errors;
    std::ostringstream output;
    auto* previousErr = std::cerr.rdbuf(errors.rdbuf());
    auto* previousOut = std::cout.rdbuf(output.rdbuf());
    const bool loaded = CacheStore(path).load().has_value();
    std::cout.rdbuf(previousOut);
    std::cerr.rdbuf(previousErr);

    assert(!loaded);
    assert(errors.str().find("does not match") != std::string::npos);
    assert(output.str().empty());

    WriteFile(path, R"({"timestamp": "x", "files": {}})");
    assert(!CacheStore(path).load().has_value());
}

void TestCorruptFilesAreIgnored() {
    fs::path path = fs::path(kTestRoot) / "corrupt.json";
    WriteFile(path, R"({"version": "1.1", "files": {"a.tex": {"file_hash": "ab)");
    assert(!CacheStore(path).load().has_value());

    WriteFile(path, R"([1, 2, 3])");
    assert(!CacheStore(path).load().has_value());

    WriteFile(path, R"({"version": "1.1", "files": {"a.tex": {"file_hash": "", "line_count": 1,
        "lines": {"first": {"content_hash": "x", "issues": []}}, "segments": {}}}})");
    assert(!CacheStore(path).load().has_value());

    WriteFile(path, R"({"version": "1.1", "files": {"a.tex": {"file_hash": "", "line_count": 1,
        "lines": {"1": {"content_hash": "x", "issues": [{"tool": "vale"}]}}, "segments": {}}}})");
    assert(!CacheStore(path).load().has_value());
}

void TestLenientIssueFields() {
    fs::path path = fs::path(kTestRoot) / "lenient.json";
    WriteFile(path, R"({"version": "1.1", "timestamp": "t", "files": {"a.tex": {"file_hash": "h", "line_count": 1,
        "lines": {"1": {"content_hash": "x", "issues": [
            {"tool": "vale", "type": "style", "severity": "suggestion", "message": "m", "code": null}
        ]}}, "segments": {}}}})");
    auto loaded = CacheStore(path).load();
    assert(loaded.has_value());
    const auto& issue = loaded->files.at("a.tex").lines.at(1).issues.at(0);
    assert(issue.col == 0);
    assert(issue.severity == domain::Severity::Note);
    assert(!issue.code.has_value());
}

} // namespace

int main() {
    std::cout << "[Test] Starting CacheStore Test..." << std::endl;
    fs::remove_all(kTestRoot);
    fs::create_directories(kTestRoot);

    TestMissingFileMeansNoCache();
    TestRoundTrip();
    TestOutdatedVersionIsIgnored();
    TestCorruptFilesAreIgnored();
    TestLenientIssueFields();

    fs::remove_all(kTestRoot);
    std::cout << "[PASS] CacheStore Test." << std::endl;
    return 0;
}
