#include <algorithm>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>

#include "application/ReviewService.hpp"
#include "infrastructure/CacheStore.hpp"
#include "infrastructure/SegmentExtractor.hpp"

using namespace clara;
using application::ReviewOptions;
using application::ReviewOutcome;
using application::ReviewService;
namespace fs = std::filesystem;

namespace {

const std::string kTestRoot = "test_review_service_root";

class InMemoryRepository : public domain::DocumentRepository {
public:
    std::map<std::string, std::string> files;

    std::optional<domain::Document> load(const std::string& path) const override {
        auto it = files.find(path);
        if (it == files.end()) return std::nullopt;
        return domain::Document(path, it->second);
    }
    std::string locate(const std::string& path) const override { return path; }
};

// Flags every line containing "teh", like a spell checker would.
class TypoChecker : public domain::LineChecker {
public:
    explicit TypoChecker(std::shared_ptr<InMemoryRepository> repo) : m_repo(std::move(repo)) {}

    int calls = 0;
    bool offline = false;

    std::string name() const override { return "typo"; }

    domain::ToolRun check(const std::vector<std::string>& files) override {
        ++calls;
        domain::ToolRun run;
        if (offline) {
            run.failure = "typo checker offline";
            return run;
        }
        for (const auto& file : files) {
            auto doc = m_repo->load(file);
            if (!doc) continue;
            for (int i = 0; i < doc->lineCount(); ++i) {
                if (doc->getLines()[i].find("teh") == std::string::npos) continue;
                domain::Issue issue;
                issue.tool = "typo";
                issue.type = "typo";
                issue.file = file;
                issue.line = i + 1;
                issue.severity = domain::Severity::Warning;
                issue.message = "teh ==> the";
                run.issues.push_back(issue);
            }
        }
        return run;
    }

private:
    std::shared_ptr<InMemoryRepository> m_repo;
};

class CountingReviewer : public domain::SegmentReviewer {
public:
    int calls = 0;
    bool offline = false;

    std::string name() const override { return "llm"; }

    domain::ToolRun review(const domain::Segment& segment) override {
        ++calls;
        domain::ToolRun run;
        run.tool = "llm";
        if (offline) {
            run.failure = "Ollama error: connection refused";
            return run;
        }
        domain::Issue issue;
        issue.tool = "llm";
        issue.type = "clarity";
        issue.file = segment.file;
        issue.line = segment.startLine;
        issue.severity = domain::Severity::Note;
        issue.message = "Suggestion";
        issue.suggestion = "Rephrase.";
        run.issues.push_back(issue);
        return run;
    }
};

struct Fixture {
    std::shared_ptr<InMemoryRepository> repo = std::make_shared<InMemoryRepository>();
    std::shared_ptr<TypoChecker> checker = std::make_shared<TypoChecker>(repo);
    std::shared_ptr<CountingReviewer> reviewer = std::make_shared<CountingReviewer>();
    fs::path cachePath = fs::path(kTestRoot) / "out" / ".review_cache.json";

    ReviewOutcome run(const std::vector<std::string>& files, const ReviewOptions& options = {}) {
        ReviewService service(repo, {checker}, std::make_shared<infrastructure::SegmentExtractor>(),
                              reviewer, std::make_unique<infrastructure::CacheStore>(cachePath));
        return service.run(files, options);
    }
};

std::vector<domain::Issue> ByTool(const ReviewOutcome& outcome, const std::string& tool) {
    std::vector<domain::Issue> result;
    std::copy_if(outcome.issues.begin(), outcome.issues.end(), std::back_inserter(result),
                 [&](const domain::Issue& issue) { return issue.tool == tool && issue.type != "tool_failure"; });
    return result;
}

size_t FailureCount(const ReviewOutcome& outcome) {
    return static_cast<size_t>(std::count_if(outcome.issues.begin(), outcome.issues.end(),
        [](const domain::Issue& issue) { return issue.type == "tool_failure"; }));
}

void TestIncrementalRuns() {
    Fixture f;
    f.repo->files["a.tex"] = "Intro line.\nWe use teh cache.\n";

    // Cold run: everything is checked and reviewed; unreadable documents are skipped.
    auto cold = f.run({"a.tex", "missing.tex"});
    assert(cold.documentCount == 1);
    assert(cold.segmentCount == 1);
    assert(cold.reviewedSegmentCount == 1);
    assert(cold.cacheSaved);
    assert(fs::exists(f.cachePath));
    assert(f.checker->calls == 1 && f.reviewer->calls == 1);
    auto typos = ByTool(cold, "typo");
    assert(typos.size() == 1 && typos[0].line == 2);
    assert(ByTool(cold, "llm").size() == 1);
    assert(FailureCount(cold) == 0);

    // Unchanged run: nothing is re-run, findings come from the cache.
    auto warm = f.run({"a.tex"});
    assert(f.checker->calls == 1 && f.reviewer->calls == 1);
    assert(warm.reviewedSegmentCount == 0);
    typos = ByTool(warm, "typo");
    assert(typos.size() == 1 && typos[0].line == 2 && typos[0].message == "teh ==> the");
    auto llm = ByTool(warm, "llm");
    assert(llm.size() == 1 && llm[0].suggestion && *llm[0].suggestion == "Rephrase.");

    // Insertion at the top: only line 1 is fresh, the cached typo moves to line 3.
    f.repo->files["a.tex"] = "New first line.\nIntro line.\nWe use teh cache.\n";
    auto shifted = f.run({"a.tex"});
    assert(f.checker->calls == 2);
    assert(f.reviewer->calls == 2);
    typos = ByTool(shifted, "typo");
    assert(typos.size() == 1 && typos[0].line == 3);

    // Failing tools: reported once, cached findings still shown, work left for next run.
    f.repo->files["a.tex"] = "New first line.\nIntro line.\nWe use teh cache.\nAnother teh line.\n";
    f.checker->offline = true;
    f.reviewer->offline = true;
    auto failed = f.run({"a.tex"});
    assert(FailureCount(failed) == 2);
    typos = ByTool(failed, "typo");
    assert(typos.size() == 1 && typos[0].line == 3);
    assert(ByTool(failed, "llm").empty());
    assert(failed.reviewedSegmentCount == 0);

    auto failure = std::find_if(failed.issues.begin(), failed.issues.end(),
        [](const domain::Issue& issue) { return issue.type == "tool_failure" && issue.tool == "typo"; });
    assert(failure != failed.issues.end());
    assert(failure->file.empty());
    assert(failure->severity == domain::Severity::Error);
    assert(failure->message == "typo checker offline");

    // Recovery: the same content is checked and reviewed again.
    f.checker->offline = false;
    f.reviewer->offline = false;
    auto recovered = f.run({"a.tex"});
    assert(f.checker->calls == 4);
    assert(f.reviewer->calls == 4);
    assert(FailureCount(recovered) == 0);
    typos = ByTool(recovered, "typo");
    assert(typos.size() == 2);
    std::vector<int> lines = {typos[0].line, typos[1].line};
    std::sort(lines.begin(), lines.end());
    assert((lines == std::vector<int>{3, 4}));
    assert(ByTool(recovered, "llm").size() == 1);

    // And then it is stable again.
    f.run({"a.tex"});
    assert(f.checker->calls == 4 && f.reviewer->calls == 4);
}

void TestFullCheckIgnoresCache() {
    Fixture f;
    f.repo->files["b.tex"] = "Plain text here.\n";
    f.run({"b.tex"});
    assert(f.checker->calls == 1);

    ReviewOptions full;
    full.useCache = false;
    full.saveCache = false;
    full.runLlm = false;
    auto outcome = f.run({"b.tex"}, full);
    assert(f.checker->calls == 2);
    assert(f.reviewer->calls == 1);
    assert(!outcome.cacheSaved);
    assert(outcome.issues.empty());
}

} // namespace

int main() {
    std::cout << "[Test] Starting ReviewService Test..." << std::endl;
    fs::remove_all(kTestRoot);

    TestIncrementalRuns();
    fs::remove_all(kTestRoot);
    TestFullCheckIgnoresCache();

    fs::remove_all(kTestRoot);
    std::cout << "[PASS] ReviewService Test." << std::endl;
    return 0;
}
