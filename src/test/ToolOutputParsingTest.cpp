#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "app/CommandLine.hpp"
#include "infrastructure/DocumentScanner.hpp"
#include "infrastructure/HttpEndpoint.hpp"
#include "infrastructure/tools/ChktexChecker.hpp"
#include "infrastructure/tools/CodespellChecker.hpp"
#include "infrastructure/tools/LanguageToolChecker.hpp"
#include "infrastructure/tools/LatexindentChecker.hpp"
#include "infrastructure/tools/ValeChecker.hpp"

using namespace clara;
using namespace clara::infrastructure;
namespace fs = std::filesystem;

namespace {

void TestChktex() {
    auto issues = tools::ChktexChecker::ParseOutput(
        "paper.tex:3:5:Warning:24:Delete this space to maintain correct pagereferences.\n"
        "not a chktex line\n"
        "\n"
        "chapters/a.tex:10:1:Error:1:Command terminated with space. \n");
    assert(issues.size() == 2);
    assert(issues[0].tool == "chktex");
    assert(issues[0].type == "latex_lint");
    assert(issues[0].file == "paper.tex");
    assert(issues[0].line == 3 && issues[0].col == 5);
    assert(issues[0].severity == domain::Severity::Warning);
    assert(issues[0].code && *issues[0].code == "chktex:24");
    assert(issues[1].file == "chapters/a.tex");
    assert(issues[1].severity == domain::Severity::Error);
    assert(issues[1].message == "Command terminated with space.");
}

void TestVale() {
    auto issues = tools::ValeChecker::ParseOutput(R"({
        "paper.tex": [
            {"Line": 4, "Span": [7, 12], "Severity": "error", "Message": "Avoid 'very'.", "Check": "Style.Very"},
            {"Line": 2, "Severity": "suggestion", "Message": "Consider rewording."}
        ]
    })");
    assert(issues.size() == 2);
    assert(issues[0].tool == "vale" && issues[0].type == "style");
    assert(issues[0].line == 4 && issues[0].col == 7);
    assert(issues[0].severity == domain::Severity::Error);
    assert(issues[0].code && *issues[0].code == "Style.Very");
    assert(issues[1].severity == domain::Severity::Note);
    assert(issues[1].col == 0);
    assert(!issues[1].code);

    assert(tools::ValeChecker::ParseOutput("{}").empty());

    bool threw = false;
    try {
        tools::ValeChecker::ParseOutput("E100 [vale.ini not found]");
    } catch (const nlohmann::json::exception&) {
        threw = true;
    }
    assert(threw);
}

void TestValeUnreadableOutputIsAFailure() {
    // echo prints its arguments: exit 0, nothing on stderr, no JSON.
    tools::ValeChecker vale("configs/vale.ini", "echo");
    auto run = vale.check({"paper.tex"});
    assert(!run.succeeded());
    assert(run.issues.empty());
    assert(run.failure->find("Vale produced unreadable output") == 0);

    tools::ValeChecker missing("configs/vale.ini", "clara-test-no-such-vale");
    run = missing.check({"paper.tex"});
    assert(run.failure && *run.failure == "vale binary not found");
}

void TestLatexindent() {
    using tools::LatexindentChecker;
    assert(!LatexindentChecker::FormattingIssue("paper.tex", 0));

    auto issue = LatexindentChecker::FormattingIssue("paper.tex", 1);
    assert(issue);
    assert(issue->tool == "latexindent");
    assert(issue->type == "formatting");
    assert(issue->file == "paper.tex");
    assert(issue->line == 0);
    assert(issue->severity == domain::Severity::Warning);

    // true/false stand in for a latexindent that keeps or would change the files.
    auto clean = LatexindentChecker("configs/.latexindent.yaml", "true").check({"a.tex", "b.tex"});
    assert(clean.succeeded() && clean.issues.empty());

    auto dirty = LatexindentChecker("configs/.latexindent.yaml", "false").check({"a.tex", "b.tex"});
    assert(dirty.succeeded());
    assert(dirty.issues.size() == 2);
    assert(dirty.issues[1].file == "b.tex" && dirty.issues[1].line == 0);

    auto missing = LatexindentChecker("configs/.latexindent.yaml", "clara-test-no-such-latexindent").check({"a.tex"});
    assert(missing.failure && *missing.failure == "latexindent binary not found");

    assert(LatexindentChecker().check({}).succeeded());
}

void TestCodespell() {
    auto issues = tools::CodespellChecker::ParseOutput(
        "chapters/intro.tex:12: teh ==> the\n"
        "WARNING: Decoding file failed\n");
    assert(issues.size() == 1);
    assert(issues[0].tool == "codespell");
    assert(issues[0].type == "typo");
    assert(issues[0].file == "chapters/intro.tex");
    assert(issues[0].line == 12);
    assert(issues[0].severity == domain::Severity::Warning);
    assert(issues[0].message == "teh ==> the");
}

void TestLanguageToolText() {
    using tools::LanguageToolChecker;

    const std::string text = LanguageToolChecker::PrepareText(
        "Hello world .\n% comment\nfoo\n\nLast line.", {});
    assert(text == "Hello world.\n\n\n\nLast line.");

    assert(LanguageToolChecker::PrepareText("ClaRA works.", {"ClaRA"}) == "Begriff works.");

    // "Grüße": ü and ß take two bytes each.
    assert(LanguageToolChecker::Utf16ToByteOffset("Grüße x", 5) == 7);
    // Astral characters count as two UTF-16 units.
    assert(LanguageToolChecker::Utf16ToByteOffset("\xF0\x9F\x98\x80" "a", 2) == 4);
    assert(LanguageToolChecker::Utf16ToByteOffset("abc", 1, 1) == 2);
    assert(LanguageToolChecker::Utf16ToByteOffset("abc", 10) == 3);
}

void TestLanguageToolMatches() {
    const std::string sent = "Hello world.\nThis are wrong.";
    const std::string masked = "Hello world.\n\\emph{This} are wrong.";
    const std::string body = R"({"matches": [{
        "message": "Verb agreement.",
        "offset": 18, "length": 3,
        "rule": {"id": "AGREEMENT"},
        "replacements": [{"value": "is"}, {"value": "am"}, {"value": "was"}, {"value": "be"}]
    }]})";

    auto issues = tools::LanguageToolChecker::ParseMatches(body, "paper.tex", sent, masked);
    assert(issues.size() == 1);
    assert(issues[0].tool == "languagetool");
    assert(issues[0].type == "grammar");
    assert(issues[0].file == "paper.tex");
    assert(issues[0].line == 2);
    assert(issues[0].col == 13);
    assert(issues[0].severity == domain::Severity::Warning);
    assert(issues[0].code && *issues[0].code == "AGREEMENT");
    assert(issues[0].suggestion && *issues[0].suggestion == "is; am; was");

    assert(tools::LanguageToolChecker::ParseMatches(R"({"software": {}})", "paper.tex", sent, masked).empty());

    // An unreadable file fails the run before any request is made.
    tools::LanguageToolChecker checker("http://127.0.0.1:9", "en-US");
    auto run = checker.check({"test_no_such_dir/missing.tex"});
    assert(!run.succeeded());
    assert(run.failure->find("test_no_such_dir/missing.tex") != std::string::npos);
}

void TestDocumentScanner() {
    assert(DocumentScanner::MatchesInclude("**/*.tex", "main.tex"));
    assert(DocumentScanner::MatchesInclude("**/*.tex", "chapters/a/b.tex"));
    assert(!DocumentScanner::MatchesInclude("chapters/*.tex", "chapters/a/b.tex"));
    assert(!DocumentScanner::MatchesInclude("*.tex", "main.bib"));

    assert(DocumentScanner::IsExcluded("out/build.tex", {"out/**"}));
    assert(!DocumentScanner::IsExcluded("outline.tex", {"out/**"}));
    assert(DocumentScanner::IsExcluded("figs/old.tex", {"figs/old.tex"}));

    const std::string root = "test_scanner_root";
    fs::remove_all(root);
    fs::create_directories(root + "/chapters");
    fs::create_directories(root + "/out");
    for (const char* name : {"main.tex", "chapters/intro.tex", "out/main.tex", "notes.txt", "outline.tex"}) {
        std::ofstream(fs::path(root) / name) << "x\n";
    }

    DocumentScanner scanner(root, {"**/*.tex"}, {"out/**"});
    auto found = scanner.scan();
    assert((found == std::vector<std::string>{"chapters/intro.tex", "main.tex", "outline.tex"}));

    fs::remove_all(root);
    assert(DocumentScanner(root, {"**/*.tex"}, {}).scan().empty());
}

void TestHttpEndpoint() {
    auto lt = HttpEndpoint::Parse("http://localhost:8081/");
    assert(lt.origin == "http://localhost:8081");
    assert(lt.basePath.empty());

    auto bare = HttpEndpoint::Parse("localhost:11434");
    assert(bare.origin == "http://localhost:11434");

    auto openai = HttpEndpoint::Parse("https://api.openai.com/v1/");
    assert(openai.origin == "https://api.openai.com");
    assert(openai.path("/chat/completions") == "/v1/chat/completions");
}

void TestCommandLine() {
    using app::CommandLine;
    std::string error;

    auto cl = CommandLine::Parse({"review-auto", "--files", "a.tex", "b.tex", "--json", "out.json"}, error);
    assert(cl);
    assert(cl->command == app::Command::ReviewAuto);
    assert((cl->files == std::vector<std::string>{"a.tex", "b.tex"}));
    assert(cl->jsonOut && *cl->jsonOut == "out.json");
    assert(cl->configPath == "clara.json");

    cl = CommandLine::Parse({"check", "--with-llm", "--config", "alt.json"}, error);
    assert(cl && cl->command == app::Command::Check && cl->withLlm && cl->configPath == "alt.json");

    cl = CommandLine::Parse({"--help"}, error);
    assert(cl && cl->showHelp);

    assert(!CommandLine::Parse({}, error));
    assert(error == "Missing command");
    assert(!CommandLine::Parse({"lint"}, error));
    assert(!CommandLine::Parse({"check", "--json"}, error));
    assert(error == "Missing value for --json");
    assert(!CommandLine::Parse({"check", "--bogus"}, error));
    assert(!CommandLine::Parse({"check", "extra"}, error));
}

} // namespace

int main() {
    std::cout << "[Test] Starting ToolOutputParsing Test..." << std::endl;

    TestChktex();
    TestVale();
    TestValeUnreadableOutputIsAFailure();
    TestLatexindent();
    TestCodespell();
    TestLanguageToolText();
    TestLanguageToolMatches();
    TestDocumentScanner();
    TestHttpEndpoint();
    TestCommandLine();

    std::cout << "[PASS] ToolOutputParsing Test." << std::endl;
    return 0;
}
