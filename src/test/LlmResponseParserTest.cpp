#include <cassert>
#include <iostream>

#include "infrastructure/LlmResponseParser.hpp"

using clara::infrastructure::LlmResponseParser;

int main() {
    std::cout << "[Test] Starting LlmResponseParser Test..." << std::endl;

    // Plain array of objects.
    auto records = LlmResponseParser::Parse(
        R"([{"rationale": "Sentence is too long.", "suggestion": "Split it."}, {"suggestion": "Use active voice."}])");
    assert(records.size() == 2);
    assert(records[0].tool == "llm");
    assert(records[0].type == "clarity");
    assert(records[0].severity == clara::domain::Severity::Note);
    assert(records[0].message == "Sentence is too long.");
    assert(records[0].suggestion && *records[0].suggestion == "Split it.");
    assert(records[1].message == "Suggestion");
    assert(records[1].col == 0);

    // Wrapped in an object.
    records = LlmResponseParser::Parse(R"({"suggestions": ["Define the acronym first."]})");
    assert(records.size() == 1);
    assert(records[0].message == "Suggestion");
    assert(records[0].suggestion && *records[0].suggestion == "Define the acronym first.");

    // Fenced reply with prose around it.
    records = LlmResponseParser::Parse(
        "Here you go:\n```json\n[{\"rationale\": \"Vague\", \"suggestion\": \"Be specific\"}]\n```\n");
    assert(records.size() == 1);
    assert(records[0].message == "Vague");

    // Non-object, non-string items are dropped.
    records = LlmResponseParser::Parse(R"([42, null, "Keep"])");
    assert(records.size() == 1);

    assert(LlmResponseParser::Parse("").empty());
    assert(LlmResponseParser::Parse("I could not find anything to improve.").empty());
    assert(LlmResponseParser::Parse("[not json]").empty());
    assert(LlmResponseParser::Parse(R"({"answer": "none"})").empty());

    std::cout << "[PASS] LlmResponseParser Test." << std::endl;
    return 0;
}
