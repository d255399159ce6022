/**
 * @file LlmResponseParser.hpp
 * @brief Turns free-form model replies into clarity findings.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/Issue.hpp"

namespace clara::infrastructure {

class LlmResponseParser {
public:
    /**
     * @brief Extracts suggestions from a model reply.
     *
     * Accepts a JSON array, an object holding "items", "suggestions" or
     * "results", or the first [...] span inside surrounding prose or fences.
     * Object items map rationale/suggestion; string items become the suggestion.
     * Unparseable replies yield no findings.
     */
    static std::vector<domain::IssueRecord> Parse(const std::string& content);
};

} // namespace clara::infrastructure
