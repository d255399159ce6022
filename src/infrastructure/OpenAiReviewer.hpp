/**
 * @file OpenAiReviewer.hpp
 * @brief Clarity review through an OpenAI-compatible chat completions server (LM Studio, OpenAI).
 */

#pragma once
#include <optional>
#include <string>
#include "domain/ReviewTools.hpp"

namespace clara::infrastructure {

struct OpenAiReviewerOptions {
    std::optional<double> temperature;
    std::optional<int> maxTokens;
    int timeoutSeconds = 60;
    std::optional<std::string> apiKey; ///< Sent as a bearer token when set.
};

class OpenAiReviewer : public domain::SegmentReviewer {
public:
    using Options = OpenAiReviewerOptions;

    /**
     * @param baseUrl API root including the version path, e.g. http://localhost:1234/v1.
     */
    OpenAiReviewer(std::string baseUrl, std::string model, std::string systemPrompt, Options options = {});

    std::string name() const override { return "llm"; }
    domain::ToolRun review(const domain::Segment& segment) override;

private:
    std::string m_baseUrl;
    std::string m_model;
    std::string m_systemPrompt;
    Options m_options;
};

} // namespace clara::infrastructure
