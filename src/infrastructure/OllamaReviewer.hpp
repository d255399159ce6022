/**
 * @file OllamaReviewer.hpp
 * @brief Clarity review of segments by a local Ollama model.
 */

#pragma once
#include <string>
#include "domain/ReviewTools.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace clara::infrastructure {

/**
 * @class OllamaReviewer
 * @brief Implements SegmentReviewer on /api/chat, falling back to /api/generate
 *        on servers that answer 404 for chat.
 */
class OllamaReviewer : public domain::SegmentReviewer {
public:
    OllamaReviewer(OllamaClient client, std::string model, std::string systemPrompt);

    std::string name() const override { return "llm"; }
    domain::ToolRun review(const domain::Segment& segment) override;

private:
    OllamaClient m_client;
    std::string m_model;
    std::string m_systemPrompt;
};

} // namespace clara::infrastructure
