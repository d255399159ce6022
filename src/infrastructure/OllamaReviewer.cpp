/**
 * @file OllamaReviewer.cpp
 * @brief Implementation of OllamaReviewer.
 */

#include "infrastructure/OllamaReviewer.hpp"
#include "infrastructure/LlmResponseParser.hpp"
#include <nlohmann/json.hpp>

namespace clara::infrastructure {

using json = nlohmann::json;

OllamaReviewer::OllamaReviewer(OllamaClient client, std::string model, std::string systemPrompt)
    : m_client(std::move(client)), m_model(std::move(model)), m_systemPrompt(std::move(systemPrompt)) {}

domain::ToolRun OllamaReviewer::review(const domain::Segment& segment) {
    domain::ToolRun run;
    run.tool = name();

    json messages = json::array({
        {{"role", "system"}, {"content", m_systemPrompt}},
        {{"role", "user"}, {"content", segment.text}}
    });

    auto reply = m_client.chat(m_model, messages, true);
    if (!reply.ok && reply.status == 404) {
        reply = m_client.generate(m_model, m_systemPrompt + "\n\n" + segment.text + "\n", true);
    }
    if (!reply.ok) {
        run.failure = "Ollama error: " + reply.error;
        return run;
    }

    for (const auto& record : LlmResponseParser::Parse(reply.content)) {
        run.issues.push_back(record.attach(segment.file, segment.startLine));
    }
    return run;
}

} // namespace clara::infrastructure
