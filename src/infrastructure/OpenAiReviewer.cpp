/**
 * @file OpenAiReviewer.cpp
 * @brief Implementation of OpenAiReviewer.
 */

#include "infrastructure/OpenAiReviewer.hpp"
#include "infrastructure/HttpEndpoint.hpp"
#include "infrastructure/LlmResponseParser.hpp"
#include <httplib.h>
#include <iostream>
#include <nlohmann/json.hpp>

namespace clara::infrastructure {

using json = nlohmann::json;

OpenAiReviewer::OpenAiReviewer(std::string baseUrl, std::string model, std::string systemPrompt, Options options)
    : m_baseUrl(std::move(baseUrl)), m_model(std::move(model)),
      m_systemPrompt(std::move(systemPrompt)), m_options(std::move(options)) {}

domain::ToolRun OpenAiReviewer::review(const domain::Segment& segment) {
    domain::ToolRun run;
    run.tool = name();

    json payload = {
        {"model", m_model},
        {"messages", json::array({
            {{"role", "system"}, {"content", m_systemPrompt}},
            {{"role", "user"}, {"content", segment.text}}
        })},
        {"stream", false}
    };
    if (m_options.temperature) payload["temperature"] = *m_options.temperature;
    if (m_options.maxTokens) payload["max_tokens"] = *m_options.maxTokens;

    HttpEndpoint endpoint = HttpEndpoint::Parse(m_baseUrl);
    httplib::Client cli(endpoint.origin);
    cli.set_read_timeout(m_options.timeoutSeconds);

    httplib::Headers headers;
    if (m_options.apiKey) {
        headers.emplace("Authorization", "Bearer " + *m_options.apiKey);
    }

    auto res = cli.Post(endpoint.path("/chat/completions"), headers,
                        payload.dump(-1, ' ', false, json::error_handler_t::replace),
                        "application/json");
    if (!res) {
        run.failure = "OpenAI/LMStudio error: Connection failed: " + httplib::to_string(res.error());
        std::cerr << "[OpenAiReviewer] " << *run.failure << std::endl;
        return run;
    }
    if (res->status != 200) {
        run.failure = "OpenAI/LMStudio error: HTTP " + std::to_string(res->status);
        std::cerr << "[OpenAiReviewer] " << *run.failure << ": " << res->body << std::endl;
        return run;
    }

    std::string content;
    try {
        auto body = json::parse(res->body);
        const auto& choices = body.at("choices");
        if (choices.is_array() && !choices.empty()) {
            const auto& message = choices[0].at("message");
            if (message.contains("content") && message["content"].is_string()) {
                content = message["content"].get<std::string>();
            }
        }
    } catch (const json::exception& e) {
        run.failure = std::string("OpenAI/LMStudio error: ") + e.what();
        return run;
    }

    for (const auto& record : LlmResponseParser::Parse(content)) {
        run.issues.push_back(record.attach(segment.file, segment.startLine));
    }
    return run;
}

} // namespace clara::infrastructure
