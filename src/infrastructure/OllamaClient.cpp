#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/HttpEndpoint.hpp"
#include <httplib.h>
#include <iostream>

namespace clara::infrastructure {

using json = nlohmann::json;

OllamaClient::OllamaClient(const std::string& baseUrl, Options options)
    : m_options(std::move(options)) {
    HttpEndpoint endpoint = HttpEndpoint::Parse(baseUrl);
    m_origin = endpoint.origin;
    m_basePath = endpoint.basePath;
}

void OllamaClient::applyOptions(json& requestData) const {
    json options = json::object();
    if (m_options.temperature) options["temperature"] = *m_options.temperature;
    if (m_options.maxTokens) options["num_predict"] = *m_options.maxTokens;
    if (!options.empty()) requestData["options"] = options;
}

OllamaClient::Reply OllamaClient::post(const std::string& path, const json& requestData) const {
    Reply reply;
    httplib::Client cli(m_origin);
    cli.set_read_timeout(m_options.timeoutSeconds);

    auto res = cli.Post(m_basePath + path,
                        requestData.dump(-1, ' ', false, json::error_handler_t::replace),
                        "application/json");
    if (!res) {
        reply.error = "Connection failed: " + httplib::to_string(res.error());
        std::cerr << "[OllamaClient] " << reply.error << std::endl;
        return reply;
    }
    reply.status = res->status;
    if (res->status != 200) {
        reply.error = "HTTP Error " + std::to_string(res->status) + ": " + res->body;
        std::cerr << "[OllamaClient] " << reply.error << std::endl;
        return reply;
    }

    try {
        auto body = json::parse(res->body);
        if (body.contains("message") && body["message"].contains("content")) {
            reply.content = body["message"]["content"].get<std::string>();
        } else if (body.contains("response")) {
            reply.content = body["response"].get<std::string>();
        }
        reply.ok = true;
    } catch (const json::exception& e) {
        reply.error = std::string("JSON Parse Error: ") + e.what();
        std::cerr << "[OllamaClient] " << reply.error << std::endl;
    }
    return reply;
}

OllamaClient::Reply OllamaClient::chat(const std::string& model, const json& messages, bool forceJson) const {
    json requestData = {
        {"model", model},
        {"messages", messages},
        {"stream", false}
    };
    if (forceJson) {
        requestData["format"] = "json";
    }
    applyOptions(requestData);
    return post("/api/chat", requestData);
}

OllamaClient::Reply OllamaClient::generate(const std::string& model, const std::string& prompt, bool forceJson) const {
    json requestData = {
        {"model", model},
        {"prompt", prompt},
        {"stream", false}
    };
    if (forceJson) {
        requestData["format"] = "json";
    }
    applyOptions(requestData);
    return post("/api/generate", requestData);
}

} // namespace clara::infrastructure
