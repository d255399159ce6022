/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace clara::infrastructure {

struct OllamaClientOptions {
    std::optional<double> temperature;
    std::optional<int> maxTokens; ///< Sent as num_predict.
    int timeoutSeconds = 60;
};

class OllamaClient {
public:
    using Options = OllamaClientOptions;

    /** @brief Outcome of one request; status is 0 when no HTTP response arrived. */
    struct Reply {
        bool ok = false;
        int status = 0;
        std::string content;
        std::string error;
    };

    explicit OllamaClient(const std::string& baseUrl = "http://localhost:11434", Options options = {});

    /** @brief Sends a POST request to /api/chat and returns message.content. */
    Reply chat(const std::string& model, const nlohmann::json& messages, bool forceJson = false) const;

    /** @brief Sends a POST request to /api/generate and returns response. */
    Reply generate(const std::string& model, const std::string& prompt, bool forceJson = false) const;

private:
    Reply post(const std::string& path, const nlohmann::json& requestData) const;
    void applyOptions(nlohmann::json& requestData) const;

    std::string m_origin;
    std::string m_basePath;
    Options m_options;
};

} // namespace clara::infrastructure
