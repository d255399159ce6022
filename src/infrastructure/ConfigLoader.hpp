/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the review configuration (clara.json).
 *
 * Provides a unified way to access languages, LLM, check and path settings
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace clara::infrastructure {

struct LlmSettings {
    std::string provider = "ollama"; ///< "ollama", "openai" or "lm-studio".
    std::string model = "mistral";
    std::optional<std::string> apiUrl;
    std::optional<int> maxTokens;
    std::optional<double> temperature;
    std::optional<int> timeoutSeconds = 120;
};

struct ClaraConfig {
    std::string primaryLanguage = "de-DE";
    std::vector<std::string> secondaryLanguages;

    LlmSettings llm;

    bool enableCodespell = false;
    std::string severityThreshold = "warning";

    std::vector<std::string> include = {"**/*.tex"};
    std::vector<std::string> exclude = {"out/**"};

    std::string cachePath = "out/.review_cache.json";

    size_t targetMaxChars = 4000;
    size_t overlapSentences = 1;
};

class ConfigLoader {
public:
    /**
     * @brief Reads the configuration file.
     * @param path Path to clara.json.
     * @return Defaults when the file is missing or malformed; keys absent from
     *         the file keep their defaults.
     */
    static ClaraConfig Load(const std::string& path);

    /** @throws nlohmann::json::exception when a present key has the wrong type. */
    static ClaraConfig FromJson(const nlohmann::json& j);

    /** @brief Value of an environment variable, or fallback when unset or empty. */
    static std::string GetEnvOr(const char* name, const std::string& fallback);
};

} // namespace clara::infrastructure
