/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace clara::infrastructure {

using json = nlohmann::json;

namespace {

template <typename T>
void ReadOptional(const json& section, const char* key, std::optional<T>& target) {
    if (!section.contains(key)) return;
    if (section[key].is_null()) {
        target.reset();
    } else {
        target = section[key].get<T>();
    }
}

template <typename T>
void Read(const json& section, const char* key, T& target) {
    if (section.contains(key) && !section[key].is_null()) {
        target = section[key].get<T>();
    }
}

} // namespace

ClaraConfig ConfigLoader::FromJson(const json& j) {
    ClaraConfig cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("languages")) {
        const auto& languages = j["languages"];
        Read(languages, "primary", cfg.primaryLanguage);
        Read(languages, "secondary", cfg.secondaryLanguages);
    }
    if (j.contains("llm")) {
        const auto& llm = j["llm"];
        Read(llm, "provider", cfg.llm.provider);
        Read(llm, "model", cfg.llm.model);
        ReadOptional(llm, "api_url", cfg.llm.apiUrl);
        ReadOptional(llm, "max_tokens", cfg.llm.maxTokens);
        ReadOptional(llm, "temperature", cfg.llm.temperature);
        ReadOptional(llm, "timeout_seconds", cfg.llm.timeoutSeconds);
    }
    if (j.contains("checks")) {
        const auto& checks = j["checks"];
        Read(checks, "enable_codespell", cfg.enableCodespell);
        Read(checks, "severity_threshold", cfg.severityThreshold);
    }
    if (j.contains("paths")) {
        const auto& paths = j["paths"];
        Read(paths, "include", cfg.include);
        Read(paths, "exclude", cfg.exclude);
    }
    if (j.contains("cache")) {
        Read(j["cache"], "path", cfg.cachePath);
    }
    if (j.contains("segments")) {
        const auto& segments = j["segments"];
        Read(segments, "target_max_chars", cfg.targetMaxChars);
        Read(segments, "overlap_sentences", cfg.overlapSentences);
    }
    return cfg;
}

ClaraConfig ConfigLoader::Load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        auto toml = std::filesystem::path(path).replace_extension(".toml");
        std::error_code ec;
        if (std::filesystem::exists(toml, ec)) {
            std::cerr << "[ConfigLoader] Found " << toml.string() << " but settings are read from "
                      << path << " (JSON). Using defaults." << std::endl;
        }
        return ClaraConfig{};
    }

    try {
        std::ifstream f(path);
        json j;
        f >> j;
        return FromJson(j);
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
    }
    return ClaraConfig{};
}

std::string ConfigLoader::GetEnvOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') return fallback;
    return value;
}

} // namespace clara::infrastructure
