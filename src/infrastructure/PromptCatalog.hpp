/**
 * @file PromptCatalog.hpp
 * @brief Central storage for reviewer system prompts.
 */

#pragma once

#include <string>

namespace clara::infrastructure {

class PromptCatalog {
public:
    /**
     * @brief Returns the clarity review prompt for the document language.
     *
     * Reads <configDir>/prompt_clarity_en.txt for English (en-*) documents,
     * falling back to <configDir>/prompt_clarity.txt, then to a built-in prompt
     * in the document language.
     */
    static std::string GetClarityPrompt(const std::string& primaryLanguage,
                                        const std::string& configDir = "configs");

    static bool IsEnglish(const std::string& primaryLanguage);
};

} // namespace clara::infrastructure
