/**
 * @file LanguageToolChecker.hpp
 * @brief Grammar and spelling checks against a LanguageTool HTTP server.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/ReviewTools.hpp"

namespace clara::infrastructure::tools {

/**
 * @struct LanguageToolRules
 * @brief Rule selection from configs/languagetool.json.
 */
struct LanguageToolRules {
    std::vector<std::string> disabledRules;
    std::vector<std::string> enabledRules;
    std::vector<std::string> ignoreWords; ///< Replaced by a neutral word before sending.
};

/**
 * @class LanguageToolChecker
 * @brief Sends each document's prose to /v2/check and maps matches back to source lines.
 *
 * The text sent has exactly one line per source line, so a match offset gives
 * its source line directly; the column is found by locating the matched
 * snippet in the masked source line.
 */
class LanguageToolChecker : public domain::LineChecker {
public:
    LanguageToolChecker(std::string baseUrl, std::string language,
                        LanguageToolRules rules = {}, int timeoutSeconds = 10);

    std::string name() const override { return "languagetool"; }
    domain::ToolRun check(const std::vector<std::string>& files) override;

    /** @brief Reads the rules file. Missing or malformed files yield empty rules. */
    static LanguageToolRules LoadRules(const std::string& path);

    /** @brief Line-preserving prose for a LaTeX document, as submitted to the server. */
    static std::string PrepareText(const std::string& content, const std::vector<std::string>& ignoreWords);

    /** @brief Byte offset of a UTF-16 code unit offset in UTF-8 text. */
    static size_t Utf16ToByteOffset(const std::string& text, size_t utf16Offset, size_t fromByte = 0);

    /**
     * @brief Maps the server's JSON reply to issues for one file.
     * @throws nlohmann::json::exception on malformed replies.
     */
    static std::vector<domain::Issue> ParseMatches(const std::string& body, const std::string& file,
                                                   const std::string& sentText, const std::string& maskedSource);

private:
    std::string m_baseUrl;
    std::string m_language;
    LanguageToolRules m_rules;
    int m_timeoutSeconds;
};

} // namespace clara::infrastructure::tools
