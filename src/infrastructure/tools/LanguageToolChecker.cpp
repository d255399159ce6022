/**
 * @file LanguageToolChecker.cpp
 * @brief Implementation of LanguageToolChecker.
 */

#include "infrastructure/tools/LanguageToolChecker.hpp"
#include "domain/Document.hpp"
#include "infrastructure/HttpEndpoint.hpp"
#include "infrastructure/LatexText.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <httplib.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <regex>
#include <sstream>

namespace clara::infrastructure::tools {

using json = nlohmann::json;

namespace {

const char* kIgnoredWordReplacement = "Begriff";
const std::regex kSpaceBeforePunctuation(R"([ \t]+([.,;:!?]))");
const std::regex kRepeatedBlanks(R"([ \t]{2,})");
const std::regex kStrayShortWord(R"([a-z]{1,6})");

std::string Join(const std::vector<std::string>& items, const std::string& separator) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += separator;
        out += item;
    }
    return out;
}

bool IsBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r") == std::string::npos;
}

std::string Trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> ReadStringList(const json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key) || !j[key].is_array()) return out;
    for (const auto& item : j[key]) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

} // namespace

LanguageToolChecker::LanguageToolChecker(std::string baseUrl, std::string language,
                                         LanguageToolRules rules, int timeoutSeconds)
    : m_baseUrl(std::move(baseUrl)), m_language(std::move(language)),
      m_rules(std::move(rules)), m_timeoutSeconds(timeoutSeconds) {}

LanguageToolRules LanguageToolChecker::LoadRules(const std::string& path) {
    LanguageToolRules rules;
    if (!std::filesystem::exists(path)) return rules;

    try {
        std::ifstream f(path);
        json j;
        f >> j;
        rules.disabledRules = ReadStringList(j, "disabledRules");
        rules.enabledRules = ReadStringList(j, "enabledRules");
        rules.ignoreWords = ReadStringList(j, "ignoreWords");
    } catch (const json::exception& e) {
        std::cerr << "[LanguageTool] Ignoring malformed " << path << ": " << e.what() << std::endl;
        return LanguageToolRules{};
    }
    return rules;
}

std::string LanguageToolChecker::PrepareText(const std::string& content, const std::vector<std::string>& ignoreWords) {
    auto lines = LatexText::ToPlainLines(LatexText::MaskPreambleAndComments(content));

    for (auto& line : lines) {
        line = std::regex_replace(line, kSpaceBeforePunctuation, "$1");
        if (ignoreWords.empty()) continue;
        for (const auto& word : ignoreWords) {
            if (word.empty()) continue;
            size_t pos = 0;
            while ((pos = line.find(word, pos)) != std::string::npos) {
                line.replace(pos, word.size(), kIgnoredWordReplacement);
                pos += std::char_traits<char>::length(kIgnoredWordReplacement);
            }
        }
        line = std::regex_replace(line, kRepeatedBlanks, " ");
    }

    // Short lowercase fragments standing alone are leftovers of stripped macros.
    std::vector<std::string> cleaned = lines;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (!std::regex_match(Trim(lines[i]), kStrayShortWord)) continue;
        bool prevBlank = (i == 0) || IsBlank(lines[i - 1]);
        bool nextBlank = (i + 1 == lines.size()) || IsBlank(lines[i + 1]);
        if (prevBlank && nextBlank) cleaned[i].clear();
    }
    return Join(cleaned, "\n");
}

size_t LanguageToolChecker::Utf16ToByteOffset(const std::string& text, size_t utf16Offset, size_t fromByte) {
    size_t byte = fromByte;
    size_t units = 0;
    while (byte < text.size() && units < utf16Offset) {
        unsigned char lead = static_cast<unsigned char>(text[byte]);
        size_t width = 1;
        if (lead >= 0xF0) width = 4;
        else if (lead >= 0xE0) width = 3;
        else if (lead >= 0xC0) width = 2;
        byte += width;
        units += (width == 4) ? 2 : 1;
    }
    return std::min(byte, text.size());
}

std::vector<domain::Issue> LanguageToolChecker::ParseMatches(const std::string& body, const std::string& file,
                                                             const std::string& sentText, const std::string& maskedSource) {
    std::vector<domain::Issue> issues;
    json data = json::parse(body);
    if (!data.contains("matches") || !data["matches"].is_array()) return issues;

    const auto sourceLines = domain::Document::SplitLines(maskedSource);

    for (const auto& match : data["matches"]) {
        size_t offset = match.value("offset", static_cast<size_t>(0));
        size_t length = match.value("length", static_cast<size_t>(0));
        size_t begin = Utf16ToByteOffset(sentText, offset);
        size_t end = Utf16ToByteOffset(sentText, length, begin);
        std::string snippet = sentText.substr(begin, end - begin);

        int line = 1 + static_cast<int>(std::count(sentText.begin(), sentText.begin() + begin, '\n'));
        int col = 1;
        if (!snippet.empty() && line - 1 < static_cast<int>(sourceLines.size())) {
            size_t found = sourceLines[line - 1].find(snippet);
            if (found != std::string::npos) col = static_cast<int>(found) + 1;
        }

        domain::Issue issue;
        issue.tool = "languagetool";
        issue.type = "grammar";
        issue.file = file;
        issue.line = line;
        issue.col = col;
        issue.severity = domain::Severity::Warning;
        issue.message = match.value("message", std::string());
        if (match.contains("rule") && match["rule"].is_object() && match["rule"].contains("id")) {
            issue.code = match["rule"]["id"].get<std::string>();
        }

        std::vector<std::string> replacements;
        if (match.contains("replacements") && match["replacements"].is_array()) {
            for (const auto& r : match["replacements"]) {
                if (replacements.size() == 3) break;
                if (r.contains("value") && r["value"].is_string()) {
                    replacements.push_back(r["value"].get<std::string>());
                }
            }
        }
        if (!replacements.empty()) issue.suggestion = Join(replacements, "; ");

        issues.push_back(std::move(issue));
    }
    return issues;
}

domain::ToolRun LanguageToolChecker::check(const std::vector<std::string>& files) {
    domain::ToolRun run;
    run.tool = name();
    if (files.empty()) return run;

    HttpEndpoint endpoint = HttpEndpoint::Parse(m_baseUrl);
    const std::string checkPath = (endpoint.basePath.size() >= 9 &&
                                   endpoint.basePath.compare(endpoint.basePath.size() - 9, 9, "/v2/check") == 0)
                                      ? endpoint.basePath
                                      : endpoint.path("/v2/check");

    httplib::Client cli(endpoint.origin);
    cli.set_connection_timeout(m_timeoutSeconds);
    cli.set_read_timeout(m_timeoutSeconds);

    for (const auto& file : files) {
        std::ifstream in(file, std::ios::binary);
        if (!in) {
            std::cerr << "[LanguageTool] Cannot read " << file << std::endl;
            run.failure = "LanguageTool could not read " + file;
            continue;
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        const std::string content = buffer.str();

        const std::string masked = LatexText::MaskPreambleAndComments(content);
        const std::string text = PrepareText(content, m_rules.ignoreWords);
        if (text.find_first_not_of(" \t\r\n") == std::string::npos) continue;

        httplib::Params params{
            {"text", text},
            {"language", m_language},
        };
        if (!m_rules.disabledRules.empty()) params.emplace("disabledRules", Join(m_rules.disabledRules, ","));
        if (!m_rules.enabledRules.empty()) params.emplace("enabledRules", Join(m_rules.enabledRules, ","));

        auto res = cli.Post(checkPath, params);
        if (!res) {
            std::cerr << "[LanguageTool] Connection failed: " << httplib::to_string(res.error()) << std::endl;
            run.failure = "Could not connect to LanguageTool server";
            return run;
        }
        if (res->status != 200) {
            run.failure = "LanguageTool HTTP " + std::to_string(res->status) + ": " + Trim(res->body);
            return run;
        }

        try {
            auto issues = ParseMatches(res->body, file, text, masked);
            run.issues.insert(run.issues.end(), issues.begin(), issues.end());
        } catch (const json::exception& e) {
            run.failure = std::string("Invalid LanguageTool response: ") + e.what();
            return run;
        }
    }
    return run;
}

} // namespace clara::infrastructure::tools
