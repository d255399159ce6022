/**
 * @file PromptCatalog.cpp
 * @brief Implementation of PromptCatalog.
 */

#include "infrastructure/PromptCatalog.hpp"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace clara::infrastructure {

namespace {

const char* kClarityPromptEn =
    "Role: Scientific editor.\n"
    "Goal: Point out passages that are unclear, ambiguous or needlessly complicated.\n"
    "Output: A JSON array of objects:\n"
    "[{ \"rationale\": \"...\", \"suggestion\": \"...\" }]\n"
    "Rules:\n"
    "- Return [] when the text is clear.\n"
    "- Keep the meaning, technical terms and citations unchanged.\n"
    "- No extra text.\n";

const char* kClarityPromptDe =
    "Rolle: Wissenschaftliches Lektorat.\n"
    "Ziel: Unklare, mehrdeutige oder unnötig komplizierte Stellen benennen.\n"
    "Ausgabe: Ein JSON-Array von Objekten:\n"
    "[{ \"rationale\": \"...\", \"suggestion\": \"...\" }]\n"
    "Regeln:\n"
    "- Gib [] zurück, wenn der Text klar ist.\n"
    "- Bedeutung, Fachbegriffe und Zitate bleiben unverändert.\n"
    "- Keine Zusatztexte.\n";

} // namespace

bool PromptCatalog::IsEnglish(const std::string& primaryLanguage) {
    std::string lang;
    for (char ch : primaryLanguage) {
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            lang.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
    }
    return lang.rfind("en", 0) == 0;
}

std::string PromptCatalog::GetClarityPrompt(const std::string& primaryLanguage, const std::string& configDir) {
    namespace fs = std::filesystem;
    fs::path candidate = fs::path(configDir) / (IsEnglish(primaryLanguage) ? "prompt_clarity_en.txt" : "prompt_clarity.txt");
    if (!fs::exists(candidate)) {
        candidate = fs::path(configDir) / "prompt_clarity.txt";
    }
    if (fs::exists(candidate)) {
        std::ifstream in(candidate);
        if (in) {
            std::stringstream ss;
            ss << in.rdbuf();
            return ss.str();
        }
    }
    return IsEnglish(primaryLanguage) ? kClarityPromptEn : kClarityPromptDe;
}

} // namespace clara::infrastructure
