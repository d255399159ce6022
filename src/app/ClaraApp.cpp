/**
 * @file ClaraApp.cpp
 * @brief Implementation of the ClaraApp class.
 */

#include "app/ClaraApp.hpp"
#include "application/ReportService.hpp"
#include "application/ReviewService.hpp"
#include "application/SuppressionService.hpp"
#include "infrastructure/CacheStore.hpp"
#include "infrastructure/DocumentScanner.hpp"
#include "infrastructure/FileRepository.hpp"
#include "infrastructure/OllamaReviewer.hpp"
#include "infrastructure/OpenAiReviewer.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include "infrastructure/SegmentExtractor.hpp"
#include "infrastructure/tools/ChktexChecker.hpp"
#include "infrastructure/tools/CodespellChecker.hpp"
#include "infrastructure/tools/LanguageToolChecker.hpp"
#include "infrastructure/tools/LatexindentChecker.hpp"
#include "infrastructure/tools/ValeChecker.hpp"
#include <iostream>

namespace clara::app {

namespace {
const char* kDefaultLanguageToolUrl = "http://localhost:8010";
const char* kDefaultOllamaUrl = "http://localhost:11434";
const char* kDefaultOpenAiUrl = "http://localhost:1234/v1";
const char* kLanguageToolRules = "configs/languagetool.json";
constexpr int kDefaultLlmTimeoutSeconds = 60;
}

ClaraApp::ClaraApp(CommandLine commandLine)
    : m_commandLine(std::move(commandLine)),
      m_config(infrastructure::ConfigLoader::Load(m_commandLine.configPath)) {}

std::vector<std::shared_ptr<domain::LineChecker>> ClaraApp::BuildCheckers(const infrastructure::ClaraConfig& config) {
    using namespace infrastructure::tools;
    std::vector<std::shared_ptr<domain::LineChecker>> checkers;
    checkers.push_back(std::make_shared<ChktexChecker>());
    checkers.push_back(std::make_shared<ValeChecker>());
    checkers.push_back(std::make_shared<LatexindentChecker>());
    if (config.enableCodespell) {
        checkers.push_back(std::make_shared<CodespellChecker>());
    }
    checkers.push_back(std::make_shared<LanguageToolChecker>(
        infrastructure::ConfigLoader::GetEnvOr("LT_URL", kDefaultLanguageToolUrl),
        config.primaryLanguage,
        LanguageToolChecker::LoadRules(kLanguageToolRules)));
    return checkers;
}

std::shared_ptr<domain::SegmentReviewer> ClaraApp::BuildReviewer(const infrastructure::ClaraConfig& config) {
    const std::string prompt = infrastructure::PromptCatalog::GetClarityPrompt(config.primaryLanguage);
    int timeout = config.llm.timeoutSeconds.value_or(0);
    if (timeout <= 0) timeout = kDefaultLlmTimeoutSeconds;

    if (config.llm.provider == "ollama") {
        infrastructure::OllamaClient::Options options;
        options.temperature = config.llm.temperature;
        options.maxTokens = config.llm.maxTokens;
        options.timeoutSeconds = timeout;
        infrastructure::OllamaClient client(
            infrastructure::ConfigLoader::GetEnvOr("OLLAMA_URL", kDefaultOllamaUrl), options);
        return std::make_shared<infrastructure::OllamaReviewer>(std::move(client), config.llm.model, prompt);
    }

    if (config.llm.provider == "openai" || config.llm.provider == "lm-studio") {
        infrastructure::OpenAiReviewer::Options options;
        options.temperature = config.llm.temperature;
        options.maxTokens = config.llm.maxTokens;
        options.timeoutSeconds = timeout;
        std::string apiKey = infrastructure::ConfigLoader::GetEnvOr("OPENAI_API_KEY", "");
        if (!apiKey.empty()) options.apiKey = apiKey;
        std::string baseUrl = config.llm.apiUrl
            ? *config.llm.apiUrl
            : infrastructure::ConfigLoader::GetEnvOr("OPENAI_URL", kDefaultOpenAiUrl);
        return std::make_shared<infrastructure::OpenAiReviewer>(baseUrl, config.llm.model, prompt, options);
    }

    std::cerr << "[ClaraApp] Unknown LLM provider '" << config.llm.provider << "', skipping LLM review" << std::endl;
    return nullptr;
}

std::vector<std::string> ClaraApp::resolveFiles() const {
    if (!m_commandLine.files.empty()) {
        return m_commandLine.files;
    }
    infrastructure::DocumentScanner scanner(".", m_config.include, m_config.exclude);
    return scanner.scan();
}

int ClaraApp::Run() {
    const bool incremental = (m_commandLine.command == Command::ReviewAuto);

    application::ReviewOptions options;
    options.useCache = incremental && !m_commandLine.noCache;
    options.saveCache = incremental;
    options.runLlm = incremental ? !m_commandLine.fast : (m_commandLine.withLlm && !m_commandLine.fast);

    auto repository = std::make_shared<infrastructure::FileRepository>(".");
    std::unique_ptr<infrastructure::CacheStore> cacheStore;
    if (incremental) {
        cacheStore = std::make_unique<infrastructure::CacheStore>(m_config.cachePath);
    }

    application::ReviewService review(
        repository,
        BuildCheckers(m_config),
        std::make_shared<infrastructure::SegmentExtractor>(m_config.targetMaxChars, m_config.overlapSentences),
        options.runLlm ? BuildReviewer(m_config) : nullptr,
        std::move(cacheStore));

    application::ReviewOutcome outcome = review.run(resolveFiles(), options);

    application::SuppressionService suppressions(repository);
    const auto active = suppressions.apply(outcome.issues);
    if (active.size() < outcome.issues.size()) {
        std::cout << "[ClaraApp] " << (outcome.issues.size() - active.size()) << " issue(s) suppressed" << std::endl;
    }

    auto summary = application::ReportService::Summarize(active);
    auto report = application::ReportService::BuildReport(outcome.issues, summary);
    if (!application::ReportService::Write(report, m_commandLine.jsonOut)) {
        return 2;
    }
    return application::ReportService::ExitCode(summary, m_config.severityThreshold);
}

} // namespace clara::app
