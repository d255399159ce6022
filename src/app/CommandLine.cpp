/**
 * @file CommandLine.cpp
 * @brief Implementation of CommandLine.
 */

#include "app/CommandLine.hpp"

namespace clara::app {

namespace {
bool IsOption(const std::string& arg) {
    return arg.size() > 2 && arg.compare(0, 2, "--") == 0;
}
}

std::string CommandLine::Usage() {
    return
        "Usage: clara <command> [options]\n"
        "\n"
        "Commands:\n"
        "  review-auto   Incremental review: only changed lines and new segments are checked\n"
        "  check         Full check without the review cache\n"
        "\n"
        "Options:\n"
        "  --files <f...>    Documents to review (default: discovered via clara.json paths)\n"
        "  --json <path>     Write the JSON report to a file instead of stdout\n"
        "  --config <path>   Configuration file (default: clara.json)\n"
        "  --with-llm        Run the LLM reviewer during check\n"
        "  --fast            Skip the LLM reviewer\n"
        "  --no-cache        Ignore the existing review cache (review-auto)\n"
        "  --help            Show this help\n";
}

std::optional<CommandLine> CommandLine::Parse(const std::vector<std::string>& args, std::string& error) {
    CommandLine cl;
    bool haveCommand = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            cl.showHelp = true;
        } else if (arg == "--files") {
            while (i + 1 < args.size() && !IsOption(args[i + 1])) {
                cl.files.push_back(args[++i]);
            }
        } else if (arg == "--json" || arg == "--config") {
            if (i + 1 >= args.size() || IsOption(args[i + 1])) {
                error = "Missing value for " + arg;
                return std::nullopt;
            }
            if (arg == "--json") {
                cl.jsonOut = args[++i];
            } else {
                cl.configPath = args[++i];
            }
        } else if (arg == "--with-llm") {
            cl.withLlm = true;
        } else if (arg == "--fast") {
            cl.fast = true;
        } else if (arg == "--no-cache") {
            cl.noCache = true;
        } else if (IsOption(arg)) {
            error = "Unknown option: " + arg;
            return std::nullopt;
        } else if (!haveCommand) {
            if (arg == "review-auto") {
                cl.command = Command::ReviewAuto;
            } else if (arg == "check") {
                cl.command = Command::Check;
            } else {
                error = "Unknown command: " + arg;
                return std::nullopt;
            }
            haveCommand = true;
        } else {
            error = "Unexpected argument: " + arg;
            return std::nullopt;
        }
    }

    if (!haveCommand && !cl.showHelp) {
        error = "Missing command";
        return std::nullopt;
    }
    return cl;
}

} // namespace clara::app
