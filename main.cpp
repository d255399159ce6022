#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "app/ClaraApp.hpp"
#include "app/CommandLine.hpp"

namespace {
constexpr int kUsageError = 64;
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::string error;
    auto commandLine = clara::app::CommandLine::Parse(args, error);
    if (!commandLine) {
        std::cerr << "clara: " << error << "\n\n" << clara::app::CommandLine::Usage();
        return kUsageError;
    }
    if (commandLine->showHelp) {
        std::cout << clara::app::CommandLine::Usage();
        return 0;
    }

    try {
        clara::app::ClaraApp app(std::move(*commandLine));
        return app.Run();
    } catch (const std::exception& e) {
        std::cerr << "[clara] Fatal: " << e.what() << std::endl;
        return 2;
    }
}
