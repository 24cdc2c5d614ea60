#include <algorithm>
#include <cctype>
#include <cli/argument_parser.h>
#include <cli/cli_manager.h>
#include <core/constant/path.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <iostream>
#include <string>

using namespace handover;
using namespace handover::core;

int main(int argc, char* argv[]) {
    cli::CliOptions options;
    try {
        options = cli::ArgumentParser(argc, argv).Parse();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        cli::ArgumentParser::ShowHelp();
        return 1;
    }

    // Info logs would tear up the progress line of a migration
    auto console_level = options.command == "migrate" ? Logger::Level::warn : Logger::Level::info;
    Logger logger(
#ifdef HANDOVER_DEBUG
        Logger::Level::debug,
#else
        Logger::Level::info,
#endif
        path::kLogDir,
        console_level);
    if (options.log_level) {
        std::string level = *options.log_level;
        std::transform(level.begin(), level.end(), level.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        logger.set_log_level(spdlog::level::from_str(level));
    }

    if (options.config_path) {
        InitConfig(*options.config_path);
    } else {
        InitConfig();
    }

    cli::CliManager manager(std::move(options));
    int exit_code = manager.Run();

    SaveConfig();
    return exit_code;
}
