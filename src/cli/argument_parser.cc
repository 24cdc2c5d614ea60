#include <algorithm>
#include <cctype>
#include <cli/argument_parser.h>
#include <iostream>
#include <stdexcept>

namespace handover::cli {

ArgumentParser::ArgumentParser(int argc, char* argv[])
    : argc_(argc)
    , argv_(argv)
    , i(1) {}

CliOptions ArgumentParser::Parse() {
    CliOptions options;

    // 解析选项
    while (i < argc_) {
        std::string arg = argv_[i];

        if (arg.empty() || arg[0] != '-') {
            // 遇到非选项参数，开始解析命令
            parseCommand(options);
            break;
        }

        parseOptions(arg, options);
        i++;
    }

    validateOptions(options);
    return options;
}

void ArgumentParser::parseOptions(const std::string& arg, CliOptions& options) {
    if (arg == "-c" || arg == "--config") {
        if (++i >= argc_) {
            throw std::invalid_argument("Missing config path");
        }
        options.config_path = argv_[i];
    } else if (arg == "-l" || arg == "--log-level") {
        if (++i >= argc_) {
            throw std::invalid_argument("Missing log level");
        }
        options.log_level = argv_[i];
    } else if (arg == "-h" || arg == "--help") {
        options.show_help = true;
    } else {
        throw std::invalid_argument("Unknown option: " + arg);
    }
}

void ArgumentParser::parseCommand(CliOptions& options) {
    if (i >= argc_) {
        return;
    }

    options.command = argv_[i++];

    // 收集命令参数
    while (i < argc_) {
        options.command_args.push_back(argv_[i++]);
    }
}

void ArgumentParser::validateOptions(const CliOptions& options) {
    if (options.log_level) {
        std::string level = *options.log_level;
        std::transform(level.begin(), level.end(), level.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (level != "debug" && level != "info" && level != "warning" && level != "error") {
            throw std::invalid_argument("Invalid log level: " + *options.log_level);
        }
    }
}

void ArgumentParser::ShowHelp() {
    std::cout << "Usage: handover [options] <command> [args...]\n\n"
              << "Options:\n"
              << "  -c, --config PATH    Set config file path\n"
              << "  -l, --log-level LVL  Set log level (debug|info|warning|error)\n"
              << "  -h, --help           Show this help message\n\n"
              << "Commands:\n"
              << "  scan [-o MANIFEST] [-t TYPE] PATH...\n"
              << "                       Build a migration manifest from PATHs\n"
              << "                       (TYPE: lite|complete|advanced|none, default advanced)\n"
              << "  migrate MANIFEST DEST\n"
              << "                       Migrate the pending items of MANIFEST into DEST\n"
              << "  help                 Show help message\n";
}

} // namespace handover::cli
