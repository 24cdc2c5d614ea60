#pragma once

#include <optional>
#include <string>
#include <vector>

namespace handover::cli {

struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> log_level;
    std::optional<std::string> command;
    std::vector<std::string> command_args;
    bool show_help = false;
};

class ArgumentParser {
public:
    ArgumentParser(int argc, char* argv[]);

    // 解析命令行参数，参数错误时抛出 std::invalid_argument
    CliOptions Parse();

    // 显示帮助信息
    static void ShowHelp();

private:
    int argc_;
    char** argv_;
    int i; // 当前解析的参数索引

    // 参数解析
    void parseOptions(const std::string& arg, CliOptions& options);
    void parseCommand(CliOptions& options);

    // 参数验证
    void validateOptions(const CliOptions& options);
};

} // namespace handover::cli
