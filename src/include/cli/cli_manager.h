#pragma once

#include "argument_parser.h"
#include "progress_display.h"
#include "terminal.h"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace handover::cli {

class CliManager {
public:
    explicit CliManager(CliOptions options);
    ~CliManager();

    // Runs the parsed command, returns the process exit code
    int Run();

private:
    CliOptions options_;
    std::unique_ptr<Terminal> terminal_;
    std::unique_ptr<ProgressDisplay> progress_display_;

    // 命令实现
    int handleScan(const std::vector<std::string>& args);
    int handleMigrate(const std::filesystem::path& manifest_path,
                      const std::filesystem::path& destination);
    void handleShowHelp();
};

} // namespace handover::cli
