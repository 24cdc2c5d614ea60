#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cli/cli_manager.h>
#include <core/channel/local_directory_channel.h>
#include <core/model.h>
#include <core/report/json_report_sink.h>
#include <core/transfer/migration_orchestrator.h>
#include <core/util/config.h>
#include <core/util/format.h>
#include <core/util/system.h>
#include <csignal>
#include <fmt/format.h>
#include <optional>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
namespace net = boost::asio;

using namespace handover::core;

namespace handover::cli {

namespace {

// Used when report generation is turned off
class DiscardReportSink : public ReportSink {
public:
    void RecordStart() override {}
    void RecordTotalSize(std::int64_t) override {}
    void RecordMigratedFile(const std::string&) override {}
    void RecordError(const std::string&) override {}
    void RecordEnd() override {}
};

// Stops the io_context once the run has ended, completed or not
net::awaitable<void> watchRun(net::io_context& ioc, MigrationOrchestrator& orchestrator) {
    net::steady_timer timer(ioc);
    while (orchestrator.phase() == RunPhase::kNotStarted || orchestrator.IsRunning()) {
        timer.expires_after(std::chrono::milliseconds(100));
        co_await timer.async_wait(net::use_awaitable);
    }
    ioc.stop();
}

// Forwards power supply changes to the run; gives up on machines that report none
net::awaitable<void> watchPower(net::io_context& ioc, MigrationOrchestrator& orchestrator) {
    net::steady_timer timer(ioc);
    std::optional<bool> last;
    for (;;) {
        auto connected = core::system::ExternalPowerConnected();
        if (!connected) {
            co_return;
        }
        if (connected != last) {
            spdlog::info("Power adapter {}", *connected ? "connected" : "disconnected");
            orchestrator.OnPowerStateChanged(*connected);
            last = connected;
        }
        timer.expires_after(std::chrono::seconds(5));
        co_await timer.async_wait(net::use_awaitable);
    }
}

} // namespace

CliManager::CliManager(CliOptions options)
    : options_(std::move(options))
    , terminal_(std::make_unique<Terminal>())
    , progress_display_(std::make_unique<ProgressDisplay>()) {}

CliManager::~CliManager() = default;

int CliManager::Run() {
    if (options_.show_help || !options_.command || *options_.command == "help") {
        handleShowHelp();
        return options_.show_help || options_.command ? 0 : 1;
    }

    const std::string& cmd = *options_.command;
    const auto& args = options_.command_args;
    try {
        if (cmd == "scan") {
            return handleScan(args);
        }
        if (cmd == "migrate") {
            if (args.size() != 2) {
                terminal_->PrintError("correct format: migrate <manifest> <destination>");
                return 1;
            }
            return handleMigrate(args[0], args[1]);
        }
    } catch (const std::exception& e) {
        spdlog::error("Command {} failed: {}", cmd, e.what());
        terminal_->PrintError(cmd + " failed: " + e.what());
        return 1;
    }

    terminal_->PrintError("unknown command: " + cmd);
    return 1;
}

int CliManager::handleScan(const std::vector<std::string>& args) {
    fs::path output = "manifest.json";
    auto type = MigrationOptionType::kAdvanced;
    std::vector<fs::path> paths;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "-o" || arg == "--output") {
            if (++i >= args.size()) {
                terminal_->PrintError("Missing manifest path");
                return 1;
            }
            output = args[i];
        } else if (arg == "-t" || arg == "--type") {
            if (++i >= args.size()) {
                terminal_->PrintError("Missing migration type");
                return 1;
            }
            auto parsed = MigrationOptionTypeFromString(args[i]);
            if (!parsed) {
                terminal_->PrintError("unknown migration type: " + args[i]);
                return 1;
            }
            type = *parsed;
        } else {
            paths.emplace_back(arg);
        }
    }

    if (paths.empty()) {
        terminal_->PrintError("No paths to scan.");
        return 1;
    }

    auto manifest = ScanPaths(paths, type);
    if (manifest.files.empty() && manifest.apps.empty()) {
        terminal_->PrintError("Nothing to migrate.");
        return 1;
    }
    SaveManifest(manifest, output);

    terminal_->PrintInfo(fmt::format("{} file items, {} app items, {} ({} files) written to {}",
                                     manifest.files.size(),
                                     manifest.apps.size(),
                                     FormatByteSize(manifest.total_size),
                                     manifest.total_files,
                                     output.string()));
    return 0;
}

int CliManager::handleMigrate(const fs::path& manifest_path, const fs::path& destination) {
    auto manifest = LoadManifest(manifest_path);
    LocalDirectoryChannel channel(destination);
    // With nothing pending a run still has to deliver the completion signal a failed
    // finalization left unsent
    if (manifest.PendingCount() == 0 && channel.ReadSession().value("completed", false)) {
        terminal_->PrintInfo("Every selected item of " + manifest_path.string()
                             + " was already migrated.");
        return 0;
    }

    std::unique_ptr<ReportSink> report_sink;
    fs::path report_file;
    if (settings.generate_report) {
        report_file = JsonReportSink::DefaultReportFile(settings.report_dir);
        report_sink = std::make_unique<JsonReportSink>(report_file,
                                                       settings.device_name,
                                                       destination.string());
    } else {
        report_sink = std::make_unique<DiscardReportSink>();
    }

    net::io_context ioc;
    MigrationOrchestrator orchestrator(ioc, channel, *report_sink, manifest);

    orchestrator.SetFeedbackCallback([this](Feedback&& message) {
        switch (message.type) {
        case FeedbackType::kProgressUpdated:
            progress_display_->UpdateProgress(message.payload<ProgressSnapshot>());
            break;
        case FeedbackType::kItemTransferred: {
            auto item = message.payload<feedback::ItemTransferred>();
            if (!item.success) {
                progress_display_->ClearProgress();
                terminal_->PrintError(item.path + ": " + item.error_message);
            }
            break;
        }
        default:
            break;
        }
    });

    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&orchestrator](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            spdlog::info("Received signal {}, cancelling migration", signal_number);
            orchestrator.Cancel();
        }
    });

    orchestrator.Start();
    // The destination is local, so the peer is ready right away
    orchestrator.OnPeerReady(true);
    net::co_spawn(ioc, watchRun(ioc, orchestrator), net::detached);
    net::co_spawn(ioc, watchPower(ioc, orchestrator), net::detached);

    ioc.run();
    progress_display_->Finish();

    // 保存发送标记，下次运行从断点继续
    SaveManifest(manifest, manifest_path);

    auto phase = orchestrator.phase();
    if (phase == RunPhase::kCompleted) {
        terminal_->PrintInfo("Migration completed into " + destination.string());
    } else {
        terminal_->PrintError(fmt::format("Migration ended in phase {}, {} items pending",
                                          RunPhaseToString(phase),
                                          manifest.PendingCount()));
    }
    if (!report_file.empty()) {
        terminal_->PrintInfo("Report written to " + report_file.string());
    }
    return phase == RunPhase::kCompleted ? 0 : 1;
}

void CliManager::handleShowHelp() {
    ArgumentParser::ShowHelp();
}

} // namespace handover::cli
