#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <core/constant/migration.h>
#include <core/transfer/migration_orchestrator.h>
#include <exception>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;

namespace handover::core {

MigrationOrchestrator::MigrationOrchestrator(net::io_context& ioc,
                                             TransferChannel& channel,
                                             ReportSink& report_sink,
                                             Manifest& manifest,
                                             SamplerTiming timing,
                                             FeedbackCallback callback)
    : ioc_(ioc)
    , channel_(channel)
    , report_sink_(report_sink)
    , manifest_(manifest)
    , tracker_([this](const ProgressSnapshot& snapshot) {
        feedback(Feedback{.type = FeedbackType::kProgressUpdated, .data = snapshot});
    })
    , sampler_(ioc, channel, tracker_, timing)
    , callback_(std::move(callback)) {}

MigrationOrchestrator::~MigrationOrchestrator() {
    channel_.SetProgressHandlers(nullptr, nullptr);
    sampler_.Stop();
}

void MigrationOrchestrator::SetFeedbackCallback(FeedbackCallback callback) {
    std::lock_guard<std::mutex> lock(feedback_mutex_);
    callback_ = std::move(callback);
}

void MigrationOrchestrator::SetRunFinishedHook(std::function<void()>&& hook) {
    run_finished_hook_ = std::move(hook);
}

void MigrationOrchestrator::Start() {
    channel_.SetProgressHandlers([this](std::int64_t bytes) { tracker_.AddBytesSent(bytes); },
                                 [this](std::int64_t files) { tracker_.AddFilesSent(files); });
    announcing_size_ = true;
    net::co_spawn(ioc_, announceMigrationSize(), net::detached);
    spdlog::debug("MigrationOrchestrator started");
}

void MigrationOrchestrator::OnPeerReady(bool ready) {
    if (!ready) {
        spdlog::debug("Peer reported not ready");
        return;
    }
    net::post(ioc_, [this]() { handlePeerReady(); });
}

void MigrationOrchestrator::OnPowerStateChanged(bool connected) {
    tracker_.SetPowerConnected(connected);
}

void MigrationOrchestrator::Cancel() {
    if (cancel_requested_.exchange(true)) {
        return;
    }
    spdlog::info("Migration cancellation requested");
    net::post(ioc_, [this]() {
        // A running task observes the flag between items
        if (running_ || IsTerminal(phase())) {
            return;
        }
        abort();
    });
}

net::awaitable<void> MigrationOrchestrator::announceMigrationSize() {
    try {
        co_await channel_.SendMigrationSize(manifest_.total_size);
        spdlog::info("Migration size announced: {} bytes", manifest_.total_size);
    } catch (const std::exception& e) {
        spdlog::error("Failed to announce migration size: {}", e.what());
    }
    announcing_size_ = false;
    if (start_after_announce_) {
        start_after_announce_ = false;
        if (canStartRun()) {
            startRun();
        }
    }
}

void MigrationOrchestrator::handlePeerReady() {
    if (!canStartRun()) {
        spdlog::info("Peer ready ignored, migration is {}", RunPhaseToString(phase()));
        return;
    }
    if (announcing_size_) {
        spdlog::debug("Peer ready while the migration size is in flight, starting afterwards");
        start_after_announce_ = true;
        return;
    }
    startRun();
}

bool MigrationOrchestrator::canStartRun() const {
    if (running_ || start_after_announce_ || cancelRequested()) {
        return false;
    }
    auto current = phase();
    return current == RunPhase::kNotStarted || current == RunPhase::kFinalizing;
}

void MigrationOrchestrator::startRun() {
    running_ = true;
    net::co_spawn(ioc_, run(), [this](std::exception_ptr p) {
        running_ = false;
        if (p) {
            try {
                std::rethrow_exception(p);
            } catch (const std::exception& e) {
                spdlog::error("Migration task failed: {}", e.what());
            }
        }
        if (cancelRequested() && !IsTerminal(phase())) {
            abort();
        }
    });
}

net::awaitable<void> MigrationOrchestrator::run() {
    spdlog::info("Starting migration: {} file items, {} app items, {} bytes",
                 manifest_.files.size(),
                 manifest_.apps.size(),
                 manifest_.total_size);
    items_sent_ = 0;
    items_failed_ = 0;
    setPhase(RunPhase::kPreparing);
    tracker_.BeginRun(manifest_.total_size,
                      manifest_.total_files,
                      manifest_.ResumeOffset(),
                      fmt::format("{}{}", migration::kEtaPrefix, migration::kEtaCalculating));
    tracker_.SetInterfaceLabel(std::string(InterfaceLabel(channel_.CurrentInterface())));
    report_sink_.RecordStart();
    report_sink_.RecordTotalSize(manifest_.total_size);

    if (manifest_.preferences.empty() && !manifest_.MigratesPreferences()) {
        try {
            co_await channel_.SendDefaultFlag(std::string(migration::kSkipRebootDefaultsKey), true);
        } catch (const std::exception& e) {
            spdlog::error("Delivery of default value failed: {}", e.what());
        }
    }
    if (cancelRequested()) {
        abort();
        co_return;
    }

    start_time_ = std::chrono::system_clock::now();
    setPhase(RunPhase::kSendingFiles);
    sampler_.Start();

    spdlog::info("Starting migration of files");
    if (!co_await sendItems(manifest_.files, true)) {
        abort();
        co_return;
    }
    spdlog::info("Files migration complete");

    setPhase(RunPhase::kSendingApps);
    spdlog::info("Starting migration of apps");
    if (!co_await sendItems(manifest_.apps, false)) {
        abort();
        co_return;
    }
    spdlog::info("Apps migration complete");

    if (cancelRequested()) {
        abort();
        co_return;
    }
    co_await finalize();
}

net::awaitable<bool> MigrationOrchestrator::sendItems(std::vector<TransferItem>& items,
                                                      bool report_to_sink) {
    for (auto& item : items) {
        if (cancelRequested()) {
            spdlog::info("Migration cancelled before {}", item.source_path);
            co_return false;
        }
        if (!item.IsEligible()) {
            continue;
        }

        auto kind = ItemKindToString(item.kind);
        spdlog::info("Sending {} {}", kind, item.source_path);
        bool failed = false;
        std::string error_message;
        try {
            co_await channel_.SendFile(item);
        } catch (const std::exception& e) {
            failed = true;
            error_message = e.what();
        }

        if (!failed) {
            item.sent = true;
            ++items_sent_;
            spdlog::info("{} sent: {}", kind, item.source_path);
            if (report_to_sink) {
                report_sink_.RecordMigratedFile(item.source_path);
            }
            feedback(Feedback{.type = FeedbackType::kItemTransferred,
                              .data = feedback::ItemTransferred{
                                  .path = item.source_path,
                                  .kind = item.kind,
                              }});
        } else {
            ++items_failed_;
            auto message = fmt::format("Failed to send {} {}: \"{}\"",
                                       kind,
                                       item.source_path,
                                       error_message);
            spdlog::error(message);
            if (report_to_sink) {
                report_sink_.RecordError(message);
            }
            feedback(Feedback{.type = FeedbackType::kItemTransferred,
                              .data = feedback::ItemTransferred{
                                  .path = item.source_path,
                                  .kind = item.kind,
                                  .success = false,
                                  .error_message = error_message,
                              }});
        }
    }
    co_return true;
}

net::awaitable<void> MigrationOrchestrator::finalize() {
    setPhase(RunPhase::kFinalizing);
    sampler_.ClearWindow();
    channel_.ClearDataTransferReport();

    bool confirmed = true;
    try {
        co_await channel_.SendMigrationCompleted();
    } catch (const std::exception& e) {
        confirmed = false;
        spdlog::error("Send migration completion failed: {}", e.what());
    }
    if (confirmed) {
        complete();
    }
}

void MigrationOrchestrator::complete() {
    tracker_.MarkCompleted();
    sampler_.Stop();
    report_sink_.RecordEnd();
    setPhase(RunPhase::kCompleted);
    spdlog::info("Migration completed: {} items sent, {} failed", items_sent_, items_failed_);
    feedback(Feedback{.type = FeedbackType::kRunFinished,
                      .data = feedback::RunFinished{
                          .items_sent = items_sent_,
                          .items_failed = items_failed_,
                      }});
    if (run_finished_hook_) {
        run_finished_hook_();
    }
}

void MigrationOrchestrator::abort() {
    sampler_.Stop();
    channel_.ClearDataTransferReport();
    start_time_.reset();
    setPhase(RunPhase::kAborted);
    spdlog::info("Migration aborted: {} items sent, {} failed", items_sent_, items_failed_);
}

void MigrationOrchestrator::setPhase(RunPhase phase) {
    spdlog::debug("Migration phase: {}", RunPhaseToString(phase));
    tracker_.SetPhase(phase);
    feedback(Feedback{.type = FeedbackType::kPhaseChanged,
                      .data = feedback::PhaseChanged{.phase = phase}});
}

} // namespace handover::core
