#pragma once

#include "bandwidth_sampler.h"
#include "progress_tracker.h"
#include "report_sink.h"
#include "transfer_channel.h"
#include <atomic>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <core/model.h>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

/**
 * @brief 迁移传输编排器
 *
 * @details Sequences one migration run over an established TransferChannel:
 * NotStarted -> Preparing -> SendingFiles -> SendingApps -> Finalizing -> Completed,
 * with Aborted reachable from any state through Cancel().
 *
 * Items are sent strictly one after another by a single coroutine on the io_context.
 * A failed item is left unsent and the run moves on. A failed completion signal leaves
 * the run in Finalizing; a later OnPeerReady(true) starts a new run over the same
 * manifest, skipping what was already sent.
 *
 * Progress is published through the feedback callback (kProgressUpdated carries the
 * full ProgressSnapshot) and can be polled with Snapshot().
 *
 * @note The orchestrator, the manifest, the channel and the report sink must outlive the
 * io_context's run. Not copyable.
 */
namespace handover::core {

class MigrationOrchestrator {
public:
    MigrationOrchestrator(boost::asio::io_context& ioc,
                          TransferChannel& channel,
                          ReportSink& report_sink,
                          Manifest& manifest,
                          SamplerTiming timing = SamplerTiming::FromSettings(),
                          FeedbackCallback callback = nullptr);
    ~MigrationOrchestrator();
    MigrationOrchestrator(const MigrationOrchestrator&) = delete;
    MigrationOrchestrator& operator=(const MigrationOrchestrator&) = delete;

    // Feedback comes from the io_context thread and from whatever thread the channel reports
    // progress on, one call at a time. The callback must not call SetFeedbackCallback.
    void SetFeedbackCallback(FeedbackCallback callback);

    // Invoked once the peer confirmed completion (sound, window raise, ...)
    void SetRunFinishedHook(std::function<void()>&& hook);

    // Subscribes to the channel's progress notifications and announces the run size
    void Start();

    void OnPeerReady(bool ready);

    void OnPowerStateChanged(bool connected);

    // Stops dispatching after the item in flight
    void Cancel();

    RunPhase phase() const { return tracker_.Snapshot().phase; }
    ProgressSnapshot Snapshot() const { return tracker_.Snapshot(); }
    ProgressTracker::Counters counters() const { return tracker_.counters(); }
    bool IsRunning() const { return running_; }
    std::optional<std::chrono::system_clock::time_point> start_time() const { return start_time_; }

private:
    boost::asio::io_context& ioc_;
    TransferChannel& channel_;
    ReportSink& report_sink_;
    Manifest& manifest_;
    ProgressTracker tracker_;
    BandwidthSampler sampler_;
    std::mutex feedback_mutex_;
    FeedbackCallback callback_;
    std::function<void()> run_finished_hook_;

    std::atomic<bool> cancel_requested_{false};
    bool running_{false};
    bool announcing_size_{false};
    bool start_after_announce_{false};
    std::optional<std::chrono::system_clock::time_point> start_time_;
    std::size_t items_sent_{0};
    std::size_t items_failed_{0};

    // 协程任务：向对端通告迁移总大小
    boost::asio::awaitable<void> announceMigrationSize();

    // 协程任务：完整的一次迁移
    boost::asio::awaitable<void> run();

    // Sends the eligible items of one list; false when cancellation was observed
    boost::asio::awaitable<bool> sendItems(std::vector<TransferItem>& items, bool report_to_sink);

    boost::asio::awaitable<void> finalize();

    void handlePeerReady();
    bool canStartRun() const;
    void startRun();
    void complete();
    void abort();
    void setPhase(RunPhase phase);

    bool cancelRequested() const { return cancel_requested_.load(); }

    void feedback(Feedback&& feedback) {
        std::lock_guard<std::mutex> lock(feedback_mutex_);
        if (callback_) {
            callback_(std::move(feedback));
        }
    }
};

} // namespace handover::core
