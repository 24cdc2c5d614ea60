#include <algorithm>
#include <core/constant/migration.h>
#include <core/transfer/progress_tracker.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace handover::core {

double CompletionFraction(std::int64_t bytes_sent, std::int64_t total_size) {
    if (total_size <= 0) {
        return 0.0;
    }
    return std::min(static_cast<double>(bytes_sent) / static_cast<double>(total_size),
                    migration::kMaxUnconfirmedFraction);
}

std::string PercentageLabel(std::int64_t bytes_sent, std::int64_t total_size) {
    if (total_size <= 0) {
        return "0%";
    }
    auto percentage = std::min(migration::kMaxUnconfirmedPercentage,
                               std::max<std::int64_t>(0, bytes_sent) * 100 / total_size);
    return fmt::format("{}%", percentage);
}

ProgressTracker::ProgressTracker(PublishCallback callback)
    : callback_(std::move(callback)) {}

void ProgressTracker::SetPublishCallback(PublishCallback callback) {
    std::lock_guard<std::mutex> publish_lock(publish_mutex_);
    callback_ = std::move(callback);
}

template<typename Mutation>
void ProgressTracker::update(Mutation&& mutation) {
    std::lock_guard<std::mutex> publish_lock(publish_mutex_);
    ProgressSnapshot published;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        mutation();
        published = snapshot_;
    }
    if (callback_) {
        callback_(published);
    }
}

void ProgressTracker::refreshProgress() {
    if (completed_) {
        return;
    }
    snapshot_.fraction = CompletionFraction(counters_.bytes_sent, counters_.total_size);
    snapshot_.percentage = PercentageLabel(counters_.bytes_sent, counters_.total_size);
}

void ProgressTracker::BeginRun(std::int64_t total_size,
                               std::int64_t total_files,
                               std::int64_t resume_offset,
                               std::string eta) {
    update([&] {
        counters_ = Counters{
            .bytes_sent = resume_offset,
            .files_sent = 0,
            .total_size = total_size,
            .total_files = total_files,
        };
        completed_ = false;
        snapshot_.eta = std::move(eta);
        snapshot_.transfer_speed.clear();
        refreshProgress();
    });
    spdlog::debug("Progress tracking started: {}/{} bytes", resume_offset, total_size);
}

void ProgressTracker::AddBytesSent(std::int64_t bytes) {
    if (bytes <= 0) {
        return;
    }
    update([&] {
        // A source that grew since the scan must not push the counter past the run size
        auto ceiling = std::max(counters_.bytes_sent,
                                counters_.total_size + migration::kStartedSentinelBytes);
        counters_.bytes_sent = std::min(counters_.bytes_sent + bytes, ceiling);
        refreshProgress();
    });
}

void ProgressTracker::AddFilesSent(std::int64_t files) {
    if (files <= 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.files_sent += files;
}

void ProgressTracker::MarkCompleted() {
    update([&] {
        completed_ = true;
        snapshot_.fraction = 1.0;
        snapshot_.percentage = "100%";
        snapshot_.eta.clear();
        snapshot_.transfer_speed.clear();
    });
}

void ProgressTracker::SetEstimate(std::string eta,
                                  std::string transfer_speed,
                                  std::string interface_label) {
    update([&] {
        if (completed_) {
            return;
        }
        snapshot_.eta = std::move(eta);
        snapshot_.transfer_speed = std::move(transfer_speed);
        snapshot_.interface_label = std::move(interface_label);
    });
}

void ProgressTracker::SetInterfaceLabel(std::string interface_label) {
    update([&] { snapshot_.interface_label = std::move(interface_label); });
}

void ProgressTracker::SetPowerConnected(bool connected) {
    update([&] { snapshot_.power_connected = connected; });
}

void ProgressTracker::SetPhase(RunPhase phase) {
    update([&] { snapshot_.phase = phase; });
}

ProgressSnapshot ProgressTracker::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

ProgressTracker::Counters ProgressTracker::counters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

bool ProgressTracker::completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

} // namespace handover::core
