#pragma once

#include <core/model/progress_snapshot.h>
#include <core/model/run_phase.h>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace handover::core {

// min(bytes_sent / total_size, 0.99); 0 when total_size is 0
double CompletionFraction(std::int64_t bytes_sent, std::int64_t total_size);

// "min(99, floor(bytes_sent * 100 / total_size))%"; "0%" when total_size is 0
std::string PercentageLabel(std::int64_t bytes_sent, std::int64_t total_size);

/**
 * @brief Owner of the byte/file counters of a run and of the snapshot published from them.
 *
 * @details Every method may be called from any thread. Mutations are serialized and each
 * resulting snapshot is handed to the publish callback in mutation order. The callback
 * may read the tracker but must not mutate it.
 */
class ProgressTracker {
public:
    using PublishCallback = std::function<void(const ProgressSnapshot&)>;

    struct Counters {
        std::int64_t bytes_sent = 0;
        std::int64_t files_sent = 0;
        std::int64_t total_size = 0;
        std::int64_t total_files = 0;
    };

    explicit ProgressTracker(PublishCallback callback = nullptr);
    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    void SetPublishCallback(PublishCallback callback);

    // Resets the counters for a new run, bytes starting at resume_offset
    void BeginRun(std::int64_t total_size,
                  std::int64_t total_files,
                  std::int64_t resume_offset,
                  std::string eta);

    void AddBytesSent(std::int64_t bytes);
    void AddFilesSent(std::int64_t files);

    // Freezes the snapshot at 100%; later byte counts no longer move it
    void MarkCompleted();

    void SetEstimate(std::string eta, std::string transfer_speed, std::string interface_label);
    void SetInterfaceLabel(std::string interface_label);
    void SetPowerConnected(bool connected);
    void SetPhase(RunPhase phase);

    ProgressSnapshot Snapshot() const;
    Counters counters() const;
    bool completed() const;

private:
    template<typename Mutation>
    void update(Mutation&& mutation);

    void refreshProgress();

    mutable std::mutex mutex_;
    std::mutex publish_mutex_;
    PublishCallback callback_;
    Counters counters_;
    ProgressSnapshot snapshot_;
    bool completed_{false};
};

} // namespace handover::core
