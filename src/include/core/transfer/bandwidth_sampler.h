#pragma once

#include "progress_tracker.h"
#include "transfer_channel.h"
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace handover::core {

struct SamplerTiming {
    std::chrono::steady_clock::duration first_sample_delay;
    std::chrono::steady_clock::duration sample_interval;

    // Timing from the loaded settings
    static SamplerTiming FromSettings();
};

struct ThroughputSample {
    double bytes_per_second;
    double seconds_left;
    InterfaceType interface_type;
};

// remaining_bytes / throughput + max(0, remaining_files) * smoothed_rtt, never negative
double EstimateTimeLeft(std::int64_t remaining_bytes,
                        double bytes_per_second,
                        std::int64_t remaining_files,
                        double smoothed_rtt_seconds);

// Picks the path report of the active interface; empty when nothing usable was measured
std::optional<ThroughputSample> EvaluateReport(const DataTransferReport& report,
                                               std::optional<InterfaceType> active_interface,
                                               const ProgressTracker::Counters& counters);

/**
 * @brief Turns the channel's transport reports into an ETA.
 *
 * @details A one-shot timer is armed again only after the previous sample finished, so
 * report windows never overlap. A sample without usable data publishes nothing and the
 * next one is still scheduled. Must outlive the io_context's run.
 */
class BandwidthSampler {
public:
    BandwidthSampler(boost::asio::io_context& ioc,
                     TransferChannel& channel,
                     ProgressTracker& tracker,
                     SamplerTiming timing);
    ~BandwidthSampler();
    BandwidthSampler(const BandwidthSampler&) = delete;
    BandwidthSampler& operator=(const BandwidthSampler&) = delete;

    // Opens a report window and schedules the first sample
    void Start();

    // Cancels the pending sample
    void Stop();

    // Drops the report window; the next firing publishes nothing and ends sampling
    void ClearWindow();

    bool IsRunning() const { return running_; }
    std::size_t samples_taken() const { return samples_taken_; }

private:
    boost::asio::io_context& ioc_;
    TransferChannel& channel_;
    ProgressTracker& tracker_;
    SamplerTiming timing_;
    boost::asio::steady_timer timer_;
    bool running_{false};
    bool window_open_{false};
    std::uint64_t generation_{0};
    std::size_t samples_taken_{0};

    boost::asio::awaitable<void> run(std::uint64_t generation);

    // false when there was no window to sample or the sampler was stopped meanwhile
    boost::asio::awaitable<bool> sample(std::uint64_t generation);
};

} // namespace handover::core
