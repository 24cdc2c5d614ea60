#include <utility>
#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cmath>
#include <core/constant/migration.h>
#include <core/transfer/bandwidth_sampler.h>
#include <core/util/config.h>
#include <core/util/format.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;

namespace handover::core {

SamplerTiming SamplerTiming::FromSettings() {
    return SamplerTiming{
        .first_sample_delay = settings.first_sample_delay,
        .sample_interval = settings.sample_interval,
    };
}

double EstimateTimeLeft(std::int64_t remaining_bytes,
                        double bytes_per_second,
                        std::int64_t remaining_files,
                        double smoothed_rtt_seconds) {
    double seconds = 0.0;
    if (bytes_per_second > 0) {
        seconds += static_cast<double>(std::max<std::int64_t>(0, remaining_bytes))
                   / bytes_per_second;
    }
    seconds += static_cast<double>(std::max<std::int64_t>(0, remaining_files))
               * std::max(0.0, smoothed_rtt_seconds);
    return seconds;
}

std::optional<ThroughputSample> EvaluateReport(const DataTransferReport& report,
                                               std::optional<InterfaceType> active_interface,
                                               const ProgressTracker::Counters& counters) {
    if (!active_interface) {
        return std::nullopt;
    }
    auto it = std::find_if(report.path_reports.begin(),
                           report.path_reports.end(),
                           [&](const PathReport& path) {
                               return path.interface_type == *active_interface;
                           });
    if (it == report.path_reports.end()) {
        return std::nullopt;
    }
    double duration = report.duration.count();
    if (!std::isfinite(duration) || duration <= 0 || it->sent_transport_bytes <= 0) {
        return std::nullopt;
    }
    double bytes_per_second = static_cast<double>(it->sent_transport_bytes) / duration;
    double seconds_left = EstimateTimeLeft(counters.total_size - counters.bytes_sent,
                                           bytes_per_second,
                                           counters.total_files - counters.files_sent,
                                           it->smoothed_rtt.count());
    return ThroughputSample{
        .bytes_per_second = bytes_per_second,
        .seconds_left = seconds_left,
        .interface_type = it->interface_type,
    };
}

BandwidthSampler::BandwidthSampler(net::io_context& ioc,
                                   TransferChannel& channel,
                                   ProgressTracker& tracker,
                                   SamplerTiming timing)
    : ioc_(ioc)
    , channel_(channel)
    , tracker_(tracker)
    , timing_(timing)
    , timer_(ioc) {}

BandwidthSampler::~BandwidthSampler() {
    Stop();
}

void BandwidthSampler::Start() {
    // A sampler left running by an earlier run is restarted with a fresh window
    Stop();
    running_ = true;
    window_open_ = true;
    channel_.StartDataTransferReport();
    net::co_spawn(ioc_, run(++generation_), net::detached);
    spdlog::debug("Bandwidth sampler started");
}

void BandwidthSampler::Stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    ++generation_;
    timer_.cancel();
    spdlog::debug("Bandwidth sampler stopped after {} samples", samples_taken_);
}

void BandwidthSampler::ClearWindow() {
    window_open_ = false;
}

net::awaitable<void> BandwidthSampler::run(std::uint64_t generation) {
    auto delay = timing_.first_sample_delay;
    while (running_ && generation == generation_) {
        timer_.expires_after(delay);
        boost::system::error_code ec;
        co_await timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
        if (ec || !running_ || generation != generation_) {
            co_return;
        }
        if (!co_await sample(generation)) {
            spdlog::debug("No report window open, bandwidth sampling ends");
            if (generation == generation_) {
                running_ = false;
            }
            co_return;
        }
        delay = timing_.sample_interval;
    }
}

net::awaitable<bool> BandwidthSampler::sample(std::uint64_t generation) {
    if (!window_open_) {
        co_return false;
    }
    ++samples_taken_;

    std::optional<DataTransferReport> report;
    try {
        report = co_await channel_.CollectDataTransferReport();
    } catch (const std::exception& e) {
        spdlog::warn("Failed to collect data transfer report: {}", e.what());
    }
    // Stop() or ClearWindow() may have run while the collection was pending
    if (!running_ || generation != generation_ || !window_open_) {
        co_return false;
    }

    if (report) {
        auto active_interface = channel_.CurrentInterface();
        if (auto sample = EvaluateReport(*report, active_interface, tracker_.counters()); sample) {
            spdlog::debug("Bandwidth sample: {:.0f} B/s, {:.1f}s left",
                          sample->bytes_per_second,
                          sample->seconds_left);
            tracker_.SetEstimate(fmt::format("{}{}",
                                             migration::kEtaPrefix,
                                             FormatTimeLeft(sample->seconds_left)),
                                 FormatTransferSpeed(sample->bytes_per_second),
                                 std::string(InterfaceLabel(sample->interface_type)));
        } else {
            spdlog::debug("Bandwidth sample skipped, no usable report for the active path");
        }
    } else {
        spdlog::debug("Bandwidth sample skipped, no report available");
    }

    channel_.StartDataTransferReport();
    co_return true;
}

} // namespace handover::core
