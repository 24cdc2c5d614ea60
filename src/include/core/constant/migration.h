#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace handover::core {

namespace migration {

constexpr size_t kDefaultChunkSize = 1 * 1024 * 1024; // 1 MB

// Counted as sent the moment a run starts, so a resumed run never shows 0%
constexpr std::int64_t kStartedSentinelBytes = 1;

constexpr double kMaxUnconfirmedFraction = 0.99;
constexpr std::int64_t kMaxUnconfirmedPercentage = 99;

constexpr auto kDefaultFirstSampleDelay = std::chrono::seconds(10);
constexpr auto kDefaultSampleInterval = std::chrono::seconds(60);

// Default flag telling the peer it may skip the post-migration reboot
constexpr std::string_view kSkipRebootDefaultsKey = "skipDeviceReboot";

constexpr std::string_view kEtaPrefix = "Estimated time left: ";
constexpr std::string_view kEtaCalculating = "calculating...";

} // namespace migration

} // namespace handover::core
