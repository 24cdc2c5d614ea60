#include <algorithm>
#include <array>
#include <cmath>
#include <core/util/format.h>
#include <fmt/format.h>

namespace handover::core {

std::string FormatTimeLeft(double seconds) {
    if (!std::isfinite(seconds)) {
        return "-";
    }
    auto total = static_cast<std::int64_t>(std::llround(std::max(seconds, 0.0)));
    auto hours = total / 3600;
    auto minutes = (total % 3600) / 60;
    if (hours == 0 && minutes == 0) {
        return "Less than a minute";
    }
    const char* minute_label = minutes == 1 ? "minute" : "minutes";
    if (hours == 0) {
        return fmt::format("~ {} {}", minutes, minute_label);
    }
    const char* hour_label = hours == 1 ? "hour" : "hours";
    if (minutes > 0) {
        return fmt::format("~ {} {} and {} {}", hours, hour_label, minutes, minute_label);
    }
    return fmt::format("~ {} {}", hours, hour_label);
}

std::string FormatByteSize(std::int64_t bytes) {
    static constexpr std::array<const char*, 5> kUnits{"bytes", "KB", "MB", "GB", "TB"};
    if (bytes < 1000) {
        return fmt::format("{} {}", bytes, bytes == 1 ? "byte" : "bytes");
    }
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1000.0 && unit + 1 < kUnits.size()) {
        value /= 1000.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, kUnits[unit]);
}

std::string FormatTransferSpeed(double bytes_per_second) {
    if (!std::isfinite(bytes_per_second) || bytes_per_second <= 0) {
        return "";
    }
    return fmt::format("{}/s", FormatByteSize(static_cast<std::int64_t>(bytes_per_second)));
}

} // namespace handover::core
