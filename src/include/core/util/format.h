#pragma once

#include <cstdint>
#include <string>

namespace handover::core {

// e.g. "~ 3 hours and 5 minutes", "Less than a minute", "-" for non-finite input
std::string FormatTimeLeft(double seconds);

// e.g. "12.5 MB/s"
std::string FormatTransferSpeed(double bytes_per_second);

// e.g. "1.2 GB", decimal units like the peer's size labels
std::string FormatByteSize(std::int64_t bytes);

} // namespace handover::core
