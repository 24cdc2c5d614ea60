#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace handover::core {

namespace system {

std::string Hostname();

// Whether a mains/USB supply is online; empty when the machine reports no power supplies
std::optional<bool> ExternalPowerConnected(
    const std::filesystem::path& power_supply_dir = "/sys/class/power_supply");

} // namespace system

} // namespace handover::core
