#include <boost/asio/ip/host_name.hpp>
#include <core/util/system.h>
#include <fstream>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace handover::core {

namespace system {

std::string Hostname() {
    std::string hostname;
    try {
        hostname = boost::asio::ip::host_name();
    } catch (const std::exception& e) {
        spdlog::error("Failed to get host name: {}", e.what());
        return "unknown";
    }
    if (hostname.ends_with(".local")) {
        hostname = hostname.substr(0, hostname.size() - 6);
    } else if (hostname.ends_with(".localdomain")) {
        hostname = hostname.substr(0, hostname.size() - 12);
    }
    return hostname;
}

namespace {

std::string readFirstLine(const fs::path& file) {
    std::ifstream ifs(file);
    std::string line;
    std::getline(ifs, line);
    return line;
}

} // namespace

std::optional<bool> ExternalPowerConnected(const fs::path& power_supply_dir) {
#if defined(__linux__)
    std::error_code ec;
    fs::directory_iterator it(power_supply_dir, ec);
    if (ec) {
        spdlog::debug("No power supply information in {}: {}",
                      power_supply_dir.string(),
                      ec.message());
        return std::nullopt;
    }

    bool has_external_supply = false;
    bool has_battery = false;
    for (const auto& entry : it) {
        auto type = readFirstLine(entry.path() / "type");
        if (type == "Battery") {
            has_battery = true;
        } else if (type == "Mains" || type == "USB") {
            has_external_supply = true;
            if (readFirstLine(entry.path() / "online") == "1") {
                return true;
            }
        }
    }
    if (has_external_supply || has_battery) {
        return false;
    }
    return std::nullopt;
#else
    (void) power_supply_dir;
    return std::nullopt;
#endif
}

} // namespace system

} // namespace handover::core
