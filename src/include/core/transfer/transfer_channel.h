#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <core/model/transfer_item.h>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace handover::core {

enum class InterfaceType {
    kOther,
    kWifi,
    kCellular,
    kWiredEthernet,
    kLoopback,
};

// Label shown next to the progress bar for the link the transfer runs on
inline std::string_view InterfaceLabel(std::optional<InterfaceType> type) {
    if (!type) {
        return "";
    }
    switch (*type) {
    case InterfaceType::kWifi:
    case InterfaceType::kCellular:
        return "Wi-Fi";
    case InterfaceType::kWiredEthernet:
        return "Thunderbolt";
    default:
        return "";
    }
}

struct PathReport {
    InterfaceType interface_type;
    std::int64_t sent_transport_bytes;
    std::chrono::duration<double> smoothed_rtt;
};

// Transport statistics for the window since the last StartDataTransferReport()
struct DataTransferReport {
    std::chrono::duration<double> duration;
    std::vector<PathReport> path_reports;
};

/**
 * @brief Connection to the paired device, as seen by the migration.
 *
 * @details Send operations complete once the peer has the data and throw (any
 * std::exception) on failure. Progress handlers may be invoked from any thread while a
 * send is in flight. Mid-send cancellation, if any, is up to the implementation.
 */
class TransferChannel {
public:
    using BytesSentHandler = std::function<void(std::int64_t bytes)>;
    using FilesSentHandler = std::function<void(std::int64_t files)>;

    virtual ~TransferChannel() = default;

    virtual boost::asio::awaitable<void> SendFile(const TransferItem& item) = 0;

    virtual boost::asio::awaitable<void> SendMigrationSize(std::int64_t total_size) = 0;

    virtual boost::asio::awaitable<void> SendDefaultFlag(std::string key, bool value) = 0;

    virtual boost::asio::awaitable<void> SendMigrationCompleted() = 0;

    virtual void SetProgressHandlers(BytesSentHandler on_bytes_sent,
                                     FilesSentHandler on_files_sent) = 0;

    // Opens a new report window, discarding the previous one
    virtual void StartDataTransferReport() = 0;

    virtual void ClearDataTransferReport() = 0;

    // Empty when no window is open
    virtual boost::asio::awaitable<std::optional<DataTransferReport>> CollectDataTransferReport() = 0;

    virtual std::optional<InterfaceType> CurrentInterface() const = 0;
};

} // namespace handover::core
