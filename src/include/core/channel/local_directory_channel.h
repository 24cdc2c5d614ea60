#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <core/transfer/transfer_channel.h>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace handover::core {

/**
 * @brief 本地目录传输通道
 *
 * @details Copies items below a destination directory on this machine. Each item lands at
 * `<destination>/<item file name>`, directories keeping their layout. Migration size,
 * default flags and the completion signal are persisted to `<destination>/.handover/session.json`.
 *
 * Files are copied in chunks and the coroutine yields to the executor between chunks, so
 * timers on the same io_context keep running during a long copy.
 */
class LocalDirectoryChannel : public TransferChannel {
public:
    explicit LocalDirectoryChannel(std::filesystem::path destination);
    ~LocalDirectoryChannel() override = default;
    LocalDirectoryChannel(const LocalDirectoryChannel&) = delete;
    LocalDirectoryChannel& operator=(const LocalDirectoryChannel&) = delete;

    boost::asio::awaitable<void> SendFile(const TransferItem& item) override;

    boost::asio::awaitable<void> SendMigrationSize(std::int64_t total_size) override;

    boost::asio::awaitable<void> SendDefaultFlag(std::string key, bool value) override;

    boost::asio::awaitable<void> SendMigrationCompleted() override;

    void SetProgressHandlers(BytesSentHandler on_bytes_sent,
                             FilesSentHandler on_files_sent) override;

    void StartDataTransferReport() override;

    void ClearDataTransferReport() override;

    boost::asio::awaitable<std::optional<DataTransferReport>> CollectDataTransferReport() override;

    std::optional<InterfaceType> CurrentInterface() const override;

    const std::filesystem::path& destination() const { return destination_; }
    std::filesystem::path SessionFile() const;

    // Current content of the session file, empty object when none was written
    nlohmann::json ReadSession() const;

private:
    std::filesystem::path destination_;

    mutable std::mutex mutex_;
    BytesSentHandler on_bytes_sent_;
    FilesSentHandler on_files_sent_;
    std::optional<std::chrono::steady_clock::time_point> window_start_;
    std::int64_t window_bytes_{0};

    boost::asio::awaitable<void> copyFile(const std::filesystem::path& source,
                                          const std::filesystem::path& target);
    boost::asio::awaitable<void> copyTree(const std::filesystem::path& source,
                                          const std::filesystem::path& target);
    void copySymlink(const std::filesystem::path& source, const std::filesystem::path& target);

    void notifyBytesSent(std::int64_t bytes);
    void notifyFilesSent(std::int64_t files);

    // Read-modify-write of the session file
    void updateSession(const std::function<void(nlohmann::json&)>& mutation);
};

} // namespace handover::core
