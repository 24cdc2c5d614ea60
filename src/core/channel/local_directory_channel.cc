#include <utility>
#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/channel/local_directory_channel.h>
#include <core/constant/migration.h>
#include <core/constant/path.h>
#include <fstream>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
namespace net = boost::asio;
using json = nlohmann::json;

namespace handover::core {

LocalDirectoryChannel::LocalDirectoryChannel(fs::path destination)
    : destination_(std::move(destination)) {}

fs::path LocalDirectoryChannel::SessionFile() const {
    return destination_ / path::kSessionDirName / "session.json";
}

json LocalDirectoryChannel::ReadSession() const {
    std::ifstream ifs(SessionFile());
    if (!ifs.is_open()) {
        return json::object();
    }
    try {
        return json::parse(ifs);
    } catch (const json::exception& e) {
        spdlog::warn("Ignoring malformed session file {}: {}", SessionFile().string(), e.what());
        return json::object();
    }
}

net::awaitable<void> LocalDirectoryChannel::SendFile(const TransferItem& item) {
    fs::path source(item.source_path);
    std::error_code ec;
    auto status = fs::symlink_status(source, ec);
    if (ec || !fs::exists(status)) {
        throw std::runtime_error("Source not found: " + source.string());
    }

    fs::create_directories(destination_, ec);
    if (ec) {
        throw std::runtime_error("Failed to create destination " + destination_.string() + ": "
                                 + ec.message());
    }

    auto target = destination_ / source.filename();
    if (fs::is_symlink(status)) {
        copySymlink(source, target);
    } else if (fs::is_directory(status)) {
        co_await copyTree(source, target);
    } else if (fs::is_regular_file(status)) {
        co_await copyFile(source, target);
        notifyFilesSent(1);
    } else {
        throw std::runtime_error("Unsupported file type: " + source.string());
    }
    spdlog::debug("Copied {} to {}", source.string(), target.string());
}

net::awaitable<void> LocalDirectoryChannel::copyFile(const fs::path& source,
                                                     const fs::path& target) {
    std::ifstream in(source, std::ios::binary);
    if (!in) {
        spdlog::error("Failed to open file: {}", source.string());
        throw std::runtime_error("Failed to open file: " + source.string());
    }
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to create file: {}", target.string());
        throw std::runtime_error("Failed to create file: " + target.string());
    }

    auto executor = co_await net::this_coro::executor;
    std::vector<char> buffer(migration::kDefaultChunkSize);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = in.gcount();
        if (count == 0) {
            break;
        }
        out.write(buffer.data(), count);
        if (!out) {
            throw std::runtime_error("Failed to write file: " + target.string());
        }
        notifyBytesSent(count);
        co_await net::post(executor, net::use_awaitable);
    }
    if (in.bad()) {
        throw std::runtime_error("Failed to read file: " + source.string());
    }
}

net::awaitable<void> LocalDirectoryChannel::copyTree(const fs::path& source,
                                                     const fs::path& target) {
    std::error_code ec;
    fs::create_directories(target, ec);
    if (ec) {
        throw std::runtime_error("Failed to create directory " + target.string() + ": "
                                 + ec.message());
    }
    notifyFilesSent(1);

    fs::recursive_directory_iterator it(source, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw std::runtime_error("Failed to walk " + source.string() + ": " + ec.message());
    }
    for (const auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            throw std::runtime_error("Failed to walk " + source.string() + ": " + ec.message());
        }
        auto entry_status = it->symlink_status(ec);
        if (ec || fs::is_socket(entry_status)) {
            continue;
        }
        auto entry_target = target / it->path().lexically_relative(source);
        if (fs::is_symlink(entry_status)) {
            copySymlink(it->path(), entry_target);
        } else if (fs::is_directory(entry_status)) {
            fs::create_directories(entry_target, ec);
            if (ec) {
                throw std::runtime_error("Failed to create directory " + entry_target.string()
                                         + ": " + ec.message());
            }
            notifyFilesSent(1);
        } else if (fs::is_regular_file(entry_status)) {
            co_await copyFile(it->path(), entry_target);
            notifyFilesSent(1);
        } else {
            // fifos and devices are counted but not copied
            spdlog::warn("Skipping special file {}", it->path().string());
            notifyFilesSent(1);
        }
    }
}

void LocalDirectoryChannel::copySymlink(const fs::path& source, const fs::path& target) {
    std::error_code ec;
    auto link_target = fs::read_symlink(source, ec);
    if (ec) {
        throw std::runtime_error("Failed to read symlink " + source.string() + ": "
                                 + ec.message());
    }
    fs::remove(target, ec);
    fs::create_symlink(link_target, target, ec);
    if (ec) {
        throw std::runtime_error("Failed to create symlink " + target.string() + ": "
                                 + ec.message());
    }
    notifyFilesSent(1);
}

net::awaitable<void> LocalDirectoryChannel::SendMigrationSize(std::int64_t total_size) {
    updateSession([total_size](json& session) {
        session["migration_size"] = total_size;
        session["completed"] = false;
    });
    co_return;
}

net::awaitable<void> LocalDirectoryChannel::SendDefaultFlag(std::string key, bool value) {
    updateSession([&key, value](json& session) { session["defaults"][key] = value; });
    co_return;
}

net::awaitable<void> LocalDirectoryChannel::SendMigrationCompleted() {
    updateSession([](json& session) { session["completed"] = true; });
    spdlog::info("Migration marked completed in {}", SessionFile().string());
    co_return;
}

void LocalDirectoryChannel::updateSession(const std::function<void(json&)>& mutation) {
    auto session = ReadSession();
    mutation(session);

    auto session_file = SessionFile();
    std::error_code ec;
    fs::create_directories(session_file.parent_path(), ec);
    if (ec) {
        throw std::runtime_error("Failed to create " + session_file.parent_path().string() + ": "
                                 + ec.message());
    }
    std::ofstream ofs(session_file, std::ios::trunc);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open session file: " + session_file.string());
    }
    ofs << session.dump(2);
    if (!ofs) {
        throw std::runtime_error("Failed to write session file: " + session_file.string());
    }
}

void LocalDirectoryChannel::SetProgressHandlers(BytesSentHandler on_bytes_sent,
                                                FilesSentHandler on_files_sent) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_bytes_sent_ = std::move(on_bytes_sent);
    on_files_sent_ = std::move(on_files_sent);
}

void LocalDirectoryChannel::StartDataTransferReport() {
    std::lock_guard<std::mutex> lock(mutex_);
    window_start_ = std::chrono::steady_clock::now();
    window_bytes_ = 0;
}

void LocalDirectoryChannel::ClearDataTransferReport() {
    std::lock_guard<std::mutex> lock(mutex_);
    window_start_.reset();
    window_bytes_ = 0;
}

net::awaitable<std::optional<DataTransferReport>>
LocalDirectoryChannel::CollectDataTransferReport() {
    std::optional<DataTransferReport> report;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (window_start_) {
            report = DataTransferReport{
                .duration = std::chrono::steady_clock::now() - *window_start_,
                .path_reports = {PathReport{
                    .interface_type = InterfaceType::kLoopback,
                    .sent_transport_bytes = window_bytes_,
                    .smoothed_rtt = std::chrono::duration<double>::zero(),
                }},
            };
        }
    }
    co_return report;
}

std::optional<InterfaceType> LocalDirectoryChannel::CurrentInterface() const {
    return InterfaceType::kLoopback;
}

void LocalDirectoryChannel::notifyBytesSent(std::int64_t bytes) {
    BytesSentHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (window_start_) {
            window_bytes_ += bytes;
        }
        handler = on_bytes_sent_;
    }
    if (handler) {
        handler(bytes);
    }
}

void LocalDirectoryChannel::notifyFilesSent(std::int64_t files) {
    FilesSentHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = on_files_sent_;
    }
    if (handler) {
        handler(files);
    }
}

} // namespace handover::core
