#pragma once

#include <filesystem>
#include <memory>
#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace handover {

/**
 * @brief Installs the process-wide "handover" logger for its lifetime.
 *
 * @details Everything goes to a daily rotated file `<log_dir>/handover_<date>.log`. The colored
 * console sink has its own level so a progress line on stdout is not torn up by info logs;
 * it is silenced entirely in HANDOVER_RELEASE builds. Code logs through spdlog::info() etc.
 */
class Logger {
public:
    using Level = spdlog::level::level_enum;

    Logger(Level level,
           const std::filesystem::path& log_dir,
           Level console_level = Level::info,
           std::size_t q_max_items = 8192,
           std::size_t thread_count = 1);
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    ~Logger();

    auto& logger() { return logger_; }
    [[nodiscard]] Level logLevel() const { return logger_->level(); }
    void set_log_level(Level level) { logger_->set_level(level); }
    void set_console_level(Level level);

private:
    std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
    std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    std::shared_ptr<spdlog::async_logger> logger_;
};

} // namespace handover
