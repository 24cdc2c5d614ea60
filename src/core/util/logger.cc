#include <chrono>
#include <core/util/logger.h>
#include <cstdio>
#include <ctime>
#include <spdlog/async.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <string>

namespace handover {

namespace {

void stampLogFile(const char* label, const spdlog::filename_t& filename, std::FILE* fstream) {
    if (fstream) {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::fprintf(fstream, "[%s: %s | %s]\n", label, filename.c_str(), std::ctime(&now));
    }
}

} // namespace

Logger::Logger(Level level,
               const std::filesystem::path& log_dir,
               Level console_level,
               std::size_t q_max_items,
               std::size_t thread_count) {
    spdlog::file_event_handlers handlers;
    handlers.after_open = [](const spdlog::filename_t& filename, std::FILE* fstream) {
        stampLogFile("Log Start", filename, fstream);
    };
    handlers.before_close = [](const spdlog::filename_t& filename, std::FILE* fstream) {
        stampLogFile("Log End", filename, fstream);
    };
    auto file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
        (log_dir / "handover.log").string(), 0, 0, false, 7, handlers);
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

    thread_pool_ = std::make_shared<spdlog::details::thread_pool>(q_max_items, thread_count);
    logger_ = std::make_shared<spdlog::async_logger>("handover",
                                                     spdlog::sinks_init_list{file_sink,
                                                                             console_sink_},
                                                     thread_pool_,
                                                     spdlog::async_overflow_policy::block);

#ifdef HANDOVER_RELEASE
    console_sink_->set_level(Level::off);
#else
    console_sink_->set_level(console_level);
#endif
    logger_->set_level(level);
    logger_->flush_on(Level::warn);
    logger_->set_error_handler(
        [this](const std::string& msg) { logger_->error("*** LOGGER ERROR ***: {}", msg); });

    /* more about pattern:
     * https://github.com/gabime/spdlog/wiki/3.-Custom-formatting
     */
    console_sink_->set_pattern("\033[36m[%Y-%m-%d %H:%M:%S.%e] \033[92m[%n] \033[0m%^[%l]%$ %v");
    spdlog::set_default_logger(logger_);
}

Logger::~Logger() {
    spdlog::shutdown();
}

void Logger::set_console_level(Level level) {
#ifndef HANDOVER_RELEASE
    console_sink_->set_level(level);
#else
    (void) level;
#endif
}

} // namespace handover
