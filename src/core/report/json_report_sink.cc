#include <core/report/json_report_sink.h>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fstream>
#include <spdlog/spdlog.h>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace handover::core {

std::string FormatTimestamp(std::chrono::system_clock::time_point time) {
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}",
                       fmt::localtime(std::chrono::system_clock::to_time_t(time)));
}

JsonReportSink::JsonReportSink(fs::path report_file,
                               std::string source_device,
                               std::string target_device)
    : report_file_(std::move(report_file)) {
    report_.source_device = std::move(source_device);
    report_.target_device = std::move(target_device);
}

fs::path JsonReportSink::DefaultReportFile(const fs::path& report_dir) {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    return report_dir / fmt::format("migration-report-{:%Y%m%d-%H%M%S}.json", fmt::localtime(now));
}

void JsonReportSink::RecordStart() {
    std::lock_guard<std::mutex> lock(mutex_);
    report_.start = FormatTimestamp(std::chrono::system_clock::now());
    report_.end.clear();
    write();
}

void JsonReportSink::RecordTotalSize(std::int64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    report_.size_bytes = bytes;
    write();
}

void JsonReportSink::RecordMigratedFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    report_.migrated_files.push_back(path);
    write();
}

void JsonReportSink::RecordError(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    report_.errors.push_back(message);
    write();
}

void JsonReportSink::RecordEnd() {
    std::lock_guard<std::mutex> lock(mutex_);
    report_.end = FormatTimestamp(std::chrono::system_clock::now());
    write();
}

MigrationReport JsonReportSink::report() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return report_;
}

void JsonReportSink::write() {
    if (report_file_.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(report_file_.parent_path(), ec);
        if (ec) {
            spdlog::error("Failed to create report directory {}: {}",
                          report_file_.parent_path().string(),
                          ec.message());
            return;
        }
    }
    std::ofstream ofs(report_file_, std::ios::trunc);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open report file: {}", report_file_.string());
        return;
    }
    ofs << json(report_).dump(2);
    if (!ofs) {
        spdlog::error("Failed to write report file: {}", report_file_.string());
    }
}

} // namespace handover::core
