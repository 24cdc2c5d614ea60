#pragma once

#include <chrono>
#include <core/transfer/report_sink.h>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace handover::core {

struct MigrationReport {
    std::string start;
    std::string end;
    std::int64_t size_bytes = 0;
    std::string source_device;
    std::string target_device;
    std::vector<std::string> migrated_files;
    std::vector<std::string> errors;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(MigrationReport,
                                   start,
                                   end,
                                   size_bytes,
                                   source_device,
                                   target_device,
                                   migrated_files,
                                   errors);
};

/**
 * @brief Report sink persisting the migration report as a JSON file.
 *
 * @details The whole report is rewritten after every event, so an interrupted run still
 * leaves a readable report behind. Write failures are logged and otherwise ignored.
 */
class JsonReportSink : public ReportSink {
public:
    JsonReportSink(std::filesystem::path report_file,
                   std::string source_device,
                   std::string target_device);
    ~JsonReportSink() override = default;
    JsonReportSink(const JsonReportSink&) = delete;
    JsonReportSink& operator=(const JsonReportSink&) = delete;

    void RecordStart() override;
    void RecordTotalSize(std::int64_t bytes) override;
    void RecordMigratedFile(const std::string& path) override;
    void RecordError(const std::string& message) override;
    void RecordEnd() override;

    MigrationReport report() const;
    const std::filesystem::path& report_file() const { return report_file_; }

    // e.g. <dir>/migration-report-20240101-120000.json
    static std::filesystem::path DefaultReportFile(const std::filesystem::path& report_dir);

private:
    std::filesystem::path report_file_;
    mutable std::mutex mutex_;
    MigrationReport report_;

    void write();
};

// Local time as "2024-01-01T12:00:00"
std::string FormatTimestamp(std::chrono::system_clock::time_point time);

} // namespace handover::core
