#include <core/constant/migration.h>
#include <core/constant/path.h>
#include <core/util/config.h>
#include <core/util/system.h>
#include <fstream>
#include <spdlog/spdlog.h>

namespace handover::core {

static void LoadSetting() {
    if (!config.contains("setting")) {
        config.insert("setting", toml::table{});
    }
    auto& setting = config["setting"].ref<toml::table>();

    settings.device_name = setting["device-name"].value_or(system::Hostname());

    auto first_delay = setting["first-sample-delay"].value_or(
        static_cast<std::int64_t>(migration::kDefaultFirstSampleDelay.count()));
    if (first_delay <= 0) {
        spdlog::warn("Invalid first-sample-delay {}, using default", first_delay);
        first_delay = migration::kDefaultFirstSampleDelay.count();
    }
    settings.first_sample_delay = std::chrono::seconds(first_delay);

    auto interval = setting["sample-interval"].value_or(
        static_cast<std::int64_t>(migration::kDefaultSampleInterval.count()));
    if (interval <= 0) {
        spdlog::warn("Invalid sample-interval {}, using default", interval);
        interval = migration::kDefaultSampleInterval.count();
    }
    settings.sample_interval = std::chrono::seconds(interval);

    settings.generate_report = setting["generate-report"].value_or(true);

    if (setting.contains("report-dir")) {
        settings.report_dir = setting["report-dir"].value_or(path::kReportDir.string());
    } else {
        settings.report_dir = path::kReportDir;
    }
}

void InitConfig() {
    if (!std::filesystem::exists(path::kConfigDir)) {
        spdlog::info("Config directory does not exist, creating...");
        std::filesystem::create_directories(path::kConfigDir);
    }
    InitConfig(path::kConfigDir / "config.toml");
}

void InitConfig(const std::filesystem::path& config_file) {
    settings.config_file = config_file;
    if (!std::filesystem::exists(config_file)) {
        std::ofstream ofs(config_file);
        spdlog::info("Config file does not exist, creating...");
    }
    try {
        config = toml::parse_file(config_file.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be parsed: {}", config_file.string(), err.description());
        config = toml::table{};
    }

    LoadSetting();
}

void SaveConfig() {
    std::ofstream ofs(settings.config_file);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open \"{}\" for saving config.", settings.config_file.string());
        return;
    }
    config.insert_or_assign("setting",
                            toml::table{
                                {"device-name", settings.device_name},
                                {"first-sample-delay", settings.first_sample_delay.count()},
                                {"sample-interval", settings.sample_interval.count()},
                                {"generate-report", settings.generate_report},
                                {"report-dir", settings.report_dir.string()},
                            });
    ofs << config;
}

} // namespace handover::core
