/*
    config.h
    This header provides functionality for managing application configuration
    using TOML files. It includes utilities for reading and writing general
    configuration values as well as the migration settings.

    Example usage:

    General configuration:
    - Read a value from the general config:
        T value = handover::core::config["key"].value_or(default_value);

    Migration settings:
    - Read a setting:
        std::chrono::seconds delay = handover::core::settings.first_sample_delay;
        std::chrono::seconds interval = handover::core::settings.sample_interval;
        bool report = handover::core::settings.generate_report;
        std::filesystem::path dir = handover::core::settings.report_dir;
    - Write a setting:
        handover::core::settings.sample_interval = std::chrono::seconds(30);

    Initialization and saving:
    - Initialize the configuration (loads from file or creates default):
        handover::core::InitConfig();
    - Initialize from an explicit file instead of the per-user one:
        handover::core::InitConfig("/path/to/config.toml");
    - Save the current configuration to the file it was loaded from:
        handover::core::SaveConfig();
*/

#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <toml++/toml.h>

namespace handover::core {

inline toml::table config;

struct Settings {
    std::string device_name;                  // Shown as source device in reports
    std::chrono::seconds first_sample_delay;  // Delay before the first bandwidth sample
    std::chrono::seconds sample_interval;     // Delay between later bandwidth samples
    bool generate_report;                     // Whether to write a JSON migration report
    std::filesystem::path report_dir;         // Directory for migration reports
    std::filesystem::path config_file;
};

inline Settings settings;

void InitConfig();

void InitConfig(const std::filesystem::path& config_file);

void SaveConfig();

} // namespace handover::core
