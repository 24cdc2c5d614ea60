#pragma once

#include "transfer_item.h"
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace handover::core {

enum class MigrationOptionType {
    kLite,     // desktop and documents only
    kComplete, // whole home folder, applications and preferences
    kAdvanced, // hand-picked items
    kNone,
};

NLOHMANN_JSON_SERIALIZE_ENUM(MigrationOptionType,
                             {
                                 {MigrationOptionType::kNone, "None"},
                                 {MigrationOptionType::kLite, "Lite"},
                                 {MigrationOptionType::kComplete, "Complete"},
                                 {MigrationOptionType::kAdvanced, "Advanced"},
                             })

std::string_view MigrationOptionTypeToString(MigrationOptionType type);

std::optional<MigrationOptionType> MigrationOptionTypeFromString(std::string_view name);

/**
 * @brief Ordered set of items moved by one migration run.
 *
 * @details total_size is the progress denominator of a run and must not be touched while
 * a run is active; ComputeTotals() is meant for building the manifest beforehand.
 */
struct Manifest {
    MigrationOptionType type{MigrationOptionType::kNone};
    std::vector<TransferItem> files;
    std::vector<TransferItem> apps;
    std::vector<std::string> preferences; // preference domains queued for migration
    std::int64_t total_size{0};
    std::int64_t total_files{0};

    bool MigratesPreferences() const { return type == MigrationOptionType::kComplete; }

    // Bytes already accounted for when a run starts: sent items plus the started sentinel
    std::int64_t ResumeOffset() const;

    // Recomputes total_size and total_files from the selected items
    void ComputeTotals();

    std::size_t PendingCount() const;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(
        Manifest, type, files, apps, preferences, total_size, total_files);
};

// Throws std::runtime_error when the file is missing or malformed
Manifest LoadManifest(const std::filesystem::path& manifest_path);

// Throws std::runtime_error when the file cannot be written
void SaveManifest(const Manifest& manifest, const std::filesystem::path& manifest_path);

// Builds a manifest from filesystem paths; unreadable paths are logged and skipped
Manifest ScanPaths(const std::vector<std::filesystem::path>& paths,
                   MigrationOptionType type = MigrationOptionType::kAdvanced);

} // namespace handover::core
