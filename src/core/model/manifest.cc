#include <algorithm>
#include <cctype>
#include <core/constant/migration.h>
#include <core/model/manifest.h>
#include <fstream>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace handover::core {

std::string_view MigrationOptionTypeToString(MigrationOptionType type) {
    switch (type) {
    case MigrationOptionType::kLite:
        return "Lite";
    case MigrationOptionType::kComplete:
        return "Complete";
    case MigrationOptionType::kAdvanced:
        return "Advanced";
    case MigrationOptionType::kNone:
        return "None";
    }
    return "None";
}

std::optional<MigrationOptionType> MigrationOptionTypeFromString(std::string_view name) {
    for (auto type : {MigrationOptionType::kLite,
                      MigrationOptionType::kComplete,
                      MigrationOptionType::kAdvanced,
                      MigrationOptionType::kNone}) {
        auto candidate = MigrationOptionTypeToString(type);
        if (std::equal(candidate.begin(),
                       candidate.end(),
                       name.begin(),
                       name.end(),
                       [](unsigned char a, unsigned char b) {
                           return std::tolower(a) == std::tolower(b);
                       })) {
            return type;
        }
    }
    return std::nullopt;
}

std::int64_t Manifest::ResumeOffset() const {
    std::int64_t offset = migration::kStartedSentinelBytes;
    for (const auto& file : files) {
        if (file.sent) {
            offset += file.size;
        }
    }
    for (const auto& app : apps) {
        if (app.sent) {
            offset += app.size;
        }
    }
    return offset;
}

void Manifest::ComputeTotals() {
    total_size = 0;
    total_files = 0;
    for (const auto* list : {&files, &apps}) {
        for (const auto& item : *list) {
            if (item.selected) {
                total_size += item.size;
                total_files += item.file_count;
            }
        }
    }
}

std::size_t Manifest::PendingCount() const {
    auto eligible = [](const TransferItem& item) { return item.IsEligible(); };
    return static_cast<std::size_t>(std::count_if(files.begin(), files.end(), eligible)
                                    + std::count_if(apps.begin(), apps.end(), eligible));
}

Manifest LoadManifest(const fs::path& manifest_path) {
    std::ifstream ifs(manifest_path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open manifest: " + manifest_path.string());
    }
    try {
        return json::parse(ifs).get<Manifest>();
    } catch (const json::exception& e) {
        throw std::runtime_error("Malformed manifest " + manifest_path.string() + ": " + e.what());
    }
}

void SaveManifest(const Manifest& manifest, const fs::path& manifest_path) {
    if (manifest_path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(manifest_path.parent_path(), ec);
    }
    std::ofstream ofs(manifest_path, std::ios::trunc);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open manifest for writing: " + manifest_path.string());
    }
    ofs << json(manifest).dump(2);
    if (!ofs) {
        throw std::runtime_error("Failed to write manifest: " + manifest_path.string());
    }
}

namespace {

// Size and entry count of a directory tree, the directory itself counting as one entry
std::pair<std::int64_t, std::int64_t> measureTree(const fs::path& root) {
    std::int64_t size = 0;
    std::int64_t count = 1;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Cannot walk {}: {}", root.string(), ec.message());
        return {size, count};
    }
    for (const auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            spdlog::warn("Error while walking {}: {}", root.string(), ec.message());
            break;
        }
        auto status = it->symlink_status(ec);
        if (ec || fs::is_socket(status)) {
            continue;
        }
        ++count;
        if (fs::is_regular_file(status)) {
            auto file_size = it->file_size(ec);
            if (!ec) {
                size += static_cast<std::int64_t>(file_size);
            }
        }
    }
    return {size, count};
}

bool itemLess(const TransferItem& a, const TransferItem& b) {
    if (SortOrder(a.kind) != SortOrder(b.kind)) {
        return SortOrder(a.kind) < SortOrder(b.kind);
    }
    return a.name() < b.name();
}

} // namespace

Manifest ScanPaths(const std::vector<fs::path>& paths, MigrationOptionType type) {
    Manifest manifest;
    manifest.type = type;

    for (const auto& path : paths) {
        std::error_code ec;
        auto status = fs::symlink_status(path, ec);
        if (ec || !fs::exists(status)) {
            spdlog::error("Path not found: {}", path.string());
            continue;
        }
        if (fs::is_socket(status)) {
            spdlog::debug("Skipping socket {}", path.string());
            continue;
        }

        TransferItem item;
        item.source_path = fs::absolute(path, ec).lexically_normal().string();
        if (ec) {
            item.source_path = path.string();
        }

        if (fs::is_symlink(status)) {
            item.kind = ItemKind::kSymlink;
            item.size = 0;
            item.file_count = 1;
        } else if (fs::is_directory(status)) {
            auto [size, count] = measureTree(path);
            item.kind = path.extension() == ".app" ? ItemKind::kApplication : ItemKind::kDirectory;
            item.size = size;
            item.file_count = count;
        } else {
            item.kind = ItemKind::kFile;
            auto file_size = fs::file_size(path, ec);
            item.size = ec ? 0 : static_cast<std::int64_t>(file_size);
            item.file_count = 1;
        }

        spdlog::debug("Scanned {}: kind={}, size={}, files={}",
                      item.source_path,
                      ItemKindToString(item.kind),
                      item.size,
                      item.file_count);

        if (item.kind == ItemKind::kApplication) {
            manifest.apps.emplace_back(std::move(item));
        } else {
            manifest.files.emplace_back(std::move(item));
        }
    }

    std::sort(manifest.files.begin(), manifest.files.end(), itemLess);
    std::sort(manifest.apps.begin(), manifest.apps.end(), itemLess);
    manifest.ComputeTotals();
    return manifest;
}

} // namespace handover::core
