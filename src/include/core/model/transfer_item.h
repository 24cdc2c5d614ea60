#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace handover::core {

enum class ItemKind {
    kDirectory,
    kSymlink,
    kFile,
    kApplication,
};

NLOHMANN_JSON_SERIALIZE_ENUM(ItemKind,
                             {
                                 {ItemKind::kDirectory, "Directory"},
                                 {ItemKind::kSymlink, "Symlink"},
                                 {ItemKind::kFile, "File"},
                                 {ItemKind::kApplication, "Application"},
                             })

inline std::string_view ItemKindToString(ItemKind kind) {
    switch (kind) {
    case ItemKind::kDirectory:
        return "Directory";
    case ItemKind::kSymlink:
        return "Symlink";
    case ItemKind::kFile:
        return "File";
    case ItemKind::kApplication:
        return "Application";
    }
    return "Unknown";
}

// Directories before symlinks before files, matching how the receiving side recreates trees
inline int SortOrder(ItemKind kind) {
    switch (kind) {
    case ItemKind::kDirectory:
        return 1;
    case ItemKind::kSymlink:
        return 2;
    case ItemKind::kFile:
    case ItemKind::kApplication:
        return 3;
    }
    return 4;
}

struct TransferItem {
    std::string source_path;
    std::int64_t size{0};       // bytes, recursive for directories and bundles
    std::int64_t file_count{1}; // entries the item expands to on the wire
    bool selected{true};        // participates in this run
    bool sent{false};           // set once, after a confirmed send
    ItemKind kind{ItemKind::kFile};

    std::string name() const { return std::filesystem::path(source_path).filename().string(); }

    bool IsEligible() const { return selected && !sent; }

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(
        TransferItem, source_path, size, file_count, selected, sent, kind);
};

} // namespace handover::core
