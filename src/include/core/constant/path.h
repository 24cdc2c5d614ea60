#pragma once

#include <cstdlib>
#include <filesystem>

namespace handover::core {
namespace path {

inline const std::filesystem::path kHomeDir =
#if defined(_WIN32) || defined(_WIN64)
    std::filesystem::path(std::getenv("USERPROFILE"));
#else
    std::filesystem::path(std::getenv("HOME"));
#endif

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "Handover"
                                             / "logs";

inline const std::filesystem::path kConfigDir =
#if defined(_WIN32) || defined(_WIN64)
    std::filesystem::path(std::getenv("APPDATA")) / "Handover";
#elif defined(__APPLE__)
    kHomeDir / "Library" / "Application Support" / "Handover";
#else
    kHomeDir / ".config" / "Handover";
#endif

// Migration reports land here unless "report-dir" overrides it
inline const std::filesystem::path kReportDir =
#if defined(_WIN32) || defined(_WIN64)
    std::filesystem::path(std::getenv("APPDATA")) / "Handover" / "reports";
#else
    kHomeDir / ".local" / "share" / "Handover" / "reports";
#endif

// Per-destination bookkeeping of the local directory channel
inline constexpr const char* kSessionDirName = ".handover";

} // namespace path
} // namespace handover::core
