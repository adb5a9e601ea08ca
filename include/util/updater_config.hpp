#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cursorup {

inline constexpr const char* kDefaultConfigPath = "/etc/cursor-updater.json";
inline constexpr const char* kConfigPathEnv = "CURSOR_UPDATER_CONFIG";

// Everything the updater needs to know about the bundle, the endpoint and the
// host layout. Defaults describe the stock Cursor install on Linux.
struct UpdaterConfig {
    std::string app_name = "Cursor";

    // Remote release endpoint
    std::string api_endpoint = "https://www.cursor.com/api/download";
    std::string platform = "linux-x64";
    std::string release_track = "latest";
    std::string user_agent = "Cursor-Version-Checker";
    std::uint32_t metadata_timeout_sec = 15;
    std::uint32_t connect_timeout_sec = 15;
    // Download aborts when throughput stays below 1 KiB/s for this long.
    std::uint32_t download_stall_timeout_sec = 60;

    // Installed layout
    std::string install_dir = "/opt/cursor";
    std::string metadata_file = "/opt/cursor/cursor.desktop";
    std::string version_key = "X-AppImage-Version";
    std::string entry_point = "AppRun";
    std::string sandbox_relpath = "usr/share/cursor/chrome-sandbox";
    std::string extracted_dir_name = "squashfs-root";
    std::string symlink_path = "/usr/local/bin/cursor";
    std::string desktop_dir = "~/.local/share/applications";

    // Backups
    std::string backup_dir = "/opt/cursor_backups";
    std::string backup_prefix = "cursor";
    bool verify_backup = true;

    // Scratch space and logging
    std::string temp_dir = "/tmp";
    std::string log_file = "~/.cursor_updater.log";

    // Tools that must be on PATH before any mutation starts.
    std::vector<std::string> required_tools{"update-desktop-database"};

    // Overlay values found in a JSON object file onto `out`. Keys not present
    // keep their current value. `~` is expanded in path-valued fields.
    static Result LoadFromFile(const std::string& path, UpdaterConfig& out);

    // Validate cross-field constraints (non-empty paths, distinct dirs, ...).
    Result Validate() const;

    void ExpandPaths();
};

} // namespace cursorup
