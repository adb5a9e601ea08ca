#include "util/updater_config.hpp"

#include "util/path_utils.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace cursorup {

namespace {

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU32IfPresent(const nlohmann::json& j, const char* key, std::uint32_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer()) || it->get<long long>() < 0) {
        err = std::string("'") + key + "' must be a non-negative integer";
        return false;
    }
    out = static_cast<std::uint32_t>(it->get<long long>());
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string("'") + key + "' must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool GetStringListIfPresent(const nlohmann::json& j,
                            const char* key,
                            std::vector<std::string>& out,
                            std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_array()) {
        err = std::string("'") + key + "' must be an array of strings";
        return false;
    }
    std::vector<std::string> values;
    for (const auto& item : *it) {
        if (!item.is_string()) {
            err = std::string("'") + key + "' must be an array of strings";
            return false;
        }
        values.push_back(item.get<std::string>());
    }
    out = std::move(values);
    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, UpdaterConfig& cfg, std::string& err) {
    return GetStringIfPresent(j, "app_name", cfg.app_name, err) &&
           GetStringIfPresent(j, "api_endpoint", cfg.api_endpoint, err) &&
           GetStringIfPresent(j, "platform", cfg.platform, err) &&
           GetStringIfPresent(j, "release_track", cfg.release_track, err) &&
           GetStringIfPresent(j, "user_agent", cfg.user_agent, err) &&
           GetU32IfPresent(j, "metadata_timeout_sec", cfg.metadata_timeout_sec, err) &&
           GetU32IfPresent(j, "connect_timeout_sec", cfg.connect_timeout_sec, err) &&
           GetU32IfPresent(j, "download_stall_timeout_sec", cfg.download_stall_timeout_sec, err) &&
           GetStringIfPresent(j, "install_dir", cfg.install_dir, err) &&
           GetStringIfPresent(j, "metadata_file", cfg.metadata_file, err) &&
           GetStringIfPresent(j, "version_key", cfg.version_key, err) &&
           GetStringIfPresent(j, "entry_point", cfg.entry_point, err) &&
           GetStringIfPresent(j, "sandbox_relpath", cfg.sandbox_relpath, err) &&
           GetStringIfPresent(j, "extracted_dir_name", cfg.extracted_dir_name, err) &&
           GetStringIfPresent(j, "symlink_path", cfg.symlink_path, err) &&
           GetStringIfPresent(j, "desktop_dir", cfg.desktop_dir, err) &&
           GetStringIfPresent(j, "backup_dir", cfg.backup_dir, err) &&
           GetStringIfPresent(j, "backup_prefix", cfg.backup_prefix, err) &&
           GetBoolIfPresent(j, "verify_backup", cfg.verify_backup, err) &&
           GetStringIfPresent(j, "temp_dir", cfg.temp_dir, err) &&
           GetStringIfPresent(j, "log_file", cfg.log_file, err) &&
           GetStringListIfPresent(j, "required_tools", cfg.required_tools, err);
}

// Lexically normal form without a trailing separator.
std::filesystem::path NormalDir(const std::string& s) {
    auto p = std::filesystem::path(s).lexically_normal();
    if (!p.has_filename() && p.has_relative_path())
        p = p.parent_path();
    return p;
}

bool IsWithin(const std::filesystem::path& child, const std::filesystem::path& parent) {
    auto c = child.begin();
    for (auto p = parent.begin(); p != parent.end(); ++p, ++c) {
        if (c == child.end() || *c != *p)
            return false;
    }
    return true;
}

} // namespace

Result UpdaterConfig::LoadFromFile(const std::string& path, UpdaterConfig& out) {
    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(ErrorKind::ConfigError, "cannot open config: " + path);
    }

    nlohmann::json j;
    try {
        is >> j;
    } catch (const std::exception& e) {
        return Result::Fail(ErrorKind::ConfigError,
                            "invalid JSON in " + path + ": " + e.what());
    }

    if (!j.is_object()) {
        return Result::Fail(ErrorKind::ConfigError, "config must be a JSON object: " + path);
    }

    UpdaterConfig merged = out;
    std::string err;
    if (!FillConfigFromJson(j, merged, err)) {
        return Result::Fail(ErrorKind::ConfigError, err + " in " + path);
    }

    merged.ExpandPaths();
    out = std::move(merged);
    return Result::Ok();
}

void UpdaterConfig::ExpandPaths() {
    install_dir = ExpandUser(install_dir);
    metadata_file = ExpandUser(metadata_file);
    symlink_path = ExpandUser(symlink_path);
    desktop_dir = ExpandUser(desktop_dir);
    backup_dir = ExpandUser(backup_dir);
    temp_dir = ExpandUser(temp_dir);
    log_file = ExpandUser(log_file);
}

Result UpdaterConfig::Validate() const {
    namespace fs = std::filesystem;

    if (api_endpoint.empty())
        return Result::Fail(ErrorKind::ConfigError, "api_endpoint is empty");
    if (platform.empty())
        return Result::Fail(ErrorKind::ConfigError, "platform is empty");
    if (install_dir.empty() || !fs::path(install_dir).is_absolute())
        return Result::Fail(ErrorKind::ConfigError, "install_dir must be an absolute path");
    if (NormalDir(install_dir) == fs::path("/"))
        return Result::Fail(ErrorKind::ConfigError, "install_dir must not be /");
    if (backup_dir.empty() || !fs::path(backup_dir).is_absolute())
        return Result::Fail(ErrorKind::ConfigError, "backup_dir must be an absolute path");
    // The install tree is removed wholesale during replacement.
    if (IsWithin(NormalDir(backup_dir), NormalDir(install_dir)))
        return Result::Fail(ErrorKind::ConfigError, "backup_dir must not be inside install_dir");
    if (symlink_path.empty())
        return Result::Fail(ErrorKind::ConfigError, "symlink_path is empty");
    // libcurl treats 0 as "no timeout".
    if (metadata_timeout_sec == 0)
        return Result::Fail(ErrorKind::ConfigError, "metadata_timeout_sec must be greater than 0");
    if (connect_timeout_sec == 0)
        return Result::Fail(ErrorKind::ConfigError, "connect_timeout_sec must be greater than 0");
    if (entry_point.empty() || extracted_dir_name.empty())
        return Result::Fail(ErrorKind::ConfigError, "entry_point/extracted_dir_name is empty");
    if (backup_prefix.empty())
        return Result::Fail(ErrorKind::ConfigError, "backup_prefix is empty");
    return Result::Ok();
}

} // namespace cursorup
