#include "updater/link_updater.hpp"

#include "util/logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace cursorup {

LinkUpdater::LinkUpdater(const IPrivilegedFs& fs, const IProcessRunner& runner, const UpdaterConfig& config)
    : fs_(fs), runner_(runner), config_(config) {}

Result LinkUpdater::Relink(const std::string& install_dir) const {
    const std::string target = (fs::path(install_dir) / config_.entry_point).string();
    LogInfo("Creating symlink at %s -> %s", config_.symlink_path.c_str(), target.c_str());

    auto res = fs_.CreateSymlink(target, config_.symlink_path);
    if (!res.is_ok())
        return Result::Fail(ErrorKind::LinkError, "cannot update " + config_.symlink_path + ": " + res.msg);
    return Result::Ok();
}

Result LinkUpdater::RefreshDesktopDatabase() const {
    std::error_code ec;
    if (config_.desktop_dir.empty() || !fs::is_directory(config_.desktop_dir, ec)) {
        LogDebug("No desktop directory at %s, skipping database refresh", config_.desktop_dir.c_str());
        return Result::Ok();
    }

    LogInfo("Updating desktop database");
    return RunChecked(runner_,
                      ProcessSpec{.argv = {"update-desktop-database", config_.desktop_dir}},
                      ErrorKind::LinkError);
}

Result LinkUpdater::Update(const std::string& install_dir) const {
    auto link = Relink(install_dir);
    auto db = RefreshDesktopDatabase();
    if (!link.is_ok() && !db.is_ok())
        return Result::Fail(ErrorKind::LinkError, link.msg + "; " + db.msg);
    if (!link.is_ok())
        return link;
    return db;
}

} // namespace cursorup
