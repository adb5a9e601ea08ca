#include "updater/installer.hpp"

#include "system/signals.hpp"
#include "util/logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace cursorup {

Installer::Installer(const IPrivilegedFs& fs, const IProcessRunner& runner, const UpdaterConfig& config)
    : fs_(fs), runner_(runner), config_(config) {}

std::string Installer::StagingPathFor(const std::string& install_dir) {
    fs::path p(install_dir);
    if (!p.has_filename()) p = p.parent_path();
    return p.string() + ".new";
}

Outcome<std::string> Installer::Extract(const std::string& artifact_path, const std::string& workdir) const {
    LogInfo("Extracting AppImage...");
    auto run = RunChecked(runner_,
                          ProcessSpec{.argv = {artifact_path, "--appimage-extract"}, .cwd = workdir},
                          ErrorKind::ExtractionError);
    if (!run.is_ok())
        return Unexpected(run);

    const fs::path extracted = fs::path(workdir) / config_.extracted_dir_name;
    std::error_code ec;
    if (!fs::is_directory(extracted, ec)) {
        LogError("Extraction failed - %s not found", config_.extracted_dir_name.c_str());
        return Unexpected(ErrorKind::ExtractionError,
                          "extraction did not produce " + extracted.string());
    }

    const fs::path entry = extracted / config_.entry_point;
    if (!fs::exists(fs::symlink_status(entry, ec))) {
        LogWarn("Extracted payload has no %s entry point", config_.entry_point.c_str());
    }
    return extracted.string();
}

Result Installer::FixSandboxPermissions(const std::string& payload_dir) const {
    if (config_.sandbox_relpath.empty())
        return Result::Ok();

    const fs::path sandbox = fs::path(payload_dir) / config_.sandbox_relpath;
    std::error_code ec;
    if (!fs::exists(sandbox, ec)) {
        LogWarn("%s not found; the application may need --no-sandbox",
                sandbox.filename().c_str());
        return Result::Ok();
    }

    LogInfo("Setting %s permissions", sandbox.filename().c_str());
    auto res = fs_.ChownChmod(sandbox.string(), sandbox_uid_, sandbox_gid_, kSandboxMode);
    if (!res.is_ok())
        return Result::Fail(ErrorKind::InstallError, "cannot set sandbox permissions: " + res.msg);
    return Result::Ok();
}

Result Installer::Replace(const std::string& payload_dir, const std::string& install_dir) const {
    std::error_code ec;
    const std::string staging = StagingPathFor(install_dir);

    if (fs::exists(fs::symlink_status(staging, ec))) {
        LogWarn("Removing stale staging directory %s", staging.c_str());
        if (auto r = fs_.RemoveTree(staging); !r.is_ok())
            return Result::Fail(ErrorKind::InstallError, "cannot clear staging directory: " + r.msg);
    }

    const fs::path parent = fs::path(staging).parent_path();
    if (!parent.empty() && !fs::is_directory(parent, ec)) {
        if (auto r = fs_.MakeDirectories(parent.string()); !r.is_ok())
            return Result::Fail(ErrorKind::InstallError, "cannot create " + parent.string() + ": " + r.msg);
    }

    // Crossing filesystems happens here, while the old install is still intact.
    if (auto r = fs_.MoveTree(payload_dir, staging); !r.is_ok())
        return Result::Fail(ErrorKind::InstallError, "cannot stage new version: " + r.msg);

    if (fs::exists(fs::symlink_status(install_dir, ec))) {
        LogInfo("Removing old installation at %s", install_dir.c_str());
        if (auto r = fs_.RemoveTree(install_dir); !r.is_ok()) {
            return Result::Fail(ErrorKind::InstallError,
                                "cannot remove old installation (new version staged at " + staging +
                                    "): " + r.msg);
        }
    }

    LogInfo("Installing to %s", install_dir.c_str());
    if (auto r = fs_.MoveTree(staging, install_dir); !r.is_ok()) {
        return Result::Fail(ErrorKind::InstallError,
                            "cannot move new version into place (" + staging + " left behind): " + r.msg);
    }
    return Result::Ok();
}

Result Installer::Install(const std::string& artifact_path,
                          const std::string& workdir,
                          const std::string& install_dir) const {
    auto payload = Extract(artifact_path, workdir);
    if (!payload)
        return Result::Fail(payload.error());

    if (auto r = FixSandboxPermissions(*payload); !r.is_ok())
        return r;

    if (CancelRequested())
        return Result::Fail(ErrorKind::Cancelled, "interrupted before replacing the installation");

    return Replace(*payload, install_dir);
}

} // namespace cursorup
