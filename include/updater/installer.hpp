#pragma once

#include "system/privileged_fs.hpp"
#include "system/process.hpp"
#include "util/result.hpp"
#include "util/updater_config.hpp"

#include <string>
#include <sys/types.h>

namespace cursorup {

// Unpacks a self-extracting AppImage and swaps the payload into the install
// directory.
class Installer {
public:
    Installer(const IPrivilegedFs& fs, const IProcessRunner& runner, const UpdaterConfig& config);

    // Runs `<artifact> --appimage-extract` inside `workdir` and returns the
    // extracted payload directory. ExtractionError when it does not appear.
    Outcome<std::string> Extract(const std::string& artifact_path, const std::string& workdir) const;

    // root:root 04755 on the embedded chrome-sandbox helper, if present.
    Result FixSandboxPermissions(const std::string& payload_dir) const;

    // Stage next to the target, remove the old tree, rename the staged tree in.
    // The application is absent between the last two steps.
    Result Replace(const std::string& payload_dir, const std::string& install_dir) const;

    // Extract + FixSandboxPermissions + Replace.
    Result Install(const std::string& artifact_path,
                   const std::string& workdir,
                   const std::string& install_dir) const;

    static std::string StagingPathFor(const std::string& install_dir);

    void SetSandboxOwner(uid_t uid, gid_t gid) {
        sandbox_uid_ = uid;
        sandbox_gid_ = gid;
    }

private:
    const IPrivilegedFs& fs_;
    const IProcessRunner& runner_;
    const UpdaterConfig& config_;
    uid_t sandbox_uid_ = 0;
    gid_t sandbox_gid_ = 0;
};

inline constexpr mode_t kSandboxMode = 04755;

} // namespace cursorup
