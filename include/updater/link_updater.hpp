#pragma once

#include "system/privileged_fs.hpp"
#include "system/process.hpp"
#include "util/result.hpp"
#include "util/updater_config.hpp"

#include <string>

namespace cursorup {

// Points the public launcher symlink at the installed entry point and
// refreshes the user's desktop database. Failures come back as LinkError; the
// install itself is already usable by then.
class LinkUpdater {
public:
    LinkUpdater(const IPrivilegedFs& fs, const IProcessRunner& runner, const UpdaterConfig& config);

    Result Update(const std::string& install_dir) const;

    Result Relink(const std::string& install_dir) const;
    Result RefreshDesktopDatabase() const;

private:
    const IPrivilegedFs& fs_;
    const IProcessRunner& runner_;
    const UpdaterConfig& config_;
};

} // namespace cursorup
