#pragma once

#include "system/privileged_fs.hpp"
#include "util/result.hpp"

#include <ctime>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cursorup {

struct BackupEntry {
    std::string path;
};

class BackupManager {
public:
    using Clock = std::function<std::time_t()>;

    BackupManager(const IPrivilegedFs& fs, std::string prefix, Clock clock = {});

    // Copies `source_dir` to `<backup_root>/<prefix>_<YYYYMMDD_HHMMSS>`.
    // Returns nullopt when there is nothing to back up. Every failure is a
    // BackupError; the caller decides whether to continue without a backup.
    Outcome<std::optional<BackupEntry>> CreateBackup(const std::string& source_dir,
                                                     const std::string& backup_root,
                                                     bool verify = true) const;

    // Both trees must hold the same relative paths, the same entry types, the
    // same symlink targets and byte-identical regular files.
    static Result VerifyBackup(const std::string& source_dir, const std::string& backup_dir);

    // Existing backups for `prefix`, oldest first.
    static std::vector<std::string> ListBackups(const std::string& backup_root,
                                                const std::string& prefix);

    static std::string FormatBackupName(const std::string& prefix, std::time_t when);

private:
    const IPrivilegedFs& fs_;
    std::string prefix_;
    Clock clock_;
};

} // namespace cursorup
