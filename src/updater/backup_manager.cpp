#include "updater/backup_manager.hpp"

#include "crypto/sha256.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <map>
#include <unistd.h>

namespace fs = std::filesystem;

namespace cursorup {

namespace {

// Type tag plus content digest or link target, keyed by relative path.
using TreeListing = std::map<std::string, std::string>;

// Regular file whose content the invoking user cannot read.
constexpr const char kUnreadableFile[] = "F?";

Outcome<TreeListing> ListTree(const std::string& root) {
    TreeListing out;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
    if (ec) return Unexpected(ErrorKind::BackupError, "cannot walk " + root + ": " + ec.message());

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const fs::path& p = it->path();
        const std::string rel = fs::relative(p, root, ec).string();
        if (ec) break;

        const auto st = it->symlink_status(ec);
        if (ec) break;

        if (fs::is_symlink(st)) {
            out[rel] = "L:" + fs::read_symlink(p, ec).string();
        } else if (fs::is_directory(st)) {
            out[rel] = "D";
        } else if (fs::is_regular_file(st) && ::access(p.c_str(), R_OK) != 0) {
            LogWarn("Cannot read %s, skipping content check", p.c_str());
            out[rel] = kUnreadableFile;
        } else if (fs::is_regular_file(st)) {
            auto digest = Sha256HexFile(p.string());
            if (!digest)
                return Unexpected(ErrorKind::BackupError, "cannot hash " + p.string() + ": " +
                                                              digest.error().msg);
            out[rel] = "F:" + *digest;
        } else {
            out[rel] = "O";
        }
        if (ec) break;
    }
    if (ec) return Unexpected(ErrorKind::BackupError, "cannot walk " + root + ": " + ec.message());
    return out;
}

} // namespace

BackupManager::BackupManager(const IPrivilegedFs& fs, std::string prefix, Clock clock)
    : fs_(fs), prefix_(std::move(prefix)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::time(nullptr); };
    }
}

std::string BackupManager::FormatBackupName(const std::string& prefix, std::time_t when) {
    std::tm tm{};
    char buf[32]{};
    if (localtime_r(&when, &tm) == nullptr || std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm) == 0) {
        return prefix + "_" + std::to_string(static_cast<long long>(when));
    }
    return prefix + "_" + buf;
}

Outcome<std::optional<BackupEntry>> BackupManager::CreateBackup(const std::string& source_dir,
                                                                const std::string& backup_root,
                                                                bool verify) const {
    std::error_code ec;
    if (!fs::exists(source_dir, ec)) {
        LogInfo("No existing installation to back up");
        return std::optional<BackupEntry>{};
    }

    if (!fs::is_directory(backup_root, ec)) {
        LogInfo("Creating backup directory: %s", backup_root.c_str());
        auto mk = fs_.MakeDirectories(backup_root);
        if (!mk.is_ok())
            return Unexpected(ErrorKind::BackupError, "cannot create backup root: " + mk.msg);
    }

    const std::string base = FormatBackupName(prefix_, clock_());
    fs::path dest = fs::path(backup_root) / base;
    for (int n = 1; fs::exists(fs::symlink_status(dest, ec)); ++n) {
        dest = fs::path(backup_root) / (base + "_" + std::to_string(n));
    }

    LogInfo("Backing up %s to %s", source_dir.c_str(), dest.c_str());
    auto copy = fs_.CopyTree(source_dir, dest.string());
    if (!copy.is_ok()) {
        LogError("Backup failed: %s", copy.msg.c_str());
        return Unexpected(ErrorKind::BackupError, "backup copy failed: " + copy.msg);
    }

    if (verify) {
        auto check = VerifyBackup(source_dir, dest.string());
        if (!check.is_ok()) {
            LogError("Backup verification failed: %s", check.msg.c_str());
            return Unexpected(check);
        }
        LogDebug("Backup verified: %s", dest.c_str());
    }

    return std::optional<BackupEntry>{BackupEntry{dest.string()}};
}

Result BackupManager::VerifyBackup(const std::string& source_dir, const std::string& backup_dir) {
    auto src = ListTree(source_dir);
    if (!src) return Result::Fail(src.error());
    auto dst = ListTree(backup_dir);
    if (!dst) return Result::Fail(dst.error());

    for (const auto& [rel, tag] : *src) {
        auto it = dst->find(rel);
        if (it == dst->end())
            return Result::Fail(ErrorKind::BackupError, "missing from backup: " + rel);
        if (tag == kUnreadableFile || it->second == kUnreadableFile) {
            if (tag.rfind("F", 0) != 0 || it->second.rfind("F", 0) != 0)
                return Result::Fail(ErrorKind::BackupError, "differs in backup: " + rel);
            continue;
        }
        if (it->second != tag)
            return Result::Fail(ErrorKind::BackupError, "differs in backup: " + rel);
    }
    if (dst->size() != src->size())
        return Result::Fail(ErrorKind::BackupError, "backup contains extra entries");
    return Result::Ok();
}

std::vector<std::string> BackupManager::ListBackups(const std::string& backup_root,
                                                    const std::string& prefix) {
    std::vector<std::string> out;
    std::error_code ec;
    const std::string needle = prefix + "_";
    for (fs::directory_iterator it(backup_root, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.rfind(needle, 0) == 0 && it->is_directory(ec))
            out.push_back(it->path().string());
    }
    // Timestamps are fixed-width, so lexical order is chronological.
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace cursorup
