#include "system/privileged_fs.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <iterator>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace cursorup {

namespace {

Result FsFail(const std::string& what, const std::error_code& ec) {
    return Result::Fail(ErrorKind::IoError, what + ": " + ec.message());
}

std::string OctalMode(mode_t mode) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04o", static_cast<unsigned>(mode & 07777));
    return buf;
}

} // namespace

// ---------------------------------------------------------------------------
// DirectPrivilegedFs

Result DirectPrivilegedFs::VerifyPrivilege() const {
    if (::geteuid() != 0) {
        LogDebug("Direct filesystem ops running unprivileged (euid=%u)",
                 static_cast<unsigned>(::geteuid()));
    }
    return Result::Ok();
}

Result DirectPrivilegedFs::MakeDirectories(const std::string& path) const {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) return FsFail("create " + path, ec);
    return Result::Ok();
}

Result DirectPrivilegedFs::CopyTree(const std::string& src, const std::string& dst) const {
    std::error_code ec;
    if (fs::exists(fs::symlink_status(dst, ec))) {
        return Result::Fail(ErrorKind::IoError, "copy destination already exists: " + dst);
    }
    fs::create_directory(dst, src, ec);
    if (ec) return FsFail("create " + dst, ec);

    fs::copy(src, dst, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) return FsFail("copy " + src + " -> " + dst, ec);
    return Result::Ok();
}

Result DirectPrivilegedFs::RemoveTree(const std::string& path) const {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) return FsFail("remove " + path, ec);
    return Result::Ok();
}

Result DirectPrivilegedFs::MoveTree(const std::string& src, const std::string& dst) const {
    std::error_code ec;
    fs::rename(src, dst, ec);
    if (!ec) return Result::Ok();
    if (ec != std::errc::cross_device_link) return FsFail("rename " + src + " -> " + dst, ec);

    // Different filesystems: copy then drop the source.
    auto copy_res = CopyTree(src, dst);
    if (!copy_res.is_ok()) {
        (void)RemoveTree(dst);
        return copy_res;
    }
    return RemoveTree(src);
}

Result DirectPrivilegedFs::ChownChmod(const std::string& path, uid_t uid, gid_t gid, mode_t mode) const {
    // chown first: it clears the setuid bit.
    if (::chown(path.c_str(), uid, gid) != 0) {
        return Result::Fail(ErrorKind::IoError,
                            "chown " + path + " failed (" + std::strerror(errno) + ")");
    }
    if (::chmod(path.c_str(), mode) != 0) {
        return Result::Fail(ErrorKind::IoError,
                            "chmod " + OctalMode(mode) + " " + path + " failed (" +
                                std::strerror(errno) + ")");
    }
    return Result::Ok();
}

Result DirectPrivilegedFs::CreateSymlink(const std::string& target, const std::string& link_path) const {
    std::error_code ec;
    const auto st = fs::symlink_status(link_path, ec);
    if (fs::is_directory(st)) {
        return Result::Fail(ErrorKind::IoError, "refusing to replace directory " + link_path);
    }
    if (fs::exists(st) || fs::is_symlink(st)) {
        fs::remove(link_path, ec);
        if (ec) return FsFail("remove " + link_path, ec);
    }

    const fs::path parent = fs::path(link_path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) return FsFail("create " + parent.string(), ec);
    }

    fs::create_symlink(target, link_path, ec);
    if (ec) return FsFail("symlink " + link_path + " -> " + target, ec);
    return Result::Ok();
}

// ---------------------------------------------------------------------------
// SudoPrivilegedFs

SudoPrivilegedFs::SudoPrivilegedFs(const IProcessRunner& runner, std::string sudo)
    : runner_(runner), sudo_(std::move(sudo)) {}

Result SudoPrivilegedFs::RunPrivileged(std::vector<std::string> argv) const {
    std::vector<std::string> full{sudo_, "-n"};
    full.insert(full.end(), std::make_move_iterator(argv.begin()), std::make_move_iterator(argv.end()));
    return RunChecked(runner_, ProcessSpec{.argv = std::move(full)}, ErrorKind::IoError);
}

Result SudoPrivilegedFs::VerifyPrivilege() const {
    auto res = RunChecked(runner_, ProcessSpec{.argv = {sudo_, "-v"}}, ErrorKind::PrivilegeError);
    if (!res.is_ok()) {
        return Result::Fail(ErrorKind::PrivilegeError, "sudo privileges are required: " + res.msg);
    }
    return res;
}

Result SudoPrivilegedFs::MakeDirectories(const std::string& path) const {
    return RunPrivileged({"mkdir", "-p", "--", path});
}

Result SudoPrivilegedFs::CopyTree(const std::string& src, const std::string& dst) const {
    return RunPrivileged({"cp", "-a", "--", src, dst});
}

Result SudoPrivilegedFs::RemoveTree(const std::string& path) const {
    return RunPrivileged({"rm", "-rf", "--", path});
}

Result SudoPrivilegedFs::MoveTree(const std::string& src, const std::string& dst) const {
    return RunPrivileged({"mv", "-T", "--", src, dst});
}

Result SudoPrivilegedFs::ChownChmod(const std::string& path, uid_t uid, gid_t gid, mode_t mode) const {
    auto res = RunPrivileged(
        {"chown", std::to_string(uid) + ":" + std::to_string(gid), "--", path});
    if (!res.is_ok()) return res;
    return RunPrivileged({"chmod", OctalMode(mode), "--", path});
}

Result SudoPrivilegedFs::CreateSymlink(const std::string& target, const std::string& link_path) const {
    auto res = RunPrivileged({"rm", "-f", "--", link_path});
    if (!res.is_ok()) return res;
    return RunPrivileged({"ln", "-sfn", "--", target, link_path});
}

std::unique_ptr<IPrivilegedFs> CreateDefaultPrivilegedFs(const IProcessRunner& runner) {
    if (::geteuid() == 0) {
        LogDebug("Running as root, using direct filesystem operations");
        return std::make_unique<DirectPrivilegedFs>();
    }
    return std::make_unique<SudoPrivilegedFs>(runner);
}

} // namespace cursorup
