#pragma once

#include "system/process.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>
#include <sys/types.h>

namespace cursorup {

// Filesystem mutations that need elevated privileges. Everything that touches
// the install directory, the backup root or the public symlink goes through
// this seam, so the remove-then-move window lives behind one interface.
class IPrivilegedFs {
public:
    virtual ~IPrivilegedFs() = default;

    // Called once before the first mutation.
    virtual Result VerifyPrivilege() const = 0;

    virtual Result MakeDirectories(const std::string& path) const = 0;
    // `dst` must not exist; it becomes a recursive copy of `src` with modes
    // and symlinks preserved.
    virtual Result CopyTree(const std::string& src, const std::string& dst) const = 0;
    // Missing `path` is not an error.
    virtual Result RemoveTree(const std::string& path) const = 0;
    virtual Result MoveTree(const std::string& src, const std::string& dst) const = 0;
    virtual Result ChownChmod(const std::string& path, uid_t uid, gid_t gid, mode_t mode) const = 0;
    // Replaces whatever link (dangling or not) sits at `link_path`.
    virtual Result CreateSymlink(const std::string& target, const std::string& link_path) const = 0;
};

// In-process implementation on std::filesystem and POSIX calls; operates with
// the caller's own privileges.
class DirectPrivilegedFs final : public IPrivilegedFs {
public:
    Result VerifyPrivilege() const override;
    Result MakeDirectories(const std::string& path) const override;
    Result CopyTree(const std::string& src, const std::string& dst) const override;
    Result RemoveTree(const std::string& path) const override;
    Result MoveTree(const std::string& src, const std::string& dst) const override;
    Result ChownChmod(const std::string& path, uid_t uid, gid_t gid, mode_t mode) const override;
    Result CreateSymlink(const std::string& target, const std::string& link_path) const override;
};

// Delegates each mutation to coreutils under sudo. Credentials are validated
// once with `sudo -v`; later calls use `sudo -n` so expired credentials fail the
// step instead of prompting halfway through an install.
class SudoPrivilegedFs final : public IPrivilegedFs {
public:
    explicit SudoPrivilegedFs(const IProcessRunner& runner, std::string sudo = "sudo");

    Result VerifyPrivilege() const override;
    Result MakeDirectories(const std::string& path) const override;
    Result CopyTree(const std::string& src, const std::string& dst) const override;
    Result RemoveTree(const std::string& path) const override;
    Result MoveTree(const std::string& src, const std::string& dst) const override;
    Result ChownChmod(const std::string& path, uid_t uid, gid_t gid, mode_t mode) const override;
    Result CreateSymlink(const std::string& target, const std::string& link_path) const override;

private:
    Result RunPrivileged(std::vector<std::string> argv) const;

    const IProcessRunner& runner_;
    std::string sudo_;
};

// Direct when already running as root, sudo otherwise.
std::unique_ptr<IPrivilegedFs> CreateDefaultPrivilegedFs(const IProcessRunner& runner);

} // namespace cursorup
