#include "io/temp_file.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <unistd.h>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace cursorup {

namespace {

std::vector<char> MakeTemplate(const std::string& dir, const std::string& name) {
    const std::string tmpl = (fs::path(dir.empty() ? "/tmp" : dir) / name).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    return buf;
}

} // namespace

Result TempFile::Create(const std::string& dir,
                        const std::string& prefix,
                        const std::string& suffix,
                        TempFile& out) {
    out.Cleanup();

    auto buf = MakeTemplate(dir, prefix + "XXXXXX" + suffix);
    const int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        return Result::Fail(ErrorKind::IoError,
                            "mkstemps failed in " + dir + ": " + std::strerror(errno));
    }
    out.fd_.Reset(fd);
    out.path_ = buf.data();
    return Result::Ok();
}

TempFile::TempFile() = default;

TempFile::TempFile(TempFile&& other) noexcept
    : fd_(std::move(other.fd_)), path_(std::exchange(other.path_, std::string())) {}

TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Cleanup();
        fd_ = std::move(other.fd_);
        path_ = std::exchange(other.path_, std::string());
    }
    return *this;
}

TempFile::~TempFile() { Cleanup(); }

Result TempFile::WriteAll(std::span<const std::uint8_t> in) {
    if (!fd_.Valid()) return Result::Fail(ErrorKind::IoError, "temp file is not open");

    size_t rem = in.size();
    const std::uint8_t* p = in.data();
    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return Result::Fail(ErrorKind::IoError,
                            "write to " + path_ + " failed (" + std::strerror(errno) + ")");
    }
    return Result::Ok();
}

Result TempFile::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        return Result::Fail(ErrorKind::IoError,
                            "fsync " + path_ + " failed (" + std::strerror(errno) + ")");
    }
    return Result::Ok();
}

Result TempFile::Close() {
    if (fd_.Close() != 0) {
        return Result::Fail(ErrorKind::IoError,
                            "close " + path_ + " failed (" + std::strerror(errno) + ")");
    }
    return Result::Ok();
}

Result TempFile::Remove() {
    (void)fd_.Close();
    if (path_.empty()) return Result::Ok();
    if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
        return Result::Fail(ErrorKind::IoError,
                            "unlink " + path_ + " failed (" + std::strerror(errno) + ")");
    }
    path_.clear();
    return Result::Ok();
}

void TempFile::Cleanup() {
    (void)fd_.Close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

Result TempDirectory::Create(const std::string& dir, const std::string& prefix, TempDirectory& out) {
    (void)out.Remove();

    auto buf = MakeTemplate(dir, prefix + "XXXXXX");
    char* created = ::mkdtemp(buf.data());
    if (!created) {
        return Result::Fail(ErrorKind::IoError,
                            "mkdtemp failed in " + dir + ": " + std::strerror(errno));
    }
    out.path_ = created;
    return Result::Ok();
}

TempDirectory::TempDirectory(TempDirectory&& other) noexcept
    : path_(std::exchange(other.path_, std::string())) {}

TempDirectory& TempDirectory::operator=(TempDirectory&& other) noexcept {
    if (this != &other) {
        (void)Remove();
        path_ = std::exchange(other.path_, std::string());
    }
    return *this;
}

TempDirectory::~TempDirectory() { (void)Remove(); }

Result TempDirectory::Remove() {
    if (path_.empty()) return Result::Ok();
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        return Result::Fail(ErrorKind::IoError, "remove " + path_ + " failed: " + ec.message());
    }
    path_.clear();
    return Result::Ok();
}

} // namespace cursorup
