#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <string>

namespace cursorup {

// A uniquely named file that is unlinked when the owner goes out of scope,
// unless Remove() already did it. Writes go through the IWriter interface.
class TempFile final : public IWriter {
public:
    // Creates `<dir>/<prefix>XXXXXX<suffix>` with mode 0600.
    static Result Create(const std::string& dir,
                         const std::string& prefix,
                         const std::string& suffix,
                         TempFile& out);

    TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile() override;

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

    int GetFd() const { return fd_.Get(); }
    const std::string& Path() const { return path_; }
    bool Exists() const { return !path_.empty(); }

    Result Close();
    // Unlinks the file now and reports failure instead of swallowing it.
    Result Remove();

private:
    void Cleanup();

    Fd fd_;
    std::string path_;
};

// A uniquely named directory removed recursively on scope exit.
class TempDirectory {
public:
    // Creates `<dir>/<prefix>XXXXXX`.
    static Result Create(const std::string& dir, const std::string& prefix, TempDirectory& out);

    TempDirectory() = default;
    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;
    TempDirectory(TempDirectory&& other) noexcept;
    TempDirectory& operator=(TempDirectory&& other) noexcept;
    ~TempDirectory();

    const std::string& Path() const { return path_; }
    bool Exists() const { return !path_.empty(); }

    Result Remove();

private:
    std::string path_;
};

} // namespace cursorup
