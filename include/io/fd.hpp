#pragma once

namespace cursorup {

// Owning wrapper around a POSIX file descriptor.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    void Reset(int fd = -1);
    // Gives up ownership without closing.
    int Release();
    // Returns the close(2) result; 0 when nothing was open.
    int Close();

  private:
    int fd_{-1};
};

} // namespace cursorup
