#include "io/fd.hpp"

#include <cerrno>
#include <unistd.h>
#include <utility>

namespace cursorup {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.Release()) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Reset(other.Release());
    }
    return *this;
}

Fd::~Fd() { (void)Close(); }

void Fd::Reset(int fd) {
    (void)Close();
    fd_ = fd;
}

int Fd::Release() { return std::exchange(fd_, -1); }

int Fd::Close() {
    if (fd_ < 0) return 0;
    const int rc = ::close(std::exchange(fd_, -1));
    // Linux always releases the descriptor, even on EINTR.
    if (rc != 0 && errno == EINTR) return 0;
    return rc;
}

} // namespace cursorup
