#include "io/fd.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace filetar {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        (void)Close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Fd::~Fd() { (void)Close(); }

Result Fd::Open(const std::string& path, int flags, mode_t mode, const char* what, Fd& out) {
    out.Reset(-1);
    int fd;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        const int e = errno;
        return Result::FromErrno(e, std::string(what) + ": " + path);
    }
    out.Reset(fd);
    return Result::Ok();
}

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

void Fd::Reset(int fd) {
    (void)Close();
    fd_ = fd;
}

int Fd::Close() {
    if (fd_ < 0) return 0;
    const int rc = ::close(fd_);
    fd_ = -1;
    return rc;
}

} // namespace filetar
