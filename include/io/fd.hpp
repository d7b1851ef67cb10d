#pragma once

#include "util/result.hpp"

#include <string>
#include <sys/types.h>

namespace filetar {

// Owning file descriptor, closed on destruction.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    // open(2) with O_CLOEXEC added. On failure out is left closed and the
    // message is "<what>: <path> (<errno text>)".
    static Result Open(const std::string& path, int flags, mode_t mode, const char* what, Fd& out);

    int Get() const;
    bool Valid() const;

    void Reset(int fd);

    // Returns the close(2) result; 0 when nothing was open.
    int Close();

  private:
    int fd_{-1};
};

} // namespace filetar
