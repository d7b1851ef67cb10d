#include "io/file_writer.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace filetar {

Result FileWriter::Open(std::string path, const Options& opt, std::shared_ptr<FileWriter>& out) {
    auto writer = std::make_shared<FileWriter>();
    writer->path_ = std::move(path);
    writer->opt_ = opt;

    int flags = O_WRONLY | O_CREAT;
    flags |= opt.exclusive ? O_EXCL : O_TRUNC;

    auto res = Fd::Open(writer->path_, flags, opt.mode, "Failed to open output", writer->fd_);
    if (!res.is_ok()) return res;

    out = std::move(writer);
    return Result::Ok();
}

Result FileWriter::Write(std::span<const std::uint8_t> in) {
    if (!fd_.Valid()) {
        return Result::Fail(EBADF, "Write after close: " + path_);
    }

    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            written_ += static_cast<std::uint64_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int e = errno;
        return Result::FromErrno(e, "Write failed: " + path_);
    }

    return Result::Ok();
}

Result FileWriter::End() {
    if (!fd_.Valid()) {
        return Result::Fail(EBADF, "End after close: " + path_);
    }
    if (opt_.fsync && ::fsync(fd_.Get()) == -1) {
        const int e = errno;
        (void)fd_.Close();
        return Result::FromErrno(e, "fsync failed: " + path_);
    }
    if (fd_.Close() != 0) {
        const int e = errno;
        return Result::FromErrno(e, "close failed: " + path_);
    }
    return Result::Ok();
}

void FileWriter::Destroy() {
    (void)fd_.Close();
}

} // namespace filetar
