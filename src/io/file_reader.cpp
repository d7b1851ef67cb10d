#include "io/file_reader.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace filetar {

Result FileReader::Open(std::string path, std::size_t chunk_size, std::shared_ptr<FileReader>& out) {
    auto reader = std::make_shared<FileReader>();
    reader->path_ = std::move(path);
    if (chunk_size == 0) {
        chunk_size = kDefaultChunkSize;
    } else if (chunk_size > kMaxChunkSize) {
        chunk_size = kMaxChunkSize;
    }
    reader->chunk_size_ = chunk_size;

    auto res = Fd::Open(reader->path_, O_RDONLY, 0, "Failed to open input", reader->fd_);
    if (!res.is_ok()) return res;

    struct stat st{};
    if (::fstat(reader->fd_.Get(), &st) == 0 && S_ISREG(st.st_mode)) {
        reader->size_ = static_cast<std::uint64_t>(st.st_size);
    }

    out = std::move(reader);
    return Result::Ok();
}

Result FileReader::Read(std::vector<std::uint8_t>& out, ReadStatus& status) {
    if (eof_) {
        status = ReadStatus::End;
        return Result::Ok();
    }
    if (!fd_.Valid()) {
        return Result::Fail(EBADF, "Read after destroy: " + path_);
    }

    out.resize(chunk_size_);
    while (true) {
        const ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n > 0) {
            out.resize(static_cast<std::size_t>(n));
            status = ReadStatus::Data;
            return Result::Ok();
        }
        if (n == 0) {
            out.clear();
            eof_ = true;
            (void)fd_.Close();
            status = ReadStatus::End;
            return Result::Ok();
        }
        if (errno == EINTR) {
            continue;
        }
        const int e = errno;
        return Result::FromErrno(e, "Read failed: " + path_);
    }
}

void FileReader::Destroy() {
    (void)fd_.Close();
}

} // namespace filetar
