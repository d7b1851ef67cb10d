#include "io/gzip_writer.hpp"

#include <cerrno>
#include <string>

namespace filetar {

Result GzipWriter::Create(int level, std::shared_ptr<GzipWriter>& out) {
    if (level < Z_NO_COMPRESSION || level > Z_BEST_COMPRESSION) {
        return Result::Fail(EINVAL, "gzip level must be 0..9, got " + std::to_string(level));
    }

    auto gz = std::make_shared<GzipWriter>();
    gz->strm_.zalloc = Z_NULL;
    gz->strm_.zfree = Z_NULL;
    gz->strm_.opaque = Z_NULL;

    // 16 + MAX_WBITS makes zlib write a gzip header and trailer
    if (deflateInit2(&gz->strm_, level, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return Result::Fail(ENOMEM, "Failed to initialize zlib deflate");
    }
    gz->initialized_ = true;
    gz->out_buffer_.resize(64 * 1024);

    out = std::move(gz);
    return Result::Ok();
}

GzipWriter::~GzipWriter() {
    Destroy();
}

Result GzipWriter::Deflate(int flush) {
    while (true) {
        strm_.next_out = out_buffer_.data();
        strm_.avail_out = static_cast<uInt>(out_buffer_.size());

        const int ret = deflate(&strm_, flush);
        if (ret == Z_STREAM_ERROR) {
            return Result::Fail(EIO, "zlib deflate failed");
        }

        const size_t produced = out_buffer_.size() - strm_.avail_out;
        out_.Push(std::span<const std::uint8_t>(out_buffer_.data(), produced));

        if (flush == Z_FINISH) {
            if (ret == Z_STREAM_END) return Result::Ok();
            continue;
        }
        // Output buffer not filled: all input consumed.
        if (strm_.avail_out != 0) return Result::Ok();
    }
}

Result GzipWriter::Write(std::span<const std::uint8_t> in) {
    if (!initialized_) return Result::Fail(EBADF, "Write to destroyed gzip stream");
    if (finished_) return Result::Fail(EINVAL, "Write after end of gzip stream");
    if (in.empty()) return Result::Ok();

    strm_.next_in = const_cast<Bytef*>(in.data());
    strm_.avail_in = static_cast<uInt>(in.size());
    auto res = Deflate(Z_NO_FLUSH);
    strm_.next_in = Z_NULL;
    strm_.avail_in = 0;
    return res;
}

Result GzipWriter::End() {
    if (!initialized_) return Result::Fail(EBADF, "End on destroyed gzip stream");
    if (finished_) return Result::Ok();

    auto res = Deflate(Z_FINISH);
    if (!res.is_ok()) return res;
    finished_ = true;
    return Result::Ok();
}

Result GzipWriter::Read(std::vector<std::uint8_t>& out, ReadStatus& status) {
    if (!initialized_) return Result::Fail(EBADF, "Read from destroyed gzip stream");
    if (out_.Pop(out)) {
        status = ReadStatus::Data;
    } else {
        status = finished_ ? ReadStatus::End : ReadStatus::Pending;
    }
    return Result::Ok();
}

void GzipWriter::Destroy() {
    if (initialized_) {
        deflateEnd(&strm_);
        initialized_ = false;
    }
    out_.Clear();
}

} // namespace filetar
