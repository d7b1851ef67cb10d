#pragma once

#include "io/chunk_queue.hpp"
#include "io/stream.hpp"

#include <memory>
#include <vector>
#include <zlib.h>

namespace filetar {

// Transform stage that gzip-compresses everything written to it.
class GzipWriter final : public ITransform {
  public:
    static constexpr std::size_t kHighWaterMark = 256 * 1024;

    static Result Create(int level, std::shared_ptr<GzipWriter>& out);

    GzipWriter() = default;
    ~GzipWriter() override;

    GzipWriter(const GzipWriter&) = delete;
    GzipWriter& operator=(const GzipWriter&) = delete;

    Result Read(std::vector<std::uint8_t>& out, ReadStatus& status) override;
    Result Write(std::span<const std::uint8_t> in) override;
    Result End() override;
    bool NeedsDrain() const override { return out_.Bytes() >= kHighWaterMark; }
    void Destroy() override;

  private:
    Result Deflate(int flush);

    z_stream strm_{};
    bool initialized_ = false;
    bool finished_ = false;
    ChunkQueue out_;
    std::vector<std::uint8_t> out_buffer_;
};

} // namespace filetar
