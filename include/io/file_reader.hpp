#pragma once

#include "io/fd.hpp"
#include "io/stream.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace filetar {

// Readable side of a regular file, read in fixed-size chunks.
class FileReader final : public IReadable {
public:
    static constexpr std::size_t kDefaultChunkSize = 64 * 1024;
    static constexpr std::size_t kMaxChunkSize = 16 * 1024 * 1024;

    // chunk_size 0 selects the default; larger than kMaxChunkSize is clamped.
    static Result Open(std::string path, std::size_t chunk_size, std::shared_ptr<FileReader>& out);

    Result Read(std::vector<std::uint8_t>& out, ReadStatus& status) override;
    void Destroy() override;

    std::optional<std::uint64_t> TotalSize() const { return size_; }
    const std::string& Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
    std::size_t chunk_size_ = kDefaultChunkSize;
    std::optional<std::uint64_t> size_;
    bool eof_ = false;
};

} // namespace filetar
