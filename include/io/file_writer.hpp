#pragma once

#include "io/fd.hpp"
#include "io/stream.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <sys/types.h>

namespace filetar {

// Writable sink for the destination archive file.
class FileWriter final : public IWritable {
  public:
    struct Options {
        mode_t mode = 0666;
        bool exclusive = false; // O_EXCL instead of O_TRUNC
        bool fsync = false;     // fsync before close in End()
    };

    static Result Open(std::string path, const Options& opt, std::shared_ptr<FileWriter>& out);

    Result Write(std::span<const std::uint8_t> in) override;
    Result End() override;
    void Destroy() override;

    const std::string& Path() const { return path_; }
    std::uint64_t BytesWritten() const { return written_; }

  private:
    std::string path_;
    Options opt_{};
    Fd fd_;
    std::uint64_t written_ = 0;
};

} // namespace filetar
