#pragma once

#include "io/chunk_queue.hpp"
#include "io/stream.hpp"

#include <cstddef>
#include <memory>

namespace filetar {

// Identity transform: every written chunk becomes readable unchanged.
class PassThrough final : public ITransform {
public:
    static constexpr std::size_t kHighWaterMark = 256 * 1024;

    // A pass-through whose writable side is already ended: reads report End.
    static std::shared_ptr<PassThrough> Empty();

    Result Read(std::vector<std::uint8_t>& out, ReadStatus& status) override;
    Result Write(std::span<const std::uint8_t> in) override;
    Result End() override;
    bool NeedsDrain() const override { return queue_.Bytes() >= kHighWaterMark; }
    void Destroy() override;

private:
    ChunkQueue queue_;
    bool ended_ = false;
    bool destroyed_ = false;
};

} // namespace filetar
