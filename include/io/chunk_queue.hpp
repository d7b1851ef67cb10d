#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <span>
#include <vector>

namespace filetar {

// FIFO of byte chunks with a running byte count.
class ChunkQueue {
public:
    void Push(std::span<const std::uint8_t> data) {
        if (data.empty()) return;
        chunks_.emplace_back(data.begin(), data.end());
        bytes_ += data.size();
    }

    void Push(std::vector<std::uint8_t>&& data) {
        if (data.empty()) return;
        bytes_ += data.size();
        chunks_.push_back(std::move(data));
    }

    bool Pop(std::vector<std::uint8_t>& out) {
        if (chunks_.empty()) return false;
        out = std::move(chunks_.front());
        chunks_.pop_front();
        bytes_ -= out.size();
        return true;
    }

    bool Empty() const { return chunks_.empty(); }
    std::size_t Bytes() const { return bytes_; }

    void Clear() {
        chunks_.clear();
        bytes_ = 0;
    }

private:
    std::deque<std::vector<std::uint8_t>> chunks_;
    std::size_t bytes_ = 0;
};

} // namespace filetar
