#pragma once
#include "io/stream.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

namespace filetar {

// Forwards chunks unchanged and reports the running byte count after each one.
class CountingReader final : public IReadable {
public:
    using OnCount = std::function<void(std::uint64_t total)>;

    CountingReader(std::shared_ptr<IReadable> inner, OnCount on_count)
        : inner_(std::move(inner)), on_count_(std::move(on_count)) {}

    Result Read(std::vector<std::uint8_t>& out, ReadStatus& status) override {
        auto res = inner_->Read(out, status);
        if (!res.is_ok()) return res;
        if (status == ReadStatus::Data) {
            read_ += static_cast<std::uint64_t>(out.size());
            if (on_count_) on_count_(read_);
        }
        return res;
    }

    void Destroy() override {
        if (inner_) inner_->Destroy();
    }

    std::uint64_t BytesRead() const { return read_; }

private:
    std::shared_ptr<IReadable> inner_;
    OnCount on_count_;
    std::uint64_t read_ = 0;
};

} // namespace filetar
