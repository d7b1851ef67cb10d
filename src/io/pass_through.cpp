#include "io/pass_through.hpp"

#include <cerrno>
#include <memory>

namespace filetar {

std::shared_ptr<PassThrough> PassThrough::Empty() {
    auto s = std::make_shared<PassThrough>();
    s->ended_ = true;
    return s;
}

Result PassThrough::Read(std::vector<std::uint8_t>& out, ReadStatus& status) {
    if (destroyed_) return Result::Fail(EBADF, "Read from destroyed stream");
    if (queue_.Pop(out)) {
        status = ReadStatus::Data;
    } else {
        status = ended_ ? ReadStatus::End : ReadStatus::Pending;
    }
    return Result::Ok();
}

Result PassThrough::Write(std::span<const std::uint8_t> in) {
    if (destroyed_) return Result::Fail(EBADF, "Write to destroyed stream");
    if (ended_) return Result::Fail(EINVAL, "Write after end");
    queue_.Push(in);
    return Result::Ok();
}

Result PassThrough::End() {
    if (destroyed_) return Result::Fail(EBADF, "End on destroyed stream");
    ended_ = true;
    return Result::Ok();
}

void PassThrough::Destroy() {
    destroyed_ = true;
    queue_.Clear();
}

} // namespace filetar
