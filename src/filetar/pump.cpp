#include "filetar/pump.hpp"

#include "util/logger.hpp"

#include <boost/asio/post.hpp>

#include <cerrno>
#include <chrono>
#include <string>

namespace filetar {

namespace {
// Back-off while every link is waiting on a pending stage.
constexpr std::chrono::milliseconds kIdleDelay{1};
} // namespace

Result Pump::Create(boost::asio::io_context& io, StageChain stages, std::shared_ptr<Pump>& out) {
    if (stages.size() < 2) {
        return Result::Fail(EINVAL, "A pipeline needs at least 2 stages, got " + std::to_string(stages.size()));
    }

    auto pump = std::make_shared<Pump>(io);
    for (size_t i = 0; i < stages.size(); ++i) {
        if (!stages[i]) {
            return Result::Fail(EINVAL, "Pipeline stage " + std::to_string(i) + " is null");
        }
        const StreamKind kind = ClassifyStream(stages[i].get());
        const bool first = (i == 0);
        const bool last = (i + 1 == stages.size());
        if (first && kind != StreamKind::Readable && kind != StreamKind::Duplex && kind != StreamKind::Transform) {
            return Result::Fail(EINVAL, "First pipeline stage must be readable");
        }
        if (last && kind != StreamKind::Writable && kind != StreamKind::Duplex && kind != StreamKind::Transform) {
            return Result::Fail(EINVAL, "Last pipeline stage must be writable");
        }
        if (!first && !last && kind != StreamKind::Transform) {
            return Result::Fail(EINVAL,
                                "Pipeline stage " + std::to_string(i) + " must be a transform, got a " +
                                    std::string(StreamKindName(kind)) + " stream");
        }
    }

    for (size_t i = 0; i + 1 < stages.size(); ++i) {
        Link link;
        link.src = dynamic_cast<IReadable*>(stages[i].get());
        link.dst = dynamic_cast<IWritable*>(stages[i + 1].get());
        pump->links_.push_back(link);
    }
    pump->stages_ = std::move(stages);

    out = std::move(pump);
    return Result::Ok();
}

Pump::Pump(boost::asio::io_context& io) : io_(io), idle_timer_(io) {}

void Pump::Start(Done done) {
    if (started_) return;
    started_ = true;
    done_ = std::move(done);
    Schedule(true);
}

void Pump::Schedule(bool progressed) {
    auto self = shared_from_this();
    if (progressed) {
        boost::asio::post(io_, [self] { self->Tick(); });
        return;
    }
    idle_timer_.expires_after(kIdleDelay);
    idle_timer_.async_wait([self](const boost::system::error_code& ec) {
        if (!ec) self->Tick();
    });
}

void Pump::Tick() {
    if (settled_ || cancelled_) return;

    bool progressed = false;
    bool all_ended = true;
    in_tick_ = true;
    for (auto& link : links_) {
        if (link.ended) continue;
        auto res = StepLink(link, progressed);
        if (cancelled_) break;
        if (!res.is_ok()) {
            in_tick_ = false;
            Settle(res);
            return;
        }
        if (!link.ended) all_ended = false;
    }
    in_tick_ = false;

    // Cancelled from a callback while a stage was mid-read.
    if (cancelled_) {
        DestroyStages();
        return;
    }

    if (all_ended) {
        Settle(Result::Ok());
        return;
    }
    Schedule(progressed);
}

Result Pump::StepLink(Link& link, bool& progressed) {
    if (link.dst->NeedsDrain()) return Result::Ok();

    ReadStatus status = ReadStatus::Pending;
    auto res = link.src->Read(chunk_, status);
    if (cancelled_) return Result::Ok();
    if (!res.is_ok()) return res;

    switch (status) {
        case ReadStatus::Data:
            progressed = true;
            return link.dst->Write(std::span<const std::uint8_t>(chunk_.data(), chunk_.size()));
        case ReadStatus::End:
            progressed = true;
            link.ended = true;
            return link.dst->End();
        case ReadStatus::Pending:
            break;
    }
    return Result::Ok();
}

void Pump::Settle(const Result& res) {
    if (settled_ || cancelled_) return;
    settled_ = true;
    idle_timer_.cancel();
    DestroyStages();

    if (res.is_ok()) {
        LogDebug("pipeline of %zu stages finished", stages_.size());
    } else {
        LogDebug("pipeline failed: %s", res.msg.c_str());
    }

    auto done = std::move(done_);
    if (done) done(res);
}

void Pump::Cancel() {
    if (settled_ || cancelled_) return;
    cancelled_ = true;
    idle_timer_.cancel();
    done_ = nullptr;
    if (!in_tick_) DestroyStages();
}

void Pump::DestroyStages() {
    for (auto& stage : stages_) {
        if (stage) stage->Destroy();
    }
}

} // namespace filetar
