#pragma once

#include "io/stream.hpp"
#include "util/result.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <functional>
#include <memory>
#include <vector>

namespace filetar {

// Ordered stages: readable source, zero or more transforms, writable sink.
using StageChain = std::vector<std::shared_ptr<IStream>>;

// Drives a StageChain on one io_context: every link moves at most one chunk
// per tick, and a link waits while its downstream stage asks to be drained.
// The first failure from any stage, or completion once the sink has ended,
// is reported exactly once; every stage is destroyed before that happens.
// Stages have no readiness signal: while no link can move, the pump sleeps
// 1 ms on a steady_timer and then polls every link again.
class Pump : public std::enable_shared_from_this<Pump> {
  public:
    using Done = std::function<void(const Result&)>;

    static Result Create(boost::asio::io_context& io, StageChain stages, std::shared_ptr<Pump>& out);

    explicit Pump(boost::asio::io_context& io);

    void Start(Done done);

    // Destroys all stages at once and suppresses the outcome. No-op after
    // the pump has settled; safe to call repeatedly. When called from inside
    // a stage callback the stages are destroyed as soon as that stage returns.
    void Cancel();

    bool Settled() const { return settled_; }
    bool Cancelled() const { return cancelled_; }

  private:
    struct Link {
        IReadable* src = nullptr;
        IWritable* dst = nullptr;
        bool ended = false;
    };

    void Tick();
    void Schedule(bool progressed);
    Result StepLink(Link& link, bool& progressed);
    void Settle(const Result& res);
    void DestroyStages();

    boost::asio::io_context& io_;
    boost::asio::steady_timer idle_timer_;
    StageChain stages_;
    std::vector<Link> links_;
    std::vector<std::uint8_t> chunk_;
    Done done_;
    bool started_ = false;
    bool settled_ = false;
    bool cancelled_ = false;
    bool in_tick_ = false;
};

} // namespace filetar
