#pragma once

#include "filetar/archive_file.hpp"
#include "filetar/destination_resolver.hpp"
#include "filetar/pump.hpp"

#include <boost/asio/io_context.hpp>

#include <memory>
#include <string_view>

namespace filetar {

// State machine behind one subscription:
// Stating -> Resolving (open + mkdir race) -> Piping -> Completed | Failed,
// with Cancelled reachable from any non-terminal state.
class ArchiveRun : public std::enable_shared_from_this<ArchiveRun> {
  public:
    enum class State {
        Idle,
        Stating,
        Resolving,
        Piping,
        Completed,
        Failed,
        Cancelled,
    };

    ArchiveRun(boost::asio::io_context& io,
               ArchiveRequest request,
               std::shared_ptr<const IFileSystem> fs,
               Observer observer);

    void Start();
    void Cancel();

    State CurrentState() const { return state_; }
    bool Closed() const;

  private:
    void StatSource();
    void OnDestination(Result res, std::shared_ptr<IWritable> writer);
    void OnPipeDone(const Result& res);
    void Next(const ProgressEvent& e);
    void Fail(const Result& res);
    void Complete();
    void Enter(State next);

    boost::asio::io_context& io_;
    ArchiveRequest request_;
    std::shared_ptr<const IFileSystem> fs_;
    Observer observer_;
    State state_ = State::Idle;

    std::shared_ptr<DestinationResolver> resolver_;
    std::shared_ptr<Pump> pump_;
};

std::string_view StateName(ArchiveRun::State state);

} // namespace filetar
