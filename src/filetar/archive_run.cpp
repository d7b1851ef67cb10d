#include "filetar/archive_run.hpp"

#include "filetar/pipeline.hpp"
#include "util/logger.hpp"

#include <boost/asio/post.hpp>

#include <cerrno>
#include <string>

namespace filetar {

std::string_view StateName(ArchiveRun::State state) {
    switch (state) {
        case ArchiveRun::State::Idle:      return "idle";
        case ArchiveRun::State::Stating:   return "stating";
        case ArchiveRun::State::Resolving: return "resolving destination";
        case ArchiveRun::State::Piping:    return "piping";
        case ArchiveRun::State::Completed: return "completed";
        case ArchiveRun::State::Failed:    return "failed";
        case ArchiveRun::State::Cancelled: return "cancelled";
    }
    return "unknown";
}

ArchiveRun::ArchiveRun(boost::asio::io_context& io,
                       ArchiveRequest request,
                       std::shared_ptr<const IFileSystem> fs,
                       Observer observer)
    : io_(io),
      request_(std::move(request)),
      fs_(fs ? std::move(fs) : DefaultFileSystem()),
      observer_(std::move(observer)) {}

bool ArchiveRun::Closed() const {
    return state_ == State::Completed || state_ == State::Failed || state_ == State::Cancelled;
}

void ArchiveRun::Enter(State next) {
    LogDebug("%s: %.*s -> %.*s",
             request_.source_path.c_str(),
             (int)StateName(state_).size(), StateName(state_).data(),
             (int)StateName(next).size(), StateName(next).data());
    state_ = next;
}

void ArchiveRun::Start() {
    if (state_ != State::Idle) return;
    Enter(State::Stating);

    auto self = shared_from_this();
    boost::asio::post(io_, [self] { self->StatSource(); });
}

void ArchiveRun::StatSource() {
    if (state_ != State::Stating) return;

    FileKind kind = FileKind::Unknown;
    auto res = fs_->Lstat(request_.source_path, kind);
    if (!res.is_ok()) {
        Fail(res);
        return;
    }
    if (kind != FileKind::Regular) {
        Fail(Result::Fail(EINVAL,
                          "Expected " + request_.source_path + " to be a file path, but it was a " +
                              std::string(FileKindName(kind)) + "."));
        return;
    }

    Enter(State::Resolving);
    resolver_ = std::make_shared<DestinationResolver>(io_,
                                                      fs_,
                                                      request_.destination_path,
                                                      request_.options.writer,
                                                      request_.options.dir_mode);
    // Callbacks hold the run until they have fired or been dropped by Cancel,
    // so it outlives a discarded Subscription.
    auto self = shared_from_this();
    resolver_->Start([self](Result r, std::shared_ptr<IWritable> writer) {
        self->OnDestination(std::move(r), std::move(writer));
    });
}

void ArchiveRun::OnDestination(Result res, std::shared_ptr<IWritable> writer) {
    if (state_ != State::Resolving) {
        if (writer) writer->Destroy();
        return;
    }
    if (!res.is_ok()) {
        Fail(res);
        return;
    }

    std::weak_ptr<ArchiveRun> weak = shared_from_this();
    StageChain chain;
    auto compose = ComposePipeline(request_, writer, [weak](const ProgressEvent& e) {
        if (auto run = weak.lock()) run->Next(e);
    }, chain);
    if (!compose.is_ok()) {
        writer->Destroy();
        Fail(compose);
        return;
    }

    auto created = Pump::Create(io_, std::move(chain), pump_);
    if (!created.is_ok()) {
        writer->Destroy();
        Fail(created);
        return;
    }

    Enter(State::Piping);
    auto self = shared_from_this();
    pump_->Start([self](const Result& r) { self->OnPipeDone(r); });
}

void ArchiveRun::OnPipeDone(const Result& res) {
    if (state_ != State::Piping) return;
    if (res.is_ok()) {
        Complete();
    } else {
        Fail(res);
    }
}

void ArchiveRun::Next(const ProgressEvent& e) {
    if (state_ != State::Piping || !observer_.next) return;
    // The observer may cancel from inside next.
    auto next = observer_.next;
    next(e);
}

void ArchiveRun::Fail(const Result& res) {
    if (Closed()) return;
    Enter(State::Failed);
    LogDebug("archiving %s failed: %s", request_.source_path.c_str(), res.msg.c_str());
    auto error = std::move(observer_.error);
    observer_ = Observer{};
    if (error) error(res);
}

void ArchiveRun::Complete() {
    if (Closed()) return;
    Enter(State::Completed);
    auto complete = std::move(observer_.complete);
    observer_ = Observer{};
    if (complete) complete();
}

void ArchiveRun::Cancel() {
    if (Closed()) return;
    Enter(State::Cancelled);
    LogInfo("archiving %s into %s cancelled",
            request_.source_path.c_str(),
            request_.destination_path.c_str());
    if (resolver_) resolver_->Cancel();
    if (pump_) pump_->Cancel();
    observer_ = Observer{};
}

} // namespace filetar
