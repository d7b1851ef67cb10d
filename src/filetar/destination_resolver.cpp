#include "filetar/destination_resolver.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <boost/asio/post.hpp>

#include <cerrno>

namespace filetar {

DestinationResolver::DestinationResolver(boost::asio::io_context& io,
                                         std::shared_ptr<const IFileSystem> fs,
                                         std::string destination_path,
                                         FileWriter::Options writer_opt,
                                         mode_t dir_mode)
    : io_(io),
      fs_(fs ? std::move(fs) : DefaultFileSystem()),
      path_(std::move(destination_path)),
      writer_opt_(writer_opt),
      dir_mode_(dir_mode) {}

void DestinationResolver::Start(Done done) {
    done_ = std::move(done);

    auto self = shared_from_this();
    std::weak_ptr<DestinationResolver> weak = self;
    join_.OnDone([weak](OpenOutcome first, Result dir) {
        if (auto resolver = weak.lock()) resolver->OnSettled(std::move(first), std::move(dir));
    });

    boost::asio::post(io_, [self] {
        if (self->cancelled_) return;
        OpenOutcome outcome;
        outcome.result = self->fs_->OpenForWrite(self->path_, self->writer_opt_, outcome.writer);
        self->OnFirstOpen(std::move(outcome));
    });

    boost::asio::post(io_, [self] {
        if (self->cancelled_) return;
        self->join_.SetSecond(self->fs_->EnsureDirectory(DirName(self->path_), self->dir_mode_));
    });
}

void DestinationResolver::OnFirstOpen(OpenOutcome outcome) {
    if (!outcome.result.is_ok()) {
        if (outcome.result.err == EISDIR) {
            Deliver(Result::Fail(EISDIR,
                                 "Tried to write an archive file to " + path_ +
                                     ", but a directory already exists there."),
                    nullptr);
        } else {
            LogDebug("first open of %s failed, waiting for parent directory: %s",
                     path_.c_str(),
                     outcome.result.msg.c_str());
        }
    } else {
        held_writer_ = outcome.writer;
    }
    join_.SetFirst(std::move(outcome));
}

void DestinationResolver::OnSettled(OpenOutcome first, Result dir) {
    held_writer_.reset();
    if (cancelled_) {
        if (first.writer) first.writer->Destroy();
        return;
    }
    if (delivered_) {
        // Already reported (directory in the way); nothing else to do.
        if (first.writer) first.writer->Destroy();
        return;
    }
    if (!dir.is_ok()) {
        if (first.writer) first.writer->Destroy();
        Deliver(std::move(dir), nullptr);
        return;
    }
    if (!first.result.is_ok()) {
        auto self = shared_from_this();
        boost::asio::post(io_, [self] { self->Reopen(); });
        return;
    }
    Deliver(Result::Ok(), std::move(first.writer));
}

void DestinationResolver::Reopen() {
    if (cancelled_) return;

    std::shared_ptr<IWritable> writer;
    auto res = fs_->OpenForWrite(path_, writer_opt_, writer);
    if (!res.is_ok()) {
        Deliver(std::move(res), nullptr);
        return;
    }
    LogDebug("reopened %s after creating its parent directory", path_.c_str());
    Deliver(Result::Ok(), std::move(writer));
}

void DestinationResolver::Deliver(Result res, std::shared_ptr<IWritable> writer) {
    if (delivered_ || cancelled_) {
        if (writer) writer->Destroy();
        return;
    }
    delivered_ = true;
    auto done = std::move(done_);
    if (done) done(std::move(res), std::move(writer));
}

void DestinationResolver::Cancel() {
    if (cancelled_) return;
    cancelled_ = true;
    join_.Abandon();
    done_ = nullptr;
    if (held_writer_) {
        held_writer_->Destroy();
        held_writer_.reset();
    }
}

} // namespace filetar
