#pragma once

#include "filetar/file_system.hpp"
#include "io/file_writer.hpp"
#include "io/stream.hpp"
#include "util/join.hpp"
#include "util/result.hpp"

#include <boost/asio/io_context.hpp>

#include <functional>
#include <memory>
#include <string>

namespace filetar {

// Opens the destination writer right away while its parent directory is
// ensured in parallel, then settles on the one writer that will be used.
//
// A first open that fails with EISDIR is reported immediately and is final.
// Any other first-open failure is held until the directory step finishes and,
// if that succeeds, the writer is opened again. Exactly one outcome is
// delivered unless Cancel() runs first.
class DestinationResolver : public std::enable_shared_from_this<DestinationResolver> {
  public:
    using Done = std::function<void(Result, std::shared_ptr<IWritable>)>;

    DestinationResolver(boost::asio::io_context& io,
                        std::shared_ptr<const IFileSystem> fs,
                        std::string destination_path,
                        FileWriter::Options writer_opt,
                        mode_t dir_mode);

    void Start(Done done);

    // Drops the pending outcome and releases a writer opened so far.
    void Cancel();

  private:
    struct OpenOutcome {
        Result result;
        std::shared_ptr<IWritable> writer;
    };

    void OnFirstOpen(OpenOutcome outcome);
    void OnSettled(OpenOutcome first, Result dir);
    void Reopen();
    void Deliver(Result res, std::shared_ptr<IWritable> writer);

    boost::asio::io_context& io_;
    std::shared_ptr<const IFileSystem> fs_;
    std::string path_;
    FileWriter::Options writer_opt_;
    mode_t dir_mode_;

    Join2<OpenOutcome, Result> join_;
    // First writer while it waits in join_ for the directory step.
    std::shared_ptr<IWritable> held_writer_;
    Done done_;
    bool delivered_ = false;
    bool cancelled_ = false;
};

} // namespace filetar
