#pragma once

#include "filetar/file_system.hpp"
#include "filetar/options.hpp"
#include "filetar/progress.hpp"
#include "filetar/validator.hpp"
#include "util/result.hpp"

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace filetar {

// Receives progress, then at most one of error/complete.
struct Observer {
    std::function<void(const ProgressEvent&)> next;
    std::function<void(const Result&)> error;
    std::function<void()> complete;
};

class ArchiveRun;

// Handle returned by Subscribe.
class Subscription {
  public:
    Subscription() = default;

    // Aborts the operation: stages are destroyed, handles released and the
    // observer hears nothing more. No-op once the operation has settled.
    void Cancel();

    // True once completed, failed or cancelled.
    bool Closed() const;

  private:
    friend class ArchiveOperation;
    explicit Subscription(std::shared_ptr<ArchiveRun> run) : run_(std::move(run)) {}

    std::shared_ptr<ArchiveRun> run_;
};

// Cold, single-use archiving operation for one validated request. Work is
// scheduled on the io_context when Subscribe is called; callbacks run on the
// thread running that io_context.
class ArchiveOperation {
  public:
    ArchiveOperation() = default;
    ArchiveOperation(boost::asio::io_context& io, ArchiveRequest request);

    void SetFileSystem(std::shared_ptr<const IFileSystem> fs) { fs_ = std::move(fs); }

    Subscription Subscribe(Observer observer);

    const ArchiveRequest& Request() const { return request_; }

  private:
    boost::asio::io_context* io_ = nullptr;
    ArchiveRequest request_;
    std::shared_ptr<const IFileSystem> fs_;
    bool subscribed_ = false;
};

// Validates and prepares an operation archiving source into destination.
// Argument errors are returned here, before any filesystem access.
Result ArchiveFile(boost::asio::io_context& io,
                   const std::string& source,
                   const std::string& destination,
                   ArchiveOptions options,
                   ArchiveOperation& out);

Result ArchiveFile(boost::asio::io_context& io,
                   const std::string& source,
                   const std::string& destination,
                   ArchiveOperation& out);

// Same, from raw positional arguments (source, destination[, options record]).
Result ArchiveFileFromArguments(boost::asio::io_context& io,
                                const std::vector<nlohmann::json>& args,
                                ArchiveOperation& out);

} // namespace filetar
