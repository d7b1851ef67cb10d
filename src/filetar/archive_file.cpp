#include "filetar/archive_file.hpp"

#include "filetar/archive_run.hpp"

#include <boost/asio/post.hpp>

#include <cerrno>

namespace filetar {

void Subscription::Cancel() {
    if (run_) run_->Cancel();
}

bool Subscription::Closed() const {
    return !run_ || run_->Closed();
}

ArchiveOperation::ArchiveOperation(boost::asio::io_context& io, ArchiveRequest request)
    : io_(&io), request_(std::move(request)), fs_(DefaultFileSystem()) {}

Subscription ArchiveOperation::Subscribe(Observer observer) {
    if (!io_) {
        if (observer.error) observer.error(Result::Fail(EINVAL, "Subscribe on an empty archive operation"));
        return Subscription{};
    }
    if (subscribed_) {
        boost::asio::post(*io_, [error = std::move(observer.error)] {
            if (error) error(Result::Fail(EALREADY, "This archive operation has already been subscribed to"));
        });
        return Subscription{};
    }
    subscribed_ = true;

    auto run = std::make_shared<ArchiveRun>(*io_, std::move(request_), fs_, std::move(observer));
    run->Start();
    return Subscription(std::move(run));
}

Result ArchiveFile(boost::asio::io_context& io,
                   const std::string& source,
                   const std::string& destination,
                   ArchiveOptions options,
                   ArchiveOperation& out) {
    ArchiveRequest request;
    auto res = ValidateRequest(source, destination, std::move(options), request);
    if (!res.is_ok()) return res;
    out = ArchiveOperation(io, std::move(request));
    return Result::Ok();
}

Result ArchiveFile(boost::asio::io_context& io,
                   const std::string& source,
                   const std::string& destination,
                   ArchiveOperation& out) {
    return ArchiveFile(io, source, destination, ArchiveOptions{}, out);
}

Result ArchiveFileFromArguments(boost::asio::io_context& io,
                                const std::vector<nlohmann::json>& args,
                                ArchiveOperation& out) {
    ArchiveRequest request;
    auto res = ValidateArguments(args, request);
    if (!res.is_ok()) return res;
    out = ArchiveOperation(io, std::move(request));
    return Result::Ok();
}

} // namespace filetar
