#include "filetar/progress_emitter.hpp"

#include "io/counting_reader.hpp"
#include "io/pass_through.hpp"

#include <cerrno>
#include <string>

namespace filetar {

namespace {
constexpr const char kMapStreamError[] = "The function passed to `map_stream` option must return a stream";
} // namespace

ProgressEmitter::ProgressEmitter(MapStream map_stream, OnProgress on_progress, RaiseError raise_error)
    : map_stream_(std::move(map_stream)),
      on_progress_(std::move(on_progress)),
      raise_error_(std::move(raise_error)) {}

std::shared_ptr<IReadable> ProgressEmitter::Wrap(std::shared_ptr<IReadable> raw,
                                                 const EntryHeader& header) {
    std::shared_ptr<IStream> mapped = raw;
    if (map_stream_) {
        mapped = map_stream_(raw, header);
    }

    auto readable = std::dynamic_pointer_cast<IReadable>(mapped);
    if (!readable) {
        std::string msg = kMapStreamError;
        if (mapped) {
            msg += " that is readable, but returned a ";
            msg += StreamKindName(ClassifyStream(mapped.get()));
            msg += " stream.";
            mapped->Destroy();
        } else {
            msg += ", but returned a non-stream value null.";
        }
        raw->Destroy();
        if (raise_error_) raise_error_(Result::Fail(EINVAL, std::move(msg)));
        return PassThrough::Empty();
    }

    auto tapped_header = std::make_shared<const EntryHeader>(header);
    if (on_progress_) {
        on_progress_(ProgressEvent{.bytes = 0, .header = tapped_header.get()});
    }

    return std::make_shared<CountingReader>(
        std::move(readable), [tapped_header, on_progress = on_progress_](std::uint64_t total) {
            if (on_progress) on_progress(ProgressEvent{.bytes = total, .header = tapped_header.get()});
        });
}

} // namespace filetar
