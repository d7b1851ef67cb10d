#pragma once

#include "filetar/progress.hpp"
#include "io/stream.hpp"
#include "util/result.hpp"

#include <functional>
#include <memory>

namespace filetar {

// Taps each entry's data stream and reports {bytes so far, header}.
class ProgressEmitter {
  public:
    using MapStream =
        std::function<std::shared_ptr<IStream>(std::shared_ptr<IReadable>, const EntryHeader&)>;
    using OnProgress = std::function<void(const ProgressEvent&)>;
    using RaiseError = std::function<void(Result)>;

    ProgressEmitter(MapStream map_stream, OnProgress on_progress, RaiseError raise_error);

    // Applies the user's stream rewrite, emits the zero-byte event and returns
    // the counting stream. When the rewrite does not yield a readable stream the
    // error is raised through raise_error and an ended pass-through is returned.
    std::shared_ptr<IReadable> Wrap(std::shared_ptr<IReadable> raw, const EntryHeader& header);

  private:
    MapStream map_stream_;
    OnProgress on_progress_;
    RaiseError raise_error_;
};

} // namespace filetar
