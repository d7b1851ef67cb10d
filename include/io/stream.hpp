#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace filetar {

enum class ReadStatus {
    Data,    // out holds a non-empty chunk
    Pending, // nothing available yet, ask again later
    End,     // no more data will ever be produced
};

class IStream {
public:
    virtual ~IStream() = default;

    // Releases handles and buffers. Safe to call more than once; later reads
    // and writes fail.
    virtual void Destroy() = 0;
};

class IReadable : public virtual IStream {
public:
    virtual Result Read(std::vector<std::uint8_t>& out, ReadStatus& status) = 0;
};

class IWritable : public virtual IStream {
public:
    virtual Result Write(std::span<const std::uint8_t> in) = 0;

    // Signals end of input. Buffered data is flushed (and, for a transform,
    // becomes readable before End is reported on the readable side).
    virtual Result End() = 0;

    // Backpressure: true while the stage holds more than it wants buffered.
    virtual bool NeedsDrain() const { return false; }
};

// Both sides, with output derived from input.
class ITransform : public IReadable, public IWritable {};

enum class StreamKind {
    None,
    Readable,
    Writable,
    Duplex,
    Transform,
};

StreamKind ClassifyStream(const IStream* s);
std::string_view StreamKindName(StreamKind kind);

} // namespace filetar
