#include "io/stream.hpp"

namespace filetar {

StreamKind ClassifyStream(const IStream* s) {
    if (!s) return StreamKind::None;
    if (dynamic_cast<const ITransform*>(s)) return StreamKind::Transform;

    const bool readable = dynamic_cast<const IReadable*>(s) != nullptr;
    const bool writable = dynamic_cast<const IWritable*>(s) != nullptr;
    if (readable && writable) return StreamKind::Duplex;
    if (writable) return StreamKind::Writable;
    if (readable) return StreamKind::Readable;
    return StreamKind::None;
}

std::string_view StreamKindName(StreamKind kind) {
    switch (kind) {
        case StreamKind::Readable:  return "readable";
        case StreamKind::Writable:  return "writable";
        case StreamKind::Duplex:    return "duplex";
        case StreamKind::Transform: return "transform";
        default:                    return "non-stream";
    }
}

} // namespace filetar
