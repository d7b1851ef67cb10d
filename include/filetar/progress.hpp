#pragma once
#include <cstdint>
#include <string>
#include <sys/types.h>

namespace filetar {

enum class EntryType {
    File,
    Directory,
    Symlink,
};

// Per-entry metadata handed to the header rewrite hook and to progress observers.
struct EntryHeader {
    std::string name;
    std::uint64_t size = 0;
    mode_t mode = 0644;
    uid_t uid = 0;
    gid_t gid = 0;
    std::int64_t mtime = 0;
    EntryType type = EntryType::File;
};

// Not owning: header points at the entry being packed and is only valid
// during the callback.
struct ProgressEvent {
    std::uint64_t bytes = 0;
    const EntryHeader* header = nullptr;
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace filetar
