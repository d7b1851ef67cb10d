#pragma once

#include "io/file_writer.hpp"
#include "io/stream.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace filetar {

enum class FileKind {
    Regular,
    Directory,
    Symlink,
    Fifo,
    Socket,
    CharDevice,
    BlockDevice,
    Unknown,
};

std::string_view FileKindName(FileKind kind);

// Filesystem operations the archiver depends on. Tests substitute fakes.
class IFileSystem {
  public:
    virtual ~IFileSystem() = default;

    // Does not follow a final symlink.
    virtual Result Lstat(const std::string& path, FileKind& out) const = 0;

    // Recursive create-if-missing. Fails with the mkdir errno (EEXIST,
    // ENOTDIR) when a component exists but is not a directory.
    virtual Result EnsureDirectory(const std::string& path, mode_t mode) const = 0;

    virtual Result OpenForWrite(const std::string& path,
                                const FileWriter::Options& opt,
                                std::shared_ptr<IWritable>& out) const = 0;
};

std::shared_ptr<const IFileSystem> DefaultFileSystem();

} // namespace filetar
