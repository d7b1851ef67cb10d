#include "filetar/file_system.hpp"

#include <cerrno>
#include <filesystem>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace filetar {

namespace {

FileKind KindFromMode(mode_t mode) {
    if (S_ISREG(mode)) return FileKind::Regular;
    if (S_ISDIR(mode)) return FileKind::Directory;
    if (S_ISLNK(mode)) return FileKind::Symlink;
    if (S_ISFIFO(mode)) return FileKind::Fifo;
    if (S_ISSOCK(mode)) return FileKind::Socket;
    if (S_ISCHR(mode)) return FileKind::CharDevice;
    if (S_ISBLK(mode)) return FileKind::BlockDevice;
    return FileKind::Unknown;
}

Result MakeDirectories(const fs::path& dir, mode_t mode) {
    if (::mkdir(dir.c_str(), mode) == 0) return Result::Ok();

    int e = errno;
    if (e == ENOENT) {
        const fs::path parent = dir.parent_path();
        if (parent.empty() || parent == dir) {
            return Result::FromErrno(e, "Failed to create directory: " + dir.string());
        }
        auto res = MakeDirectories(parent, mode);
        if (!res.is_ok()) return res;
        if (::mkdir(dir.c_str(), mode) == 0) return Result::Ok();
        e = errno;
    }

    // Something is already there (or mkdir failed for another reason): fine
    // only if it is a directory.
    struct stat st{};
    if (::stat(dir.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
        return Result::Ok();
    }
    return Result::FromErrno(e, "Failed to create directory: " + dir.string());
}

class PosixFileSystem final : public IFileSystem {
  public:
    Result Lstat(const std::string& path, FileKind& out) const override {
        struct stat st{};
        if (::lstat(path.c_str(), &st) != 0) {
            const int e = errno;
            return Result::FromErrno(e, "Failed to stat " + path);
        }
        out = KindFromMode(st.st_mode);
        return Result::Ok();
    }

    Result EnsureDirectory(const std::string& path, mode_t mode) const override {
        return MakeDirectories(fs::path(path), mode);
    }

    Result OpenForWrite(const std::string& path,
                        const FileWriter::Options& opt,
                        std::shared_ptr<IWritable>& out) const override {
        std::shared_ptr<FileWriter> writer;
        auto res = FileWriter::Open(path, opt, writer);
        if (!res.is_ok()) return res;
        out = std::move(writer);
        return Result::Ok();
    }
};

} // namespace

std::string_view FileKindName(FileKind kind) {
    switch (kind) {
        case FileKind::Regular:     return "file";
        case FileKind::Directory:   return "directory";
        case FileKind::Symlink:     return "symbolic link";
        case FileKind::Fifo:        return "FIFO";
        case FileKind::Socket:      return "socket";
        case FileKind::CharDevice:  return "character device";
        case FileKind::BlockDevice: return "block device";
        default:                    return "special file";
    }
}

std::shared_ptr<const IFileSystem> DefaultFileSystem() {
    static const std::shared_ptr<const IFileSystem> kDefault = std::make_shared<PosixFileSystem>();
    return kDefault;
}

} // namespace filetar
