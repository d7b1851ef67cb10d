#include "filetar/tar_packer.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <archive_entry.h>

#include <cerrno>
#include <sys/stat.h>

namespace filetar {

namespace {

struct ArchiveEntryDeleter {
    void operator()(archive_entry* e) const {
        if (e) archive_entry_free(e);
    }
};

std::string ArchiveErr(archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

int SetFormat(archive* ar, TarPacker::Format format) {
    switch (format) {
        case TarPacker::Format::Ustar:  return archive_write_set_format_ustar(ar);
        case TarPacker::Format::GnuTar: return archive_write_set_format_gnutar(ar);
        default:                        return archive_write_set_format_pax_restricted(ar);
    }
}

const char* DescribeFileType(mode_t mode) {
    if (S_ISDIR(mode)) return "directory";
    if (S_ISLNK(mode)) return "symbolic link";
    if (S_ISFIFO(mode)) return "FIFO";
    if (S_ISSOCK(mode)) return "socket";
    if (S_ISCHR(mode)) return "character device";
    if (S_ISBLK(mode)) return "block device";
    return "special file";
}

} // namespace

void TarPacker::ArchiveWriteDeleter::operator()(archive* a) const {
    if (a) archive_write_free(a);
}

Result TarPacker::Create(std::string base_dir,
                         std::vector<std::string> entry_names,
                         Hooks hooks,
                         const Options& opt,
                         std::shared_ptr<TarPacker>& out) {
    auto packer = std::make_shared<TarPacker>();
    packer->base_dir_ = std::move(base_dir);
    packer->names_ = std::move(entry_names);
    packer->hooks_ = std::move(hooks);
    packer->opt_ = opt;

    packer->ar_.reset(archive_write_new());
    archive* ar = packer->ar_.get();
    if (!ar) return Result::Fail(ENOMEM, "archive_write_new failed");

    if (SetFormat(ar, opt.format) != ARCHIVE_OK) {
        return Result::Fail(EINVAL, "archive_write_set_format: " + ArchiveErr(ar));
    }
    if (archive_write_add_filter_none(ar) != ARCHIVE_OK) {
        return Result::Fail(EINVAL, "archive_write_add_filter_none: " + ArchiveErr(ar));
    }
    // Output goes to the packer's own queue; the client pointer stays valid
    // because the packer is heap-allocated and never moves.
    if (archive_write_open(ar, packer.get(), nullptr, WriteCb, nullptr) != ARCHIVE_OK) {
        return Result::Fail(EIO, "archive_write_open: " + ArchiveErr(ar));
    }

    out = std::move(packer);
    return Result::Ok();
}

TarPacker::~TarPacker() {
    Destroy();
}

la_ssize_t TarPacker::WriteCb(archive*, void* client_data, const void* buff, size_t len) {
    auto* self = static_cast<TarPacker*>(client_data);
    self->out_.Push(std::span<const std::uint8_t>(static_cast<const std::uint8_t*>(buff), len));
    return static_cast<la_ssize_t>(len);
}

void TarPacker::RaiseError(Result err) {
    if (!error_) {
        error_ = std::move(err);
    }
}

Result TarPacker::ArchiveFail(const char* what) {
    const int e = archive_errno(ar_.get());
    return Result::Fail(e > 0 ? e : EIO, std::string(what) + ": " + ArchiveErr(ar_.get()));
}

Result TarPacker::Read(std::vector<std::uint8_t>& out, ReadStatus& status) {
    if (error_) return *error_;
    if (destroyed_) return Result::Fail(EBADF, "Read from destroyed tar packer");

    bool pending = false;
    while (out_.Empty() && phase_ != Phase::Done && !pending) {
        auto res = Advance(pending);
        if (!res.is_ok()) RaiseError(std::move(res));
        // A hook may have raised while the entry was being set up.
        if (error_) return *error_;
    }

    if (out_.Pop(out)) {
        status = ReadStatus::Data;
    } else {
        status = phase_ == Phase::Done ? ReadStatus::End : ReadStatus::Pending;
    }
    return Result::Ok();
}

Result TarPacker::Advance(bool& pending) {
    switch (phase_) {
        case Phase::NextEntry:
            if (next_index_ < names_.size()) {
                return BeginEntry(names_[next_index_++]);
            }
            if (archive_write_close(ar_.get()) != ARCHIVE_OK) {
                return ArchiveFail("archive_write_close");
            }
            phase_ = Phase::Done;
            return Result::Ok();

        case Phase::EntryData:
            return PumpEntryData(pending);

        case Phase::Done:
            return Result::Ok();
    }
    return Result::Ok();
}

Result TarPacker::BeginEntry(const std::string& name) {
    const std::string path = base_dir_ == "/" ? "/" + name : base_dir_ + "/" + name;

    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0) {
        const int e = errno;
        return Result::FromErrno(e, "Failed to stat entry: " + path);
    }
    if (!S_ISREG(st.st_mode)) {
        return Result::Fail(EINVAL,
                            "Cannot pack " + path + ": expected a regular file, but it was a " +
                                DescribeFileType(st.st_mode) + ".");
    }

    header_ = EntryHeader{};
    header_.name = name;
    header_.size = static_cast<std::uint64_t>(st.st_size);
    header_.mode = st.st_mode & 07777;
    if (opt_.umask) header_.mode &= ~*opt_.umask;
    if (opt_.fmode) header_.mode |= *opt_.fmode;
    header_.uid = st.st_uid;
    header_.gid = st.st_gid;
    header_.mtime = static_cast<std::int64_t>(st.st_mtime);
    header_.type = EntryType::File;

    if (hooks_.on_header) {
        hooks_.on_header(header_);
    }
    header_.name = NormalizeTarPath(header_.name);
    if (header_.name.empty()) {
        return Result::Fail(EINVAL, "Entry name for " + path + " is empty after header rewrite");
    }

    std::unique_ptr<archive_entry, ArchiveEntryDeleter> entry(archive_entry_new());
    if (!entry) return Result::Fail(ENOMEM, "archive_entry_new failed");
    archive_entry_set_pathname(entry.get(), header_.name.c_str());
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), header_.mode);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(header_.size));
    archive_entry_set_uid(entry.get(), header_.uid);
    archive_entry_set_gid(entry.get(), header_.gid);
    archive_entry_set_mtime(entry.get(), static_cast<time_t>(header_.mtime), 0);

    if (archive_write_header(ar_.get(), entry.get()) != ARCHIVE_OK) {
        return ArchiveFail("archive_write_header");
    }

    std::shared_ptr<FileReader> raw;
    auto open_res = FileReader::Open(path, opt_.chunk_size, raw);
    if (!open_res.is_ok()) return open_res;

    LogDebug("packing entry %s (%llu bytes)", header_.name.c_str(), (unsigned long long)header_.size);

    entry_written_ = 0;
    if (hooks_.on_entry_stream) {
        entry_stream_ = hooks_.on_entry_stream(raw, header_);
    } else {
        entry_stream_ = raw;
    }
    if (!entry_stream_) {
        raw->Destroy();
        return Result::Fail(EINVAL, "Entry stream hook returned no stream for " + header_.name);
    }

    phase_ = Phase::EntryData;
    return Result::Ok();
}

Result TarPacker::PumpEntryData(bool& pending) {
    ReadStatus st = ReadStatus::Pending;
    auto res = entry_stream_->Read(chunk_, st);
    if (!res.is_ok()) return res;

    if (st == ReadStatus::Pending) {
        pending = true;
        return Result::Ok();
    }

    if (st == ReadStatus::End) {
        if (entry_written_ != header_.size) {
            return Result::Fail(EIO,
                                "Size mismatch for entry " + header_.name + ": header says " +
                                    std::to_string(header_.size) + " bytes, stream produced " +
                                    std::to_string(entry_written_));
        }
        if (archive_write_finish_entry(ar_.get()) != ARCHIVE_OK) {
            return ArchiveFail("archive_write_finish_entry");
        }
        entry_stream_.reset();
        phase_ = Phase::NextEntry;
        return Result::Ok();
    }

    if (entry_written_ + chunk_.size() > header_.size) {
        return Result::Fail(EIO,
                            "Size mismatch for entry " + header_.name + ": stream produced more than " +
                                std::to_string(header_.size) + " bytes");
    }
    const la_ssize_t n = archive_write_data(ar_.get(), chunk_.data(), chunk_.size());
    if (n < 0 || static_cast<size_t>(n) != chunk_.size()) {
        return ArchiveFail("archive_write_data");
    }
    entry_written_ += chunk_.size();
    return Result::Ok();
}

void TarPacker::Destroy() {
    if (destroyed_) return;
    destroyed_ = true;
    hooks_ = Hooks{};
    if (entry_stream_) {
        entry_stream_->Destroy();
        entry_stream_.reset();
    }
    if (ar_) {
        // Skip the end-of-archive trailer when torn down early.
        if (phase_ != Phase::Done) {
            (void)archive_write_fail(ar_.get());
        }
        ar_.reset();
    }
    out_.Clear();
}

} // namespace filetar
