#pragma once

#include "filetar/progress.hpp"
#include "io/chunk_queue.hpp"
#include "io/file_reader.hpp"
#include "io/stream.hpp"
#include "util/result.hpp"

#include <archive.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace filetar {

// Readable stage producing a tar archive of the named entries under base_dir.
// Entry data is pulled lazily, one chunk per Read, through the entry stream hook.
class TarPacker final : public IReadable {
  public:
    enum class Format {
        Pax,
        Ustar,
        GnuTar,
    };

    struct Options {
        Format format = Format::Pax;
        std::optional<mode_t> fmode; // OR'ed into entry mode
        std::optional<mode_t> umask; // cleared from entry mode
        std::size_t chunk_size = FileReader::kDefaultChunkSize;
    };

    struct Hooks {
        std::function<void(EntryHeader&)> on_header;
        std::function<std::shared_ptr<IReadable>(std::shared_ptr<IReadable>, const EntryHeader&)>
            on_entry_stream;
    };

    static Result Create(std::string base_dir,
                         std::vector<std::string> entry_names,
                         Hooks hooks,
                         const Options& opt,
                         std::shared_ptr<TarPacker>& out);

    TarPacker() = default;
    ~TarPacker() override;

    TarPacker(const TarPacker&) = delete;
    TarPacker& operator=(const TarPacker&) = delete;

    Result Read(std::vector<std::uint8_t>& out, ReadStatus& status) override;
    void Destroy() override;

    // Fails the stage; the next Read returns err. Only the first error is kept.
    void RaiseError(Result err);

  private:
    enum class Phase {
        NextEntry,
        EntryData,
        Done,
    };

    struct ArchiveWriteDeleter {
        void operator()(archive* a) const;
    };

    static la_ssize_t WriteCb(archive* a, void* client_data, const void* buff, size_t len);

    Result Advance(bool& pending);
    Result BeginEntry(const std::string& name);
    Result PumpEntryData(bool& pending);
    Result ArchiveFail(const char* what);

    std::string base_dir_;
    std::vector<std::string> names_;
    std::size_t next_index_ = 0;
    Hooks hooks_;
    Options opt_{};

    ChunkQueue out_;
    std::unique_ptr<archive, ArchiveWriteDeleter> ar_;
    Phase phase_ = Phase::NextEntry;

    EntryHeader header_;
    std::shared_ptr<IReadable> entry_stream_;
    std::uint64_t entry_written_ = 0;
    std::vector<std::uint8_t> chunk_;

    std::optional<Result> error_;
    bool destroyed_ = false;
};

} // namespace filetar
