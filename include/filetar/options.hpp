#pragma once

#include "filetar/progress.hpp"
#include "filetar/tar_packer.hpp"
#include "io/file_writer.hpp"
#include "io/stream.hpp"
#include "util/result.hpp"

#include <array>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace filetar {

struct ArchiveOptions {
    // Rewrites the entry header before it is written.
    std::function<void(EntryHeader&)> map_header;

    // Replaces the entry's data stream; must return a readable stream.
    std::function<std::shared_ptr<IStream>(std::shared_ptr<IReadable>, const EntryHeader&)> map_stream;

    // Inserted between the packer and the writer; must be a transform.
    std::shared_ptr<IStream> post_pack_transform;

    FileWriter::Options writer{};
    mode_t dir_mode = 0777;
    TarPacker::Options packer{};
};

// Entry selection and path rewriting are not supported for a single file.
inline constexpr std::array<std::string_view, 4> kUnsupportedOptions = {
    "entries",
    "filter",
    "ignore",
    "strip",
};

inline constexpr std::string_view kTransformError =
    "`post_pack_transform` option must be a transform stream that modifies the tar archive before writing";

// Human-readable rendering of a value with its type: "1 (number)",
// "'' (empty string)", "null".
std::string DescribeValue(const nlohmann::json& v);

// Builds typed options from a JSON options record. Rejects non-objects,
// unsupported and unknown keys, and malformed values.
Result ParseOptionsRecord(const nlohmann::json& record, ArchiveOptions& out);

// Builds a post-pack transform from its JSON spec ("gzip", "none",
// {"type": "gzip", "level": 9}). out stays null for "none".
Result MakeTransformFromSpec(const nlohmann::json& spec, std::shared_ptr<IStream>& out);

} // namespace filetar
