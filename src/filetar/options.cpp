#include "filetar/options.hpp"

#include "io/file_reader.hpp"
#include "io/gzip_writer.hpp"

#include <algorithm>
#include <cerrno>
#include <string>
#include <zlib.h>

namespace filetar {

namespace {

constexpr std::array<std::string_view, 9> kKnownOptions = {
    "mode",
    "flags",
    "fsync",
    "dir_mode",
    "fmode",
    "umask",
    "format",
    "chunk_size",
    "post_pack_transform",
};

const char* TypeName(const nlohmann::json& v) {
    switch (v.type()) {
        case nlohmann::json::value_t::string:          return "string";
        case nlohmann::json::value_t::boolean:         return "boolean";
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:    return "number";
        case nlohmann::json::value_t::array:           return "array";
        case nlohmann::json::value_t::object:          return "object";
        case nlohmann::json::value_t::binary:          return "binary";
        default:                                       return "null";
    }
}

Result GetMode(const nlohmann::json& record, const char* key, mode_t& out) {
    const auto& v = record.at(key);
    if (!(v.is_number_unsigned() || v.is_number_integer()) || v.get<long long>() < 0 ||
        v.get<long long>() > 07777) {
        return Result::Fail(EINVAL,
                            std::string("`") + key + "` option must be a permission mask between 0 and 07777, but got " +
                                DescribeValue(v) + ".");
    }
    out = static_cast<mode_t>(v.get<long long>());
    return Result::Ok();
}

Result ParseFormat(const nlohmann::json& v, TarPacker::Format& out) {
    if (v == "pax") {
        out = TarPacker::Format::Pax;
    } else if (v == "ustar") {
        out = TarPacker::Format::Ustar;
    } else if (v == "gnutar") {
        out = TarPacker::Format::GnuTar;
    } else {
        return Result::Fail(EINVAL,
                            "`format` option must be one of 'pax', 'ustar', 'gnutar', but got " +
                                DescribeValue(v) + ".");
    }
    return Result::Ok();
}

} // namespace

std::string DescribeValue(const nlohmann::json& v) {
    if (v.is_null()) return "null";
    if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        if (s.empty()) return "'' (empty string)";
        return s + " (string)";
    }

    std::string text = v.dump();
    constexpr size_t kMaxShown = 40;
    if (text.size() > kMaxShown) {
        size_t cut = kMaxShown - 3;
        // Do not split a UTF-8 sequence.
        while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
        text.resize(cut);
        text += "...";
    }
    return text + " (" + TypeName(v) + ")";
}

Result MakeTransformFromSpec(const nlohmann::json& spec, std::shared_ptr<IStream>& out) {
    out.reset();

    std::string type;
    int level = Z_DEFAULT_COMPRESSION;
    if (spec.is_string()) {
        type = spec.get<std::string>();
    } else if (spec.is_object() && spec.contains("type") && spec.at("type").is_string()) {
        type = spec.at("type").get<std::string>();
        if (spec.contains("level")) {
            const auto& lv = spec.at("level");
            if (!lv.is_number_integer() || lv.get<long long>() < 0 || lv.get<long long>() > 9) {
                return Result::Fail(EINVAL,
                                    "`post_pack_transform` level must be an integer between 0 and 9, but got " +
                                        DescribeValue(lv) + ".");
            }
            level = static_cast<int>(lv.get<long long>());
        }
    } else {
        return Result::Fail(EINVAL,
                            std::string(kTransformError) + ", but got a non-stream value " +
                                DescribeValue(spec) + ".");
    }

    if (type == "none") {
        return Result::Ok();
    }
    if (type == "gzip") {
        std::shared_ptr<GzipWriter> gz;
        auto res = GzipWriter::Create(level, gz);
        if (!res.is_ok()) return res;
        out = std::move(gz);
        return Result::Ok();
    }
    return Result::Fail(EINVAL,
                        std::string(kTransformError) + ", but got an unknown transform " +
                            DescribeValue(nlohmann::json(type)) + ".");
}

Result ParseOptionsRecord(const nlohmann::json& record, ArchiveOptions& out) {
    if (!record.is_object()) {
        return Result::Fail(EINVAL,
                            "Expected a plain object to set filetar options, but got " +
                                DescribeValue(record) + ".");
    }

    for (const auto name : kUnsupportedOptions) {
        auto it = record.find(std::string(name));
        if (it != record.end()) {
            return Result::Fail(EINVAL,
                                "filetar doesn't support `" + std::string(name) + "` option, but " +
                                    DescribeValue(*it) + " was provided.");
        }
    }

    for (const auto& [key, value] : record.items()) {
        if (std::find(kKnownOptions.begin(), kKnownOptions.end(), key) == kKnownOptions.end()) {
            return Result::Fail(EINVAL,
                                "Unknown filetar option `" + key + "`, " + DescribeValue(value) +
                                    " was provided.");
        }
    }

    ArchiveOptions opts = out;

    if (record.contains("mode")) {
        auto res = GetMode(record, "mode", opts.writer.mode);
        if (!res.is_ok()) return res;
    }
    if (record.contains("flags")) {
        const auto& v = record.at("flags");
        if (v == "w") {
            opts.writer.exclusive = false;
        } else if (v == "wx") {
            opts.writer.exclusive = true;
        } else {
            return Result::Fail(EINVAL, "`flags` option must be 'w' or 'wx', but got " + DescribeValue(v) + ".");
        }
    }
    if (record.contains("fsync")) {
        const auto& v = record.at("fsync");
        if (!v.is_boolean()) {
            return Result::Fail(EINVAL, "`fsync` option must be a boolean, but got " + DescribeValue(v) + ".");
        }
        opts.writer.fsync = v.get<bool>();
    }
    if (record.contains("dir_mode")) {
        auto res = GetMode(record, "dir_mode", opts.dir_mode);
        if (!res.is_ok()) return res;
    }
    if (record.contains("fmode")) {
        mode_t m = 0;
        auto res = GetMode(record, "fmode", m);
        if (!res.is_ok()) return res;
        opts.packer.fmode = m;
    }
    if (record.contains("umask")) {
        mode_t m = 0;
        auto res = GetMode(record, "umask", m);
        if (!res.is_ok()) return res;
        opts.packer.umask = m;
    }
    if (record.contains("format")) {
        auto res = ParseFormat(record.at("format"), opts.packer.format);
        if (!res.is_ok()) return res;
    }
    if (record.contains("chunk_size")) {
        const auto& v = record.at("chunk_size");
        const bool integral = v.is_number_unsigned() || v.is_number_integer();
        if (!integral || v.get<long long>() <= 0 ||
            v.get<unsigned long long>() > FileReader::kMaxChunkSize) {
            return Result::Fail(EINVAL,
                                "`chunk_size` option must be a positive integer no larger than " +
                                    std::to_string(FileReader::kMaxChunkSize) + ", but got " +
                                    DescribeValue(v) + ".");
        }
        opts.packer.chunk_size = static_cast<std::size_t>(v.get<long long>());
    }
    if (record.contains("post_pack_transform")) {
        auto res = MakeTransformFromSpec(record.at("post_pack_transform"), opts.post_pack_transform);
        if (!res.is_ok()) return res;
    }

    out = std::move(opts);
    return Result::Ok();
}

} // namespace filetar
