#include "filetar/validator.hpp"

#include "util/path_utils.hpp"

#include <cerrno>

namespace filetar {

namespace {

constexpr const char kSourcePathError[] = "Expected a file path to be compressed as an archive";
constexpr const char kArchivePathError[] = "Expected a file path where an archive file will be created";

Result CheckPathValue(const nlohmann::json& v, const char* what) {
    if (!v.is_string()) {
        return Result::Fail(EINVAL,
                            std::string(what) + ", but got a non-string value " + DescribeValue(v) + ".");
    }
    if (v.get_ref<const std::string&>().empty()) {
        return Result::Fail(EINVAL, std::string(what) + ", but got '' (empty string).");
    }
    return Result::Ok();
}

Result ResolvePaths(const std::string& source, const std::string& destination, ArchiveRequest& out) {
    out.source_path = ResolvePath(source);
    out.destination_path = ResolvePath(destination);
    if (out.source_path == out.destination_path) {
        return Result::Fail(EINVAL,
                            "Source file path must be different from the archive path. Both were specified to " +
                                out.source_path + ".");
    }
    return Result::Ok();
}

Result CheckTransform(const ArchiveOptions& options) {
    if (!options.post_pack_transform) return Result::Ok();

    const StreamKind kind = ClassifyStream(options.post_pack_transform.get());
    if (kind == StreamKind::Transform) return Result::Ok();
    if (kind == StreamKind::None) {
        return Result::Fail(EINVAL, std::string(kTransformError) + ", but got a non-stream value.");
    }
    return Result::Fail(EINVAL,
                        std::string(kTransformError) + ", but got a " + std::string(StreamKindName(kind)) +
                            " stream instead.");
}

} // namespace

Result ValidateArguments(const std::vector<nlohmann::json>& args, ArchiveRequest& out) {
    if (args.size() < 2 || args.size() > 3) {
        return Result::Fail(EINVAL,
                            "Expected 2 or 3 arguments (source path, archive path and optional options), but got " +
                                std::to_string(args.size()) + ".");
    }

    auto res = CheckPathValue(args[0], kSourcePathError);
    if (!res.is_ok()) return res;
    res = CheckPathValue(args[1], kArchivePathError);
    if (!res.is_ok()) return res;

    ArchiveRequest req;
    res = ResolvePaths(args[0].get<std::string>(), args[1].get<std::string>(), req);
    if (!res.is_ok()) return res;

    if (args.size() == 3) {
        res = ParseOptionsRecord(args[2], req.options);
        if (!res.is_ok()) return res;
    }

    res = CheckTransform(req.options);
    if (!res.is_ok()) return res;

    out = std::move(req);
    return Result::Ok();
}

Result ValidateRequest(const std::string& source,
                       const std::string& destination,
                       ArchiveOptions options,
                       ArchiveRequest& out) {
    auto res = CheckPathValue(source, kSourcePathError);
    if (!res.is_ok()) return res;
    res = CheckPathValue(destination, kArchivePathError);
    if (!res.is_ok()) return res;

    ArchiveRequest req;
    res = ResolvePaths(source, destination, req);
    if (!res.is_ok()) return res;

    res = CheckTransform(options);
    if (!res.is_ok()) return res;

    req.options = std::move(options);
    out = std::move(req);
    return Result::Ok();
}

} // namespace filetar
