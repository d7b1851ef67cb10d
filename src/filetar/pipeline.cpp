#include "filetar/pipeline.hpp"

#include "filetar/tar_packer.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <string>
#include <vector>

namespace filetar {

Result ComposePipeline(const ArchiveRequest& request,
                       std::shared_ptr<IWritable> writer,
                       ProgressEmitter::OnProgress on_progress,
                       StageChain& out) {
    if (!writer) return Result::Fail(EINVAL, "No destination writer");

    const ArchiveOptions& opts = request.options;

    // The emitter raises into the packer, which owns the emitter through its
    // hook; the back edge is weak.
    auto packer_ref = std::make_shared<std::weak_ptr<TarPacker>>();
    auto emitter = std::make_shared<ProgressEmitter>(
        opts.map_stream, std::move(on_progress), [packer_ref](Result err) {
            if (auto packer = packer_ref->lock()) packer->RaiseError(std::move(err));
        });

    TarPacker::Hooks hooks;
    hooks.on_header = opts.map_header;
    hooks.on_entry_stream = [emitter](std::shared_ptr<IReadable> raw, const EntryHeader& header) {
        return emitter->Wrap(std::move(raw), header);
    };

    std::shared_ptr<TarPacker> packer;
    auto res = TarPacker::Create(DirName(request.source_path),
                                 std::vector<std::string>{BaseName(request.source_path)},
                                 std::move(hooks),
                                 opts.packer,
                                 packer);
    if (!res.is_ok()) return res;
    *packer_ref = packer;

    StageChain chain;
    chain.push_back(std::move(packer));
    if (opts.post_pack_transform) {
        chain.push_back(opts.post_pack_transform);
    }
    chain.push_back(std::move(writer));

    out = std::move(chain);
    return Result::Ok();
}

} // namespace filetar
