#pragma once

#include "filetar/progress_emitter.hpp"
#include "filetar/pump.hpp"
#include "filetar/validator.hpp"
#include "io/stream.hpp"
#include "util/result.hpp"

#include <memory>

namespace filetar {

// Builds [packer, writer] or [packer, post_pack_transform, writer] for the
// request's single source file. Nothing runs until the chain is pumped.
Result ComposePipeline(const ArchiveRequest& request,
                       std::shared_ptr<IWritable> writer,
                       ProgressEmitter::OnProgress on_progress,
                       StageChain& out);

} // namespace filetar
