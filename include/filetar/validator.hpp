#pragma once

#include "filetar/options.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace filetar {

// One archiving invocation, fixed once validation passes.
struct ArchiveRequest {
    std::string source_path;      // absolute
    std::string destination_path; // absolute, != source_path
    ArchiveOptions options;
};

// Checks raw positional arguments (source, destination[, options record]) as
// they arrive from the command line or a config file. No filesystem access.
Result ValidateArguments(const std::vector<nlohmann::json>& args, ArchiveRequest& out);

// Typed entry point: checks paths, identity and the transform capability.
Result ValidateRequest(const std::string& source,
                       const std::string& destination,
                       ArchiveOptions options,
                       ArchiveRequest& out);

} // namespace filetar
