#include "util/config_file.hpp"

#include <fstream>

namespace filetar::config {

std::expected<nlohmann::json, std::string> LoadJsonObjectFromFile(const std::string& path) {
    std::ifstream is(path);
    if (!is.good()) {
        return std::unexpected("cannot open " + path);
    }

    nlohmann::json out;
    try {
        is >> out;
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected("invalid JSON in " + path + ": " + e.what());
    }

    if (!out.is_object()) {
        return std::unexpected("root must be JSON object: " + path);
    }
    return out;
}

} // namespace filetar::config
