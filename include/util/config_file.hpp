#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

namespace filetar::config {

// Reads a file holding one JSON object (the options record).
std::expected<nlohmann::json, std::string> LoadJsonObjectFromFile(const std::string& path);

} // namespace filetar::config
