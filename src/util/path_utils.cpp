#include "util/path_utils.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace filetar {

std::string ResolvePath(std::string_view p) {
    std::error_code ec;
    fs::path abs = fs::absolute(fs::path(p), ec);
    if (ec) {
        abs = fs::path(p);
    }
    std::string out = abs.lexically_normal().string();
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

std::string DirName(std::string_view p) {
    const fs::path parent = fs::path(p).parent_path();
    return parent.empty() ? std::string("/") : parent.string();
}

std::string BaseName(std::string_view p) {
    return fs::path(p).filename().string();
}

} // namespace filetar
