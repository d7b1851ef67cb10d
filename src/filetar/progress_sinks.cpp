#include "filetar/progress_sinks.hpp"

#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

namespace filetar {

namespace {
bool g_progress_line_active = false;
} // namespace

int ProgressPercent(std::uint64_t done, std::uint64_t total) {
    // Empty entries are complete as soon as they start.
    if (total == 0) return 100;
    const std::uint64_t pct = (done * 100ULL) / total;
    return pct > 100 ? 100 : static_cast<int>(pct);
}

FileProgressSink::FileProgressSink(std::string path) : path_(std::move(path)) {}

void FileProgressSink::OnProgress(const ProgressEvent& e) {
    if (!e.header) return;

    nlohmann::json j;
    j["entry"] = e.header->name;
    j["bytes"] = e.bytes;
    j["size"] = e.header->size;
    j["percent"] = ProgressPercent(e.bytes, e.header->size);

    const std::string tmp_path = path_ + ".tmp";
    std::ofstream os(tmp_path, std::ios::trunc);
    if (!os.good())
        return;
    os << j.dump();
    os.close();

    std::rename(tmp_path.c_str(), path_.c_str());
}

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    if (!e.header) return;

    if (e.header->name != last_entry_) {
        entry_finished_ = false;
        last_entry_ = e.header->name;
    }
    if (entry_finished_) return;

    const int pct = ProgressPercent(e.bytes, e.header->size);
    std::fprintf(stderr,
                 "\r[%s] %3d%% (%llu/%llu bytes)",
                 e.header->name.c_str(),
                 pct,
                 (unsigned long long)e.bytes,
                 (unsigned long long)e.header->size);
    std::fflush(stderr);
    g_progress_line_active = true;

    if (e.bytes >= e.header->size) {
        std::fprintf(stderr, "\n");
        entry_finished_ = true;
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

} // namespace filetar
