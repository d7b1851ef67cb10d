#pragma once

#include "filetar/progress.hpp"

#include <cstdint>
#include <string>

namespace filetar {

// Writes the latest snapshot as JSON to path (via path + ".tmp" and rename).
class FileProgressSink final : public IProgress {
public:
    explicit FileProgressSink(std::string path);

    void OnProgress(const ProgressEvent& e) override;

private:
    std::string path_;
};

class ConsoleProgressSink final : public IProgress {
public:
    ConsoleProgressSink() = default;

    void OnProgress(const ProgressEvent& e) override;

private:
    std::string last_entry_;
    bool entry_finished_ = false;
};

int ProgressPercent(std::uint64_t done, std::uint64_t total);

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace filetar
