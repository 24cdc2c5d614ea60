#pragma once

#include <core/model/progress_snapshot.h>
#include <cstddef>
#include <string>

namespace handover::cli {

class ProgressDisplay {
public:
    explicit ProgressDisplay(std::size_t bar_width = 30);
    ~ProgressDisplay() = default;

    void UpdateProgress(const core::ProgressSnapshot& snapshot);
    void ClearProgress();

    // Ends the progress line so later output starts on a fresh one
    void Finish();

    static std::string FormatLine(const core::ProgressSnapshot& snapshot, std::size_t bar_width);

private:
    std::size_t bar_width_;
    std::size_t last_length_{0};

    void printProgress(const core::ProgressSnapshot& snapshot);
};

} // namespace handover::cli
