#include <algorithm>
#include <cli/progress_display.h>
#include <cmath>
#include <iostream>
#include <sstream>

namespace handover::cli {

ProgressDisplay::ProgressDisplay(std::size_t bar_width)
    : bar_width_(bar_width) {}

std::string ProgressDisplay::FormatLine(const core::ProgressSnapshot& snapshot,
                                        std::size_t bar_width) {
    auto filled = static_cast<std::size_t>(
        std::floor(std::clamp(snapshot.fraction, 0.0, 1.0) * static_cast<double>(bar_width)));

    std::ostringstream oss;
    oss << "[" << std::string(filled, '#') << std::string(bar_width - filled, '.') << "] "
        << snapshot.percentage;
    if (!snapshot.eta.empty()) {
        oss << " | " << snapshot.eta;
    }
    if (!snapshot.transfer_speed.empty()) {
        oss << " | " << snapshot.transfer_speed;
    }
    if (!snapshot.interface_label.empty()) {
        oss << " | " << snapshot.interface_label;
    }
    if (!snapshot.power_connected) {
        oss << " | on battery";
    }
    return oss.str();
}

// 私有方法，用于打印进度信息
void ProgressDisplay::printProgress(const core::ProgressSnapshot& snapshot) {
    auto line = FormatLine(snapshot, bar_width_);
    std::cout << "\r" << line;
    // 覆盖上一行残留的字符
    if (line.size() < last_length_) {
        std::cout << std::string(last_length_ - line.size(), ' ');
    }
    std::cout << std::flush;
    last_length_ = line.size();
}

// 更新进度信息
void ProgressDisplay::UpdateProgress(const core::ProgressSnapshot& snapshot) {
    printProgress(snapshot);
}

// 清除进度信息
void ProgressDisplay::ClearProgress() {
    std::cout << "\r" << std::string(last_length_, ' ') << "\r" << std::flush;
    last_length_ = 0;
}

void ProgressDisplay::Finish() {
    if (last_length_ > 0) {
        std::cout << std::endl;
        last_length_ = 0;
    }
}

} // namespace handover::cli
