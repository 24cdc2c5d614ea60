#pragma once

#include <string>

namespace handover::cli {

class Terminal {
public:
    Terminal() = default;
    ~Terminal() = default;

    void PrintInfo(const std::string& message);
    void PrintError(const std::string& message);

    // Whether stdout is a terminal; colors are only emitted then
    static bool IsInteractive();
};

} // namespace handover::cli
