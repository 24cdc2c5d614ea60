#include <cli/terminal.h>
#include <iostream>

#ifdef _WIN32
#include <io.h>
#define HANDOVER_ISATTY(fd) _isatty(fd)
#else
#include <unistd.h>
#define HANDOVER_ISATTY(fd) isatty(fd)
#endif

namespace handover::cli {

bool Terminal::IsInteractive() {
    return HANDOVER_ISATTY(1) != 0;
}

void Terminal::PrintInfo(const std::string& message) {
    if (IsInteractive()) {
        std::cout << "\033[32m[INFO] " << message << "\033[0m" << std::endl;
    } else {
        std::cout << "[INFO] " << message << std::endl;
    }
}

void Terminal::PrintError(const std::string& message) {
    if (IsInteractive()) {
        std::cerr << "\033[31m[ERROR] " << message << "\033[0m" << std::endl;
    } else {
        std::cerr << "[ERROR] " << message << std::endl;
    }
}

} // namespace handover::cli
