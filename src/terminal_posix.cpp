#include "terminal_posix.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

PosixTerminalProbe::PosixTerminalProbe(int fd) : fd_(fd) {}

PosixTerminalProbe::PosixTerminalProbe() : fd_(STDOUT_FILENO) {}

GridSize PosixTerminalProbe::output_size() {
    if (!isatty(fd_)) {
        return DEFAULT_TERMINAL_SIZE;
    }

    winsize win{};
    if (ioctl(fd_, TIOCGWINSZ, &win) != 0 || win.ws_col == 0 || win.ws_row == 0) {
        return DEFAULT_TERMINAL_SIZE;
    }
    return {win.ws_col, win.ws_row};
}

// Factory function for the POSIX backend
#ifdef ANSIMAKE_TERMINAL_POSIX
std::unique_ptr<TerminalProbe> create_terminal_probe() {
    return std::make_unique<PosixTerminalProbe>();
}
#endif
