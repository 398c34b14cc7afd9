#include "terminal.hpp"

// Factory function when no terminal backend is available
#ifndef ANSIMAKE_TERMINAL_POSIX
std::unique_ptr<TerminalProbe> create_terminal_probe() {
    return std::make_unique<FixedTerminalProbe>();
}
#endif
