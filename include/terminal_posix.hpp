#pragma once

#include "terminal.hpp"

/// Queries the window size of a file descriptor with TIOCGWINSZ
class PosixTerminalProbe : public TerminalProbe {
public:
    explicit PosixTerminalProbe(int fd);
    PosixTerminalProbe();

    GridSize output_size() override;

private:
    int fd_;
};
