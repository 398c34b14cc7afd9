#pragma once

#include "resample.hpp"
#include <memory>

/// Fallback size when the output is not a terminal
static const GridSize DEFAULT_TERMINAL_SIZE{80, 24};

/// Abstract source of the output terminal size
class TerminalProbe {
public:
    virtual ~TerminalProbe() = default;

    /// Columns and rows available for output
    virtual GridSize output_size() = 0;
};

/// Always reports the same size
class FixedTerminalProbe : public TerminalProbe {
public:
    explicit FixedTerminalProbe(GridSize size = DEFAULT_TERMINAL_SIZE) : size_(size) {}

    GridSize output_size() override { return size_; }

private:
    GridSize size_;
};

/// Create the default probe (selected at build time)
std::unique_ptr<TerminalProbe> create_terminal_probe();
