#pragma once

#include "converter.hpp"
#include "resample.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

/// Parsed command line
struct CliOptions {
    std::string image_path;
    bool bw = false;
    std::optional<uint32_t> width;
    std::optional<uint32_t> height;
    double tolerance = 0.0;
    bool use_blocks = false;
    bool raw = false;
    bool shade_blocks = false;
    uint8_t alpha_threshold = 128;
    double cell_aspect = DEFAULT_CELL_ASPECT;
    bool verbose = false;
    bool help = false;

    /// Resolve the grid for a source image and build the conversion config
    ConversionConfig to_config(uint32_t src_w, uint32_t src_h, GridSize terminal) const;
};

/// Parse argv; throws ArgumentError. With --help the path may be empty.
CliOptions parse_args(int argc, const char* const* argv);

void print_usage(std::ostream& os, const char* prog);
