#include "cli_options.hpp"
#include "errors.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

void print_usage(std::ostream& os, const char* prog) {
    os << "Usage: " << prog << " [options] <image_path>\n"
       << "\n"
       << "Convert an image to 24-bit color ANSI art\n"
       << "\n"
       << "Options:\n"
       << "  -b, --bw                 Convert to grayscale first\n"
       << "  -w, --width <N>          Output width in columns\n"
       << "      --height <N>         Output height in rows\n"
       << "  -t, --tolerance <F>      Merge colors closer than F (CIE76, default: 0)\n"
       << "  -B, --blocks             One color per cell instead of half blocks\n"
       << "  -s, --shade              Block mode: shade glyph by brightness\n"
       << "  -a, --alpha <N>          Alpha threshold 0-255 (default: 128)\n"
       << "      --cell-aspect <F>    Cell aspect correction (default: 0.5)\n"
       << "  -r, --raw                Print escapes as \\x1b text\n"
       << "  -v, --verbose            Print progress on stderr\n"
       << "  -h, --help               Show this help message\n"
       << "\n"
       << "Without --width or --height the image is fitted to the terminal.\n";
}

static uint64_t parse_uint(const std::string& flag, const std::string& value, uint64_t max) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw ArgumentError("Invalid value for " + flag + ": '" + value + "' (expected a non-negative integer)");
    }
    errno = 0;
    unsigned long long v = std::strtoull(value.c_str(), nullptr, 10);
    if (errno == ERANGE || v > max) {
        throw ArgumentError("Value for " + flag + " out of range: " + value);
    }
    return v;
}

static double parse_float(const std::string& flag, const std::string& value) {
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(value.c_str(), &end);
    if (value.empty() || end != value.c_str() + value.size() || errno == ERANGE ||
        !std::isfinite(v) || v < 0.0) {
        throw ArgumentError("Invalid value for " + flag + ": '" + value + "' (expected a number >= 0)");
    }
    return v;
}

CliOptions parse_args(int argc, const char* const* argv) {
    CliOptions opts;

    auto next_value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw ArgumentError("Missing value for " + flag);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--bw" || arg == "-b") {
            opts.bw = true;
        } else if (arg == "--blocks" || arg == "-B") {
            opts.use_blocks = true;
        } else if (arg == "--shade" || arg == "-s") {
            opts.shade_blocks = true;
        } else if (arg == "--raw" || arg == "-r") {
            opts.raw = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--width" || arg == "-w") {
            opts.width = (uint32_t)parse_uint(arg, next_value(i, arg), std::numeric_limits<uint32_t>::max());
        } else if (arg == "--height") {
            opts.height = (uint32_t)parse_uint(arg, next_value(i, arg), std::numeric_limits<uint32_t>::max());
        } else if (arg == "--tolerance" || arg == "-t") {
            opts.tolerance = parse_float(arg, next_value(i, arg));
        } else if (arg == "--alpha" || arg == "-a") {
            opts.alpha_threshold = (uint8_t)parse_uint(arg, next_value(i, arg), 255);
        } else if (arg == "--cell-aspect") {
            opts.cell_aspect = parse_float(arg, next_value(i, arg));
            if (opts.cell_aspect == 0.0) {
                throw ArgumentError("Value for --cell-aspect must be greater than 0");
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw ArgumentError("Unknown option: " + arg);
        } else if (!opts.image_path.empty()) {
            throw ArgumentError("Unexpected argument: " + arg);
        } else {
            opts.image_path = arg;
        }
    }

    if (!opts.help && opts.image_path.empty()) {
        throw ArgumentError("Please specify an image file");
    }
    return opts;
}

ConversionConfig CliOptions::to_config(uint32_t src_w, uint32_t src_h, GridSize terminal) const {
    ConversionConfig config;
    config.size = resolve_grid_size(src_w, src_h, width, height, terminal, cell_aspect);
    config.use_blocks = use_blocks;
    config.color_tolerance = tolerance;
    config.alpha_threshold = alpha_threshold;
    config.raw = raw;
    config.shade_blocks = shade_blocks;
    config.bw = bw;
    return config;
}
