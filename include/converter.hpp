#pragma once

#include "ansi.hpp"
#include "image.hpp"
#include "resample.hpp"
#include <cstdint>
#include <string>

/// Parameters for one conversion
struct ConversionConfig {
    GridSize size{80, 24};
    bool use_blocks = false;        // one sample per cell instead of two
    double color_tolerance = 0.0;   // CIE76 threshold, 0 disables quantization
    bool bw = false;                // grayscale before resampling
    uint8_t alpha_threshold = 128;  // samples below are transparent
    bool raw = false;               // write ESC as the text "\x1b"
    bool shade_blocks = false;      // block mode: pick glyph by brightness
};

/// Quantize every visible sample in row-major order, top before bottom
SampleGrid quantize_samples(const SampleGrid& grid, double tolerance, uint8_t alpha_threshold);

/// Choose glyph and colors for each resampled cell
CellGrid build_cells(const SampleGrid& grid, const ConversionConfig& config);

/// Full pipeline: grayscale (bw) -> resample -> quantize -> cells -> text.
/// Throws InvalidDimensions before producing any output.
std::string convert_to_ansi(const PixelBuffer& image, const ConversionConfig& config);
