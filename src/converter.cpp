#include "converter.hpp"
#include "errors.hpp"
#include "quantizer.hpp"
#include <sstream>

SampleGrid quantize_samples(const SampleGrid& grid, double tolerance, uint8_t alpha_threshold) {
    SampleGrid out = grid;
    ColorQuantizer quantizer(tolerance);
    if (!quantizer.enabled()) {
        return out;
    }

    for (auto& sample : out.samples) {
        if (sample.top.a >= alpha_threshold) {
            sample.top = quantizer.map(sample.top);
        }
        if (grid.mode == RenderMode::Block) {
            sample.bottom = sample.top;
        } else if (sample.bottom.a >= alpha_threshold) {
            sample.bottom = quantizer.map(sample.bottom);
        }
    }
    return out;
}

static Cell block_cell(const CellSample& s, const ConversionConfig& config) {
    Cell cell;
    if (s.top.a < config.alpha_threshold) {
        return cell;
    }
    cell.fg = s.top;
    cell.glyph = config.shade_blocks ? shade_glyph(s.top) : GLYPH_FULL_BLOCK;
    return cell;
}

static Cell half_block_cell(const CellSample& s, const ConversionConfig& config) {
    bool top_visible = s.top.a >= config.alpha_threshold;
    bool bottom_visible = s.bottom.a >= config.alpha_threshold;

    Cell cell;
    if (top_visible && bottom_visible) {
        cell.fg = s.top;
        cell.bg = s.bottom;
        cell.glyph = GLYPH_UPPER_HALF;
    } else if (top_visible) {
        cell.fg = s.top;
        cell.glyph = GLYPH_UPPER_HALF;
    } else if (bottom_visible) {
        cell.fg = s.bottom;
        cell.glyph = GLYPH_LOWER_HALF;
    }
    return cell;
}

CellGrid build_cells(const SampleGrid& grid, const ConversionConfig& config) {
    CellGrid cells;
    cells.size = grid.size;
    cells.cells.reserve(grid.samples.size());
    for (const auto& sample : grid.samples) {
        cells.cells.push_back(grid.mode == RenderMode::Block ? block_cell(sample, config)
                                                             : half_block_cell(sample, config));
    }
    return cells;
}

std::string convert_to_ansi(const PixelBuffer& image, const ConversionConfig& config) {
    if (config.size.cols == 0 || config.size.rows == 0) {
        std::ostringstream oss;
        oss << "Invalid output size " << config.size.cols << "x" << config.size.rows;
        throw InvalidDimensions(oss.str());
    }
    if (image.empty()) {
        throw InvalidDimensions("Cannot convert an empty image");
    }

    RenderMode mode = config.use_blocks ? RenderMode::Block : RenderMode::HalfBlock;
    SampleGrid samples = config.bw ? resample(image.to_grayscale(), config.size, mode)
                                   : resample(image, config.size, mode);
    if (config.color_tolerance > 0.0) {
        samples = quantize_samples(samples, config.color_tolerance, config.alpha_threshold);
    }
    return serialize(build_cells(samples, config), config.raw);
}

std::string PixelBuffer::to_ansi(const ConversionConfig& config) const {
    return convert_to_ansi(*this, config);
}
