#pragma once

#include "image.hpp"
#include <cstdint>
#include <optional>
#include <vector>

/// Vertical compression applied when one grid side is derived from the
/// other: a terminal cell is roughly twice as tall as it is wide
static const double DEFAULT_CELL_ASPECT = 0.5;

/// Upper bound for a grid side derived from the source aspect
static const uint32_t MAX_DERIVED_EXTENT = 10000;

/// Output grid size in character cells
struct GridSize {
    uint32_t cols = 0;
    uint32_t rows = 0;
};

inline bool operator==(const GridSize& x, const GridSize& y) {
    return x.cols == y.cols && x.rows == y.rows;
}

enum class RenderMode {
    HalfBlock,  // two stacked samples per cell
    Block,      // one sample per cell
};

/// Averaged source colors for one output cell; in block mode bottom == top
struct CellSample {
    Color top;
    Color bottom;
};

/// Resampled grid, row-major
struct SampleGrid {
    GridSize size;
    RenderMode mode = RenderMode::HalfBlock;
    std::vector<CellSample> samples;

    const CellSample& at(uint32_t x, uint32_t y) const { return samples[size_t(y) * size.cols + x]; }
};

/// Rows for `cols` columns preserving the source aspect (at least 1)
uint32_t rows_for_width(uint32_t src_w, uint32_t src_h, uint32_t cols,
                        double cell_aspect = DEFAULT_CELL_ASPECT);

/// Columns for `rows` rows preserving the source aspect (at least 1)
uint32_t cols_for_height(uint32_t src_w, uint32_t src_h, uint32_t rows,
                         double cell_aspect = DEFAULT_CELL_ASPECT);

/// Resolve the grid from optional user sizes. Missing sides are derived
/// from the source aspect; with neither side given the grid is fitted
/// into `terminal` minus a two-cell margin. Throws InvalidDimensions for
/// a zero request, a zero source, a non-positive cell_aspect or a derived
/// side above MAX_DERIVED_EXTENT.
GridSize resolve_grid_size(uint32_t src_w, uint32_t src_h,
                           std::optional<uint32_t> width,
                           std::optional<uint32_t> height,
                           GridSize terminal,
                           double cell_aspect = DEFAULT_CELL_ASPECT);

/// Box-filter `image` onto `size`. Each cell (cx, cy) averages source
/// pixels [cx*w/cols, (cx+1)*w/cols) x [cy*h/rows, (cy+1)*h/rows); in
/// half-block mode the vertical range is split into two halves. Empty
/// ranges fall back to the nearest source pixel. Throws InvalidDimensions.
SampleGrid resample(const PixelBuffer& image, GridSize size, RenderMode mode);
