#include "resample.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

static uint32_t to_extent(double v) {
    const double max_extent = (double)std::numeric_limits<uint32_t>::max();
    if (!(v >= 1.0)) return 1;
    if (v >= max_extent) return std::numeric_limits<uint32_t>::max();
    return (uint32_t)std::lround(v);
}

uint32_t rows_for_width(uint32_t src_w, uint32_t src_h, uint32_t cols, double cell_aspect) {
    return to_extent((double)cols * src_h / src_w * cell_aspect);
}

uint32_t cols_for_height(uint32_t src_w, uint32_t src_h, uint32_t rows, double cell_aspect) {
    return to_extent((double)rows * src_w / src_h / cell_aspect);
}

static uint32_t check_derived(const char* side, uint32_t extent) {
    if (extent > MAX_DERIVED_EXTENT) {
        std::ostringstream oss;
        oss << "Derived " << side << " " << extent << " exceeds " << MAX_DERIVED_EXTENT
            << " cells (check --cell-aspect)";
        throw InvalidDimensions(oss.str());
    }
    return extent;
}

GridSize resolve_grid_size(uint32_t src_w, uint32_t src_h,
                           std::optional<uint32_t> width,
                           std::optional<uint32_t> height,
                           GridSize terminal,
                           double cell_aspect) {
    if (src_w == 0 || src_h == 0) {
        throw InvalidDimensions("Source image is empty");
    }
    if (!(cell_aspect > 0.0) || !std::isfinite(cell_aspect)) {
        throw InvalidDimensions("Cell aspect must be a positive number");
    }
    if ((width && *width == 0) || (height && *height == 0)) {
        throw InvalidDimensions("Requested width and height must be at least 1");
    }

    if (width && height) {
        return {*width, *height};
    }
    if (width) {
        return {*width, check_derived("height", rows_for_width(src_w, src_h, *width, cell_aspect))};
    }
    if (height) {
        return {check_derived("width", cols_for_height(src_w, src_h, *height, cell_aspect)), *height};
    }

    // Fit into the terminal, leaving a margin of two cells on each axis
    uint32_t max_w = terminal.cols > 2 ? terminal.cols - 2 : 1;
    uint32_t max_h = terminal.rows > 2 ? terminal.rows - 2 : 1;

    GridSize size{max_w, rows_for_width(src_w, src_h, max_w, cell_aspect)};
    if (size.rows > max_h) {
        size.rows = max_h;
        size.cols = std::min(max_w, cols_for_height(src_w, src_h, max_h, cell_aspect));
    }
    return size;
}

// --- Box filter ---

/// Source range [begin, end) covered by output index i of n
struct Span {
    uint32_t begin;
    uint32_t end;
};

static Span source_span(uint64_t i, uint64_t n, uint32_t src) {
    uint32_t begin = (uint32_t)(i * src / n);
    uint32_t end = (uint32_t)((i + 1) * src / n);
    if (end <= begin) {
        // Upscaling: nearest source pixel to the centre of the output slot
        uint32_t nearest = (uint32_t)((2 * i + 1) * src / (2 * n));
        nearest = std::min(nearest, src - 1);
        return {nearest, nearest + 1};
    }
    return {begin, end};
}

static Color average(const PixelBuffer& image, Span xs, Span ys) {
    uint64_t r = 0, g = 0, b = 0, a = 0;
    for (uint32_t y = ys.begin; y < ys.end; y++) {
        for (uint32_t x = xs.begin; x < xs.end; x++) {
            const Color& p = image.at(x, y);
            r += p.r;
            g += p.g;
            b += p.b;
            a += p.a;
        }
    }
    uint64_t n = (uint64_t)(xs.end - xs.begin) * (ys.end - ys.begin);
    return {(uint8_t)((r + n / 2) / n), (uint8_t)((g + n / 2) / n),
            (uint8_t)((b + n / 2) / n), (uint8_t)((a + n / 2) / n)};
}

SampleGrid resample(const PixelBuffer& image, GridSize size, RenderMode mode) {
    if (image.empty()) {
        throw InvalidDimensions("Cannot resample an empty image");
    }
    if (size.cols == 0 || size.rows == 0) {
        std::ostringstream oss;
        oss << "Invalid output size " << size.cols << "x" << size.rows;
        throw InvalidDimensions(oss.str());
    }

    SampleGrid grid;
    grid.size = size;
    grid.mode = mode;
    grid.samples.reserve(size_t(size.cols) * size.rows);

    std::vector<Span> columns(size.cols);
    for (uint32_t cx = 0; cx < size.cols; cx++) {
        columns[cx] = source_span(cx, size.cols, image.width());
    }

    for (uint32_t cy = 0; cy < size.rows; cy++) {
        if (mode == RenderMode::Block) {
            Span ys = source_span(cy, size.rows, image.height());
            for (uint32_t cx = 0; cx < size.cols; cx++) {
                Color c = average(image, columns[cx], ys);
                grid.samples.push_back({c, c});
            }
        } else {
            uint64_t sub_rows = (uint64_t)size.rows * 2;
            Span top = source_span((uint64_t)cy * 2, sub_rows, image.height());
            Span bottom = source_span((uint64_t)cy * 2 + 1, sub_rows, image.height());
            for (uint32_t cx = 0; cx < size.cols; cx++) {
                grid.samples.push_back({average(image, columns[cx], top),
                                        average(image, columns[cx], bottom)});
            }
        }
    }

    return grid;
}
