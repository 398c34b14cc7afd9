#include "errors.hpp"
#include "minitest.hpp"
#include "resample.hpp"

#include <vector>

static const Color RED{255, 0, 0};
static const Color BLUE{0, 0, 255};

static PixelBuffer checkerboard(uint32_t w, uint32_t h) {
    PixelBuffer img(w, h);
    for (uint32_t y = 0; y < h; y++) {
        for (uint32_t x = 0; x < w; x++) {
            img.set(x, y, (x + y) % 2 == 0 ? RED : BLUE);
        }
    }
    return img;
}

static bool test_uniform_image() {
    const Color teal{17, 140, 133, 255};
    const GridSize sources[] = {{1, 1}, {3, 7}, {64, 48}, {5, 200}};
    const GridSize targets[] = {{1, 1}, {2, 3}, {10, 10}, {80, 24}, {7, 300}};
    for (const auto& src : sources) {
        PixelBuffer img(src.cols, src.rows, teal);
        for (const auto& dst : targets) {
            for (RenderMode mode : {RenderMode::Block, RenderMode::HalfBlock}) {
                SampleGrid grid = resample(img, dst, mode);
                CHECK(grid.size == dst);
                CHECK(grid.samples.size() == size_t(dst.cols) * dst.rows);
                for (const auto& s : grid.samples) {
                    CHECK(s.top == teal);
                    CHECK(s.bottom == teal);
                }
            }
        }
    }
    return true;
}

static bool test_box_average() {
    SampleGrid grid = resample(checkerboard(2, 2), {1, 1}, RenderMode::Block);
    CHECK(grid.at(0, 0).top == (Color{128, 0, 128, 255}));
    CHECK(grid.at(0, 0).bottom == grid.at(0, 0).top);

    // 4x4 image, 2x2 cells of 2x2 pixels each
    PixelBuffer img(4, 4, Color{0, 0, 0});
    img.set(0, 0, Color{200, 100, 40});
    SampleGrid quad = resample(img, {2, 2}, RenderMode::Block);
    CHECK(quad.at(0, 0).top == (Color{50, 25, 10, 255}));
    CHECK(quad.at(1, 0).top == (Color{0, 0, 0, 255}));
    CHECK(quad.at(1, 1).top == (Color{0, 0, 0, 255}));
    return true;
}

static bool test_half_block_split() {
    SampleGrid grid = resample(checkerboard(2, 2), {2, 1}, RenderMode::HalfBlock);
    CHECK(grid.at(0, 0).top == RED);
    CHECK(grid.at(0, 0).bottom == BLUE);
    CHECK(grid.at(1, 0).top == BLUE);
    CHECK(grid.at(1, 0).bottom == RED);
    return true;
}

static bool test_nearest_fallback() {
    PixelBuffer img(2, 1);
    img.set(0, 0, RED);
    img.set(1, 0, BLUE);
    SampleGrid grid = resample(img, {4, 3}, RenderMode::HalfBlock);
    for (uint32_t y = 0; y < 3; y++) {
        CHECK(grid.at(0, y).top == RED);
        CHECK(grid.at(1, y).top == RED);
        CHECK(grid.at(2, y).top == BLUE);
        CHECK(grid.at(3, y).bottom == BLUE);
    }
    return true;
}

static bool test_alpha_is_averaged() {
    PixelBuffer img(2, 1);
    img.set(0, 0, Color{10, 10, 10, 255});
    img.set(1, 0, Color{10, 10, 10, 0});
    SampleGrid grid = resample(img, {1, 1}, RenderMode::Block);
    CHECK(grid.at(0, 0).top.a == 128);
    return true;
}

static bool test_invalid_sizes() {
    PixelBuffer img(4, 4);
    CHECK_THROWS(resample(img, {0, 3}, RenderMode::Block), InvalidDimensions);
    CHECK_THROWS(resample(img, {3, 0}, RenderMode::HalfBlock), InvalidDimensions);
    CHECK_THROWS(resample(PixelBuffer(), {3, 3}, RenderMode::Block), InvalidDimensions);
    return true;
}

static bool test_grid_sizing() {
    const GridSize term{82, 26};
    CHECK(rows_for_width(100, 100, 40) == 20);
    CHECK(cols_for_height(100, 100, 20) == 40);
    CHECK(rows_for_width(100, 100, 40, 1.0) == 40);
    CHECK(rows_for_width(1000, 10, 5) == 1);

    CHECK(resolve_grid_size(100, 100, 40u, 30u, term) == (GridSize{40, 30}));
    CHECK(resolve_grid_size(200, 100, 60u, std::nullopt, term) == (GridSize{60, 15}));
    CHECK(resolve_grid_size(200, 100, std::nullopt, 15u, term) == (GridSize{60, 15}));

    // fit into 80x24 after the margin
    CHECK(resolve_grid_size(200, 100, std::nullopt, std::nullopt, term) == (GridSize{80, 20}));
    CHECK(resolve_grid_size(100, 400, std::nullopt, std::nullopt, term) == (GridSize{12, 24}));
    CHECK(resolve_grid_size(10, 10, std::nullopt, std::nullopt, GridSize{1, 1}) == (GridSize{1, 1}));

    CHECK_THROWS(resolve_grid_size(100, 100, 0u, std::nullopt, term), InvalidDimensions);
    CHECK_THROWS(resolve_grid_size(100, 100, std::nullopt, 0u, term), InvalidDimensions);
    CHECK_THROWS(resolve_grid_size(0, 100, 10u, 10u, term), InvalidDimensions);
    CHECK_THROWS(resolve_grid_size(100, 100, 10u, std::nullopt, term, 0.0), InvalidDimensions);

    // a tiny cell aspect would derive billions of columns
    CHECK_THROWS(resolve_grid_size(100, 100, std::nullopt, 10u, term, 1e-300), InvalidDimensions);
    CHECK_THROWS(resolve_grid_size(100, 100, 10u, std::nullopt, term, 1e300), InvalidDimensions);
    CHECK(resolve_grid_size(100, 100, std::nullopt, 5000u, term) == (GridSize{MAX_DERIVED_EXTENT, 5000}));
    // explicit sizes and terminal fits are not limited
    CHECK(resolve_grid_size(100, 100, 20000u, 3u, term) == (GridSize{20000, 3}));
    CHECK(resolve_grid_size(100, 100, std::nullopt, std::nullopt, term, 1e-300).cols == 80);
    return true;
}

int main() {
    bool ok = true;
    ok &= run_test("uniform image stays uniform", test_uniform_image);
    ok &= run_test("box average", test_box_average);
    ok &= run_test("half-block split", test_half_block_split);
    ok &= run_test("nearest-neighbour fallback", test_nearest_fallback);
    ok &= run_test("alpha averaged", test_alpha_is_averaged);
    ok &= run_test("invalid sizes", test_invalid_sizes);
    ok &= run_test("grid sizing", test_grid_sizing);
    return finish(ok);
}
