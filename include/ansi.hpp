#pragma once

#include "image.hpp"
#include "resample.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// UTF-8 glyphs
static const char* const GLYPH_SPACE       = " ";
static const char* const GLYPH_UPPER_HALF  = "\xE2\x96\x80";  // U+2580
static const char* const GLYPH_LOWER_HALF  = "\xE2\x96\x84";  // U+2584
static const char* const GLYPH_FULL_BLOCK  = "\xE2\x96\x88";  // U+2588
static const char* const GLYPH_LIGHT_SHADE = "\xE2\x96\x91";  // U+2591
static const char* const GLYPH_MEDIUM_SHADE = "\xE2\x96\x92"; // U+2592
static const char* const GLYPH_DARK_SHADE  = "\xE2\x96\x93";  // U+2593

static const char* const ESC_BYTE = "\x1b";
static const char* const ESC_LITERAL = "\\x1b";

/// One output character: glyph plus the colors it needs.
/// A missing color means the terminal default.
struct Cell {
    std::optional<Color> fg;
    std::optional<Color> bg;
    const char* glyph = GLYPH_SPACE;
};

/// Row-major grid of cells
struct CellGrid {
    GridSize size;
    std::vector<Cell> cells;

    const Cell& at(uint32_t x, uint32_t y) const { return cells[size_t(y) * size.cols + x]; }
};

/// ESC[38;2;R;G;Bm
std::string foreground_escape(const Color& c, const char* esc = ESC_BYTE);

/// ESC[48;2;R;G;Bm
std::string background_escape(const Color& c, const char* esc = ESC_BYTE);

/// ESC[0m
std::string reset_escape(const char* esc = ESC_BYTE);

/// Shade glyph (space, U+2591..U+2593, U+2588) for a color's perceived brightness
const char* shade_glyph(const Color& c);

/// Serialize a grid row by row. Color escapes are only written when the
/// color differs from the previous cell in the same row; every row ends
/// with a reset and a newline. With `raw` the ESC byte is written as the
/// text "\x1b".
std::string serialize(const CellGrid& grid, bool raw = false);
