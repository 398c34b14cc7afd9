#include "ansi.hpp"
#include <algorithm>
#include <cmath>

static std::string color_escape(int selector, const Color& c, const char* esc) {
    std::string out = esc;
    out += '[';
    out += std::to_string(selector);
    out += ";2;";
    out += std::to_string((int)c.r);
    out += ';';
    out += std::to_string((int)c.g);
    out += ';';
    out += std::to_string((int)c.b);
    out += 'm';
    return out;
}

std::string foreground_escape(const Color& c, const char* esc) {
    return color_escape(38, c, esc);
}

std::string background_escape(const Color& c, const char* esc) {
    return color_escape(48, c, esc);
}

std::string reset_escape(const char* esc) {
    return std::string(esc) + "[0m";
}

static const char* const SHADE_GLYPHS[] = {
    GLYPH_SPACE, GLYPH_LIGHT_SHADE, GLYPH_MEDIUM_SHADE, GLYPH_DARK_SHADE, GLYPH_FULL_BLOCK,
};

const char* shade_glyph(const Color& c) {
    const int max_index = 4;
    double perceptual = std::pow(luma(c) / 255.0, 1.0 / 2.2);
    int index = std::clamp((int)std::lround(perceptual * max_index), 0, max_index);
    return SHADE_GLYPHS[index];
}

static bool same_rgb(const std::optional<Color>& x, const std::optional<Color>& y) {
    if (!x || !y) return !x && !y;
    return x->same_rgb(*y);
}

std::string serialize(const CellGrid& grid, bool raw) {
    const char* esc = raw ? ESC_LITERAL : ESC_BYTE;
    const std::string reset = reset_escape(esc);

    std::string out;
    out.reserve(size_t(grid.size.cols) * grid.size.rows * 24);

    for (uint32_t y = 0; y < grid.size.rows; y++) {
        // Color state does not survive a line wrap reliably
        std::optional<Color> cur_fg;
        std::optional<Color> cur_bg;

        for (uint32_t x = 0; x < grid.size.cols; x++) {
            const Cell& cell = grid.at(x, y);

            // Dropping back to the default color needs a full reset
            if ((!cell.fg && cur_fg) || (!cell.bg && cur_bg)) {
                out += reset;
                cur_fg.reset();
                cur_bg.reset();
            }
            if (cell.fg && !same_rgb(cell.fg, cur_fg)) {
                out += color_escape(38, *cell.fg, esc);
                cur_fg = cell.fg;
            }
            if (cell.bg && !same_rgb(cell.bg, cur_bg)) {
                out += color_escape(48, *cell.bg, esc);
                cur_bg = cell.bg;
            }
            out += cell.glyph;
        }

        out += reset;
        out += '\n';
    }

    return out;
}
