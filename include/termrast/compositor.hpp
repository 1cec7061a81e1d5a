#ifndef TERMRAST_COMPOSITOR_HPP
#define TERMRAST_COMPOSITOR_HPP

#include <string>
#include <vector>

#include "termrast/color.hpp"
#include "termrast/framebuffer.hpp"

namespace termrast {

// UTF-8 encoding of the upper half block (U+2580)
constexpr const char* HALF_BLOCK = "\xE2\x96\x80";

// One terminal character: the glyph's foreground shows the top pixel
// average, its background the bottom one
struct Cell {
    Color top;
    Color bottom;
};

struct CellGrid {
    int width = 0, height = 0;
    std::vector<Cell> cells;

    const Cell& at(int x, int y) const { return cells[y * width + x]; }
};

// Downsamples the framebuffer into width_chars x height_chars cells. Each
// half of a cell averages a factor x factor block of pixels (at least one),
// clamped to the buffer edge.
CellGrid compose_cells(const Framebuffer& fb, int width_chars, int height_chars, double factor);

// One string per character row using 24-bit ANSI colors and the half
// block glyph; every row ends with a color reset.
std::vector<std::string> format_lines(const CellGrid& grid);

}  // namespace termrast

#endif  // TERMRAST_COMPOSITOR_HPP
