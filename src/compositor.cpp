#include "termrast/compositor.hpp"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace termrast {

CellGrid compose_cells(const Framebuffer& fb, int width_chars, int height_chars, double factor) {
    CellGrid grid;
    grid.width = std::max(0, width_chars);
    grid.height = std::max(0, height_chars);
    grid.cells.assign(static_cast<size_t>(grid.width) * grid.height,
                      Cell{fb.clear_color, fb.clear_color});

    if (fb.width == 0 || fb.height == 0) {
        return grid;
    }

    // Sub-pixels per axis in each half cell
    int samples = std::max(1, static_cast<int>(factor));
    int sample_count = samples * samples;

    for (int cy = 0; cy < grid.height; cy++) {
        int top_y_base = static_cast<int>(cy * 2 * factor);
        int bot_y_base = static_cast<int>((cy * 2 + 1) * factor);

        for (int cx = 0; cx < grid.width; cx++) {
            int col_base = static_cast<int>(cx * factor);

            int tr = 0, tg = 0, tb = 0;
            int br = 0, bg = 0, bb = 0;

            for (int sy = 0; sy < samples; sy++) {
                int ty = std::min(top_y_base + sy, fb.height - 1);
                int by = std::min(bot_y_base + sy, fb.height - 1);

                for (int sx = 0; sx < samples; sx++) {
                    int px = std::min(col_base + sx, fb.width - 1);

                    const Color& top = fb.color_buffer[fb.index(px, ty)].color;
                    const Color& bottom = fb.color_buffer[fb.index(px, by)].color;
                    tr += top.r;
                    tg += top.g;
                    tb += top.b;
                    br += bottom.r;
                    bg += bottom.g;
                    bb += bottom.b;
                }
            }

            Cell& cell = grid.cells[cy * grid.width + cx];
            cell.top = Color::clamped(tr / sample_count, tg / sample_count, tb / sample_count);
            cell.bottom = Color::clamped(br / sample_count, bg / sample_count, bb / sample_count);
        }
    }
    return grid;
}

std::vector<std::string> format_lines(const CellGrid& grid) {
    std::vector<std::string> lines;
    lines.reserve(grid.height);

    for (int y = 0; y < grid.height; y++) {
        std::string line;
        line.reserve(grid.width * 40);
        for (int x = 0; x < grid.width; x++) {
            const Cell& cell = grid.at(x, y);

            // Foreground = top pixel, background = bottom pixel
            char buf[64];
            snprintf(buf, sizeof(buf), "\033[38;2;%d;%d;%dm\033[48;2;%d;%d;%dm",
                     cell.top.r, cell.top.g, cell.top.b,
                     cell.bottom.r, cell.bottom.g, cell.bottom.b);
            line += buf;
            line += HALF_BLOCK;
        }
        line += "\033[0m";
        lines.push_back(std::move(line));
    }
    return lines;
}

}  // namespace termrast
