#ifndef TERMRAST_FRAMEBUFFER_HPP
#define TERMRAST_FRAMEBUFFER_HPP

#include <vector>

#include "termrast/color.hpp"

namespace termrast {

constexpr Color DEFAULT_CLEAR_COLOR(12, 12, 20);

// ============================================================================
// Framebuffer - stores color and depth for each pixel
// ============================================================================
//
// Depth is view-space distance: smaller is nearer, +infinity is empty.

class Framebuffer {
public:
    int width = 0, height = 0;
    Color clear_color = DEFAULT_CLEAR_COLOR;
    std::vector<Pixel> color_buffer;
    std::vector<float> depth_buffer;

    Framebuffer() = default;
    Framebuffer(int w, int h, Color clear_color = DEFAULT_CLEAR_COLOR);

    // Clear color with alpha 0, depth +infinity
    void clear();

    // Reallocates to the new dimensions and clears, even if unchanged
    void resize(int new_width, int new_height);

    bool in_bounds(int x, int y) const { return x >= 0 && x < width && y >= 0 && y < height; }
    int index(int x, int y) const { return y * width + x; }

    // Writes only when in bounds and depth < stored depth. Returns whether
    // the pixel was written.
    bool set_pixel(int x, int y, const Color& color, float depth);

    // Out of bounds reads return a cleared pixel / +infinity
    Pixel get_pixel(int x, int y) const;
    float get_depth(int x, int y) const;

    // Save framebuffer to PNG file for debugging
    bool save_to_file(const char* filename) const;
};

}  // namespace termrast

#endif  // TERMRAST_FRAMEBUFFER_HPP
