#include "termrast/framebuffer.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <limits>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

namespace termrast {

Framebuffer::Framebuffer(int w, int h, Color clear_color) : clear_color(clear_color) {
    resize(w, h);
}

void Framebuffer::clear() {
    Pixel clear_pixel{clear_color, 0};
    std::fill(color_buffer.begin(), color_buffer.end(), clear_pixel);
    std::fill(depth_buffer.begin(), depth_buffer.end(), std::numeric_limits<float>::infinity());
}

void Framebuffer::resize(int new_width, int new_height) {
    int w = std::max(0, new_width);
    int h = std::max(0, new_height);
    size_t num_pixels = static_cast<size_t>(w) * static_cast<size_t>(h);

    // Allocate before touching any member so a failed allocation leaves the
    // old buffers and dimensions in place
    std::vector<Pixel> colors(num_pixels, Pixel{clear_color, 0});
    std::vector<float> depths(num_pixels, std::numeric_limits<float>::infinity());
    color_buffer.swap(colors);
    depth_buffer.swap(depths);
    width = w;
    height = h;
}

bool Framebuffer::set_pixel(int x, int y, const Color& color, float depth) {
    if (!in_bounds(x, y)) return false;
    int idx = index(x, y);
    if (depth < depth_buffer[idx]) {
        depth_buffer[idx] = depth;
        color_buffer[idx] = Pixel{color, 1};
        return true;
    }
    return false;
}

Pixel Framebuffer::get_pixel(int x, int y) const {
    if (!in_bounds(x, y)) return Pixel{clear_color, 0};
    return color_buffer[index(x, y)];
}

float Framebuffer::get_depth(int x, int y) const {
    if (!in_bounds(x, y)) return std::numeric_limits<float>::infinity();
    return depth_buffer[index(x, y)];
}

bool Framebuffer::save_to_file(const char* filename) const {
    if (width == 0 || height == 0) {
        std::cerr << "Failed to save framebuffer: buffer is empty" << std::endl;
        return false;
    }
    std::vector<uint8_t> pixels(static_cast<size_t>(width) * height * 3);
    for (size_t i = 0; i < color_buffer.size(); i++) {
        pixels[i * 3 + 0] = color_buffer[i].color.r;
        pixels[i * 3 + 1] = color_buffer[i].color.g;
        pixels[i * 3 + 2] = color_buffer[i].color.b;
    }
    int result = stbi_write_png(filename, width, height, 3, pixels.data(), width * 3);
    if (result == 0) {
        std::cerr << "Failed to save framebuffer: " << filename << std::endl;
        return false;
    }
    return true;
}

}  // namespace termrast
