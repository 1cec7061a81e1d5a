#ifndef TERMRAST_COLOR_HPP
#define TERMRAST_COLOR_HPP

#include <algorithm>
#include <cstdint>

namespace termrast {

// ============================================================================
// Color structure
// ============================================================================

struct Color {
    uint8_t r, g, b;

    constexpr Color() : r(0), g(0), b(0) {}
    constexpr Color(uint8_t r, uint8_t g, uint8_t b) : r(r), g(g), b(b) {}

    // Builds a color from unclamped channel values
    static Color clamped(int r, int g, int b) {
        return Color(
            static_cast<uint8_t>(std::clamp(r, 0, 255)),
            static_cast<uint8_t>(std::clamp(g, 0, 255)),
            static_cast<uint8_t>(std::clamp(b, 0, 255))
        );
    }

    bool operator==(const Color& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Color& o) const { return !(*this == o); }
};

// Unclamped floating point channels for lighting math
struct ColorF {
    double r = 0.0, g = 0.0, b = 0.0;

    static ColorF from(const Color& c) { return ColorF{double(c.r), double(c.g), double(c.b)}; }

    // Channels scaled by 1/255
    static ColorF unit(const Color& c) {
        constexpr double COLOR_SCALE = 1.0 / 255.0;
        return ColorF{c.r * COLOR_SCALE, c.g * COLOR_SCALE, c.b * COLOR_SCALE};
    }

    // Truncates each channel and clamps it to [0, 255]
    Color to_color() const {
        return Color(
            static_cast<uint8_t>(std::clamp(r, 0.0, 255.0)),
            static_cast<uint8_t>(std::clamp(g, 0.0, 255.0)),
            static_cast<uint8_t>(std::clamp(b, 0.0, 255.0))
        );
    }
};

// One color buffer entry; alpha is 0 for cleared pixels and 1 once written
struct Pixel {
    Color color;
    uint8_t alpha = 0;

    bool written() const { return alpha != 0; }
};

}  // namespace termrast

#endif  // TERMRAST_COLOR_HPP
