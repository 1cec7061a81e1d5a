#ifndef TERMRAST_RASTERIZER_HPP
#define TERMRAST_RASTERIZER_HPP

#include <array>
#include <limits>

#include "termrast/color.hpp"
#include "termrast/framebuffer.hpp"

namespace termrast {

constexpr Color WIREFRAME_COLOR(255, 255, 255);

// Wireframe edges reaching further than this many pixels outside the
// buffer are skipped instead of being walked pixel by pixel
constexpr double LINE_GUARD_BAND = 16384.0;

// Projected vertex: integer pixel position (stored as double so far
// off-screen positions cannot overflow) and view-space depth. A depth of
// +infinity marks a vertex that could not be projected.
struct ScreenVertex {
    double x = 0.0;
    double y = 0.0;
    double z = std::numeric_limits<double>::infinity();

    bool valid() const { return z != std::numeric_limits<double>::infinity(); }
};

// Line equation A*x + B*y + C through (x0,y0) and (x1,y1)
struct EdgeCoeffs {
    double a, b, c;

    static EdgeCoeffs through(double x0, double y0, double x1, double y1) {
        return EdgeCoeffs{y0 - y1, x1 - x0, x0 * y1 - y0 * x1};
    }

    double eval(double x, double y) const { return a * x + b * y + c; }
};

// Pre-processed triangle data in screen space
struct ScreenTriangle {
    std::array<ScreenVertex, 3> verts;
    double area = 0.0;                       // twice the signed area
    int min_x = 0, max_x = -1, min_y = 0, max_y = -1;  // clipped pixel box
    bool valid = false;

    // Positive area is the front face
    bool front_facing() const { return area > 0.0; }
    bool box_empty() const { return min_x > max_x || min_y > max_y; }
};

// ============================================================================
// Rasterizer - triangle fill and line drawing into a Framebuffer
// ============================================================================

class Rasterizer {
public:
    Framebuffer& fb;

    explicit Rasterizer(Framebuffer& framebuffer) : fb(framebuffer) {}

    static double signed_area(const ScreenVertex& v0, const ScreenVertex& v1, const ScreenVertex& v2) {
        return (v1.x - v0.x) * (v2.y - v0.y) - (v1.y - v0.y) * (v2.x - v0.x);
    }

    // Invalid when any vertex failed projection or the area is zero. The
    // bounding box is clipped to the framebuffer.
    ScreenTriangle prepare_triangle(const ScreenVertex& v0, const ScreenVertex& v1,
                                    const ScreenVertex& v2) const;

    // Fills the triangle with one color using incremental edge functions and
    // a less-than depth test. Returns the number of pixels written.
    int rasterize_triangle(const ScreenTriangle& tri, const Color& color);

    // Bresenham line with linearly interpolated depth. Returns pixels written.
    int draw_line(const ScreenVertex& a, const ScreenVertex& b, const Color& color);

    // The three edges of a triangle
    int draw_triangle_edges(const ScreenTriangle& tri, const Color& color = WIREFRAME_COLOR);
};

}  // namespace termrast

#endif  // TERMRAST_RASTERIZER_HPP
