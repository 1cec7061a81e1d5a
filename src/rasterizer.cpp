#include "termrast/rasterizer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace termrast {

ScreenTriangle Rasterizer::prepare_triangle(const ScreenVertex& v0, const ScreenVertex& v1,
                                            const ScreenVertex& v2) const {
    ScreenTriangle tri;
    tri.verts = {v0, v1, v2};

    // Skip triangles with a vertex behind the near plane
    if (!v0.valid() || !v1.valid() || !v2.valid()) {
        return tri;
    }

    tri.area = signed_area(v0, v1, v2);
    if (tri.area == 0.0) {
        return tri;
    }
    tri.valid = true;

    // Bounding box clipped to the buffer (computed in double, then narrowed)
    double min_x = std::max(0.0, std::min({v0.x, v1.x, v2.x}));
    double max_x = std::min(static_cast<double>(fb.width - 1), std::max({v0.x, v1.x, v2.x}));
    double min_y = std::max(0.0, std::min({v0.y, v1.y, v2.y}));
    double max_y = std::min(static_cast<double>(fb.height - 1), std::max({v0.y, v1.y, v2.y}));

    if (min_x <= max_x && min_y <= max_y) {
        tri.min_x = static_cast<int>(std::ceil(min_x));
        tri.max_x = static_cast<int>(std::floor(max_x));
        tri.min_y = static_cast<int>(std::ceil(min_y));
        tri.max_y = static_cast<int>(std::floor(max_y));
    }
    return tri;
}

int Rasterizer::rasterize_triangle(const ScreenTriangle& tri, const Color& color) {
    if (!tri.valid || tri.box_empty()) return 0;

    const ScreenVertex& v0 = tri.verts[0];
    const ScreenVertex& v1 = tri.verts[1];
    const ScreenVertex& v2 = tri.verts[2];
    double inv_area = 1.0 / tri.area;

    // w0 weighs v0 and vanishes on the edge v1-v2, and so on
    EdgeCoeffs e0 = EdgeCoeffs::through(v1.x, v1.y, v2.x, v2.y);
    EdgeCoeffs e1 = EdgeCoeffs::through(v2.x, v2.y, v0.x, v0.y);
    EdgeCoeffs e2 = EdgeCoeffs::through(v0.x, v0.y, v1.x, v1.y);

    // Weights at the top-left corner of the box
    double w0_row = e0.eval(tri.min_x, tri.min_y);
    double w1_row = e1.eval(tri.min_x, tri.min_y);
    double w2_row = e2.eval(tri.min_x, tri.min_y);

    int written = 0;
    for (int y = tri.min_y; y <= tri.max_y; y++) {
        double w0 = w0_row;
        double w1 = w1_row;
        double w2 = w2_row;
        int idx = y * fb.width + tri.min_x;

        for (int x = tri.min_x; x <= tri.max_x; x++) {
            // Same sign on all three edges covers both windings
            bool inside = (w0 >= 0 && w1 >= 0 && w2 >= 0) || (w0 <= 0 && w1 <= 0 && w2 <= 0);
            if (inside) {
                float depth = static_cast<float>((w0 * v0.z + w1 * v1.z + w2 * v2.z) * inv_area);
                if (depth < fb.depth_buffer[idx]) {
                    fb.depth_buffer[idx] = depth;
                    fb.color_buffer[idx] = Pixel{color, 1};
                    written++;
                }
            }
            w0 += e0.a;
            w1 += e1.a;
            w2 += e2.a;
            idx++;
        }

        w0_row += e0.b;
        w1_row += e1.b;
        w2_row += e2.b;
    }
    return written;
}

int Rasterizer::draw_line(const ScreenVertex& a, const ScreenVertex& b, const Color& color) {
    if (!a.valid() || !b.valid()) return 0;

    auto outside_guard = [this](const ScreenVertex& v) {
        return v.x < -LINE_GUARD_BAND || v.x > fb.width + LINE_GUARD_BAND ||
               v.y < -LINE_GUARD_BAND || v.y > fb.height + LINE_GUARD_BAND;
    };
    if (outside_guard(a) || outside_guard(b)) return 0;

    int x0 = static_cast<int>(a.x), y0 = static_cast<int>(a.y);
    int x1 = static_cast<int>(b.x), y1 = static_cast<int>(b.y);

    int dx = std::abs(x1 - x0);
    int dy = std::abs(y1 - y0);
    int sx = x0 < x1 ? 1 : -1;
    int sy = y0 < y1 ? 1 : -1;
    int err = dx - dy;
    int steps = std::max(1, std::max(dx, dy));

    int written = 0;
    int x = x0, y = y0;
    for (int i = 0; i <= steps; i++) {
        double t = static_cast<double>(i) / steps;
        float depth = static_cast<float>(a.z * (1.0 - t) + b.z * t);
        if (fb.set_pixel(x, y, color, depth)) {
            written++;
        }
        if (x == x1 && y == y1) break;

        int e2 = 2 * err;
        if (e2 > -dy) {
            err -= dy;
            x += sx;
        }
        if (e2 < dx) {
            err += dx;
            y += sy;
        }
    }
    return written;
}

int Rasterizer::draw_triangle_edges(const ScreenTriangle& tri, const Color& color) {
    if (!tri.valid) return 0;
    return draw_line(tri.verts[0], tri.verts[1], color) +
           draw_line(tri.verts[1], tri.verts[2], color) +
           draw_line(tri.verts[2], tri.verts[0], color);
}

}  // namespace termrast
