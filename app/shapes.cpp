#include "shapes.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

namespace termrast::app {

namespace {

constexpr double PI = 3.14159265358979323846;

uint8_t channel(double v) {
    return static_cast<uint8_t>(std::clamp(v, 0.0, 255.0));
}

}  // namespace

std::shared_ptr<Mesh> build_cube(double size, std::optional<Color> color) {
    double s = size / 2.0;
    std::vector<Vector3> verts = {
        {-s, -s, -s}, {s, -s, -s}, {s, s, -s}, {-s, s, -s},
        {-s, -s, s},  {s, -s, s},  {s, s, s},  {-s, s, s},
    };
    std::vector<Face> faces = {
        {0, 1, 2}, {0, 2, 3},  // back
        {4, 6, 5}, {4, 7, 6},  // front
        {0, 4, 5}, {0, 5, 1},  // bottom
        {3, 2, 6}, {3, 6, 7},  // top
        {1, 5, 6}, {1, 6, 2},  // right
        {0, 3, 7}, {0, 7, 4},  // left
    };

    std::vector<Color> colors;
    if (color) {
        colors.assign(verts.size(), *color);
    } else {
        // Pastel corners
        colors = {
            {255, 179, 186}, {255, 223, 186}, {255, 255, 186}, {186, 255, 201},
            {186, 225, 255}, {223, 186, 255}, {255, 186, 255}, {186, 255, 255},
        };
    }
    return std::make_shared<Mesh>(std::move(verts), std::move(faces), std::move(colors));
}

std::shared_ptr<Mesh> build_uv_sphere(double radius, int segments_x, int segments_y,
                                      std::optional<Color> color) {
    segments_x = std::max(3, segments_x);
    segments_y = std::max(2, segments_y);

    std::vector<Vector3> verts;
    std::vector<Color> colors;
    for (int y = 0; y <= segments_y; y++) {
        double phi = y * PI / segments_y;
        for (int x = 0; x <= segments_x; x++) {
            double theta = x * 2.0 * PI / segments_x;
            double sx = std::cos(theta) * std::sin(phi);
            double sy = std::sin(theta) * std::sin(phi);
            double sz = std::cos(phi);
            verts.emplace_back(radius * sx, radius * sy, radius * sz);
            colors.push_back(color ? *color
                                   : Color(channel(255 * (sx + 1) / 2),
                                           channel(255 * (sy + 1) / 2),
                                           channel(255 * (sz + 1) / 2)));
        }
    }

    std::vector<Face> faces;
    for (int y = 0; y < segments_y; y++) {
        for (int x = 0; x < segments_x; x++) {
            unsigned int i0 = y * (segments_x + 1) + x;
            unsigned int i1 = i0 + 1;
            unsigned int i2 = (y + 1) * (segments_x + 1) + x;
            unsigned int i3 = i2 + 1;
            // Quads are split into two triangles
            faces.push_back({i0, i2, i1});
            faces.push_back({i1, i2, i3});
        }
    }
    return std::make_shared<Mesh>(std::move(verts), std::move(faces), std::move(colors));
}

std::shared_ptr<Mesh> build_plane(double width, double depth, int segments_x, int segments_z,
                                  std::optional<Color> color) {
    segments_x = std::max(1, segments_x);
    segments_z = std::max(1, segments_z);

    std::vector<Vector3> verts;
    for (int z = 0; z <= segments_z; z++) {
        for (int x = 0; x <= segments_x; x++) {
            double px = (static_cast<double>(x) / segments_x - 0.5) * width;
            double pz = (static_cast<double>(z) / segments_z - 0.5) * depth;
            verts.emplace_back(px, 0.0, pz);
        }
    }
    std::vector<Color> colors(verts.size(), color.value_or(Color(200, 200, 200)));

    std::vector<Face> faces;
    for (int z = 0; z < segments_z; z++) {
        for (int x = 0; x < segments_x; x++) {
            unsigned int i0 = z * (segments_x + 1) + x;
            unsigned int i1 = i0 + 1;
            unsigned int i2 = i0 + (segments_x + 1);
            unsigned int i3 = i2 + 1;
            faces.push_back({i0, i2, i1});
            faces.push_back({i1, i2, i3});
        }
    }
    return std::make_shared<Mesh>(std::move(verts), std::move(faces), std::move(colors));
}

std::shared_ptr<Mesh> build_torus(double major_radius, double minor_radius, int segments_major,
                                  int segments_minor, std::optional<Color> color) {
    segments_major = std::max(3, segments_major);
    segments_minor = std::max(3, segments_minor);

    std::vector<Vector3> verts;
    std::vector<Color> colors;
    for (int i = 0; i < segments_major; i++) {
        double theta = 2.0 * PI * i / segments_major;
        double cos_theta = std::cos(theta), sin_theta = std::sin(theta);
        for (int j = 0; j < segments_minor; j++) {
            double phi = 2.0 * PI * j / segments_minor;
            double cos_phi = std::cos(phi), sin_phi = std::sin(phi);
            verts.emplace_back((major_radius + minor_radius * cos_phi) * cos_theta,
                               (major_radius + minor_radius * cos_phi) * sin_theta,
                               minor_radius * sin_phi);
            colors.push_back(color ? *color
                                   : Color(channel(127 + 127 * cos_phi),
                                           channel(127 + 127 * sin_theta),
                                           channel(127 + 127 * sin_phi)));
        }
    }

    std::vector<Face> faces;
    for (int i = 0; i < segments_major; i++) {
        for (int j = 0; j < segments_minor; j++) {
            unsigned int next_i = (i + 1) % segments_major;
            unsigned int next_j = (j + 1) % segments_minor;
            unsigned int i0 = i * segments_minor + j;
            unsigned int i1 = i * segments_minor + next_j;
            unsigned int i2 = next_i * segments_minor + j;
            unsigned int i3 = next_i * segments_minor + next_j;
            faces.push_back({i0, i2, i1});
            faces.push_back({i1, i2, i3});
        }
    }
    return std::make_shared<Mesh>(std::move(verts), std::move(faces), std::move(colors));
}

}  // namespace termrast::app
