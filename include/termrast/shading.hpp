#ifndef TERMRAST_SHADING_HPP
#define TERMRAST_SHADING_HPP

#include <vector>

#include "termrast/color.hpp"
#include "termrast/light.hpp"
#include "termrast/vector3.hpp"

namespace termrast {

// Phong parameters
constexpr double SPECULAR_STRENGTH = 0.5;
constexpr int SHININESS = 32;

// ============================================================================
// ShadingContext - per-frame lights, colors pre-scaled by 1/255
// ============================================================================

struct ShadingContext {
    struct Directional {
        Vector3 direction;
        ColorF color;
        double intensity;
    };

    struct Point {
        PointLight light;
        ColorF color;
    };

    struct Spot {
        SpotLight light;
        ColorF color;
    };

    ColorF ambient;
    std::vector<Directional> directional;
    std::vector<Point> point;
    std::vector<Spot> spot;

    explicit ShadingContext(const Color& ambient_light = Color());

    // Sorts a light into its bucket
    void add(const Light& light);
};

// Ambient plus Lambert diffuse for every light
Color shade_flat(const ShadingContext& ctx, const ColorF& base_color,
                 const Vector3& normal, const Vector3& frag_pos);

// shade_flat plus a specular lobe per light
Color shade_phong(const ShadingContext& ctx, const ColorF& base_color,
                  const Vector3& normal, const Vector3& view_dir, const Vector3& frag_pos);

}  // namespace termrast

#endif  // TERMRAST_SHADING_HPP
