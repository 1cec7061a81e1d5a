#ifndef TERMRAST_LIGHT_HPP
#define TERMRAST_LIGHT_HPP

#include <variant>

#include "termrast/color.hpp"
#include "termrast/vector3.hpp"

namespace termrast {

// ============================================================================
// Lights
// ============================================================================

// Distance falloff shared by point and spot lights: 1 / (1 + k1 d + k2 d^2)
constexpr double ATTENUATION_K1 = 0.1;
constexpr double ATTENUATION_K2 = 0.02;

double distance_attenuation(double distance);

enum class LightKind { Directional, Point, Spot };

struct DirectionalLight {
    Vector3 direction;  // unit, points from the light into the scene
    Color color{255, 255, 255};
    double intensity = 1.0;

    DirectionalLight() : direction(0.0, 0.0, 1.0) {}
    DirectionalLight(const Vector3& direction, const Color& color, double intensity = 1.0);
};

struct PointLight {
    Vector3 position;
    Color color{255, 255, 255};
    double intensity = 1.0;

    PointLight() = default;
    PointLight(const Vector3& position, const Color& color, double intensity = 1.0)
        : position(position), color(color), intensity(intensity) {}

    double attenuation(const Vector3& frag_pos) const;
};

struct SpotLight {
    Vector3 position;
    Vector3 direction;  // cone axis, normalized by the constructor
    Color color{255, 255, 255};
    double intensity = 1.0;
    double inner_angle;  // half-angle, radians
    double outer_angle;  // half-angle, radians

    SpotLight();
    // Angles are half-angles in radians; they are reordered so inner <= outer.
    SpotLight(const Vector3& position, const Vector3& direction, const Color& color,
              double intensity, double inner_angle, double outer_angle);

    static SpotLight from_degrees(const Vector3& position, const Vector3& direction,
                                  const Color& color, double intensity,
                                  double inner_degrees, double outer_degrees);

    double attenuation(const Vector3& frag_pos) const;

    // 1 inside the inner cone, 0 outside the outer cone, linear in cos
    // between. Holds for any direction length and angle order.
    double cone_factor(const Vector3& frag_pos) const;
};

using Light = std::variant<DirectionalLight, PointLight, SpotLight>;

LightKind light_kind(const Light& light);
const Color& light_color(const Light& light);
double light_intensity(const Light& light);

}  // namespace termrast

#endif  // TERMRAST_LIGHT_HPP
