#include "termrast/light.hpp"

#include <algorithm>
#include <cmath>

namespace termrast {

namespace {

constexpr double PI = 3.14159265358979323846;

}  // namespace

double distance_attenuation(double distance) {
    return 1.0 / (1.0 + ATTENUATION_K1 * distance + ATTENUATION_K2 * (distance * distance));
}

DirectionalLight::DirectionalLight(const Vector3& direction, const Color& color, double intensity)
    : direction(direction.normalized()), color(color), intensity(intensity) {}

double PointLight::attenuation(const Vector3& frag_pos) const {
    return distance_attenuation((frag_pos - position).length());
}

SpotLight::SpotLight()
    : direction(0.0, 0.0, 1.0), inner_angle(15.0 * PI / 180.0), outer_angle(20.0 * PI / 180.0) {}

SpotLight::SpotLight(const Vector3& position, const Vector3& direction, const Color& color,
                     double intensity, double inner_angle, double outer_angle)
    : position(position),
      direction(direction.normalized()),
      color(color),
      intensity(intensity),
      inner_angle(std::min(inner_angle, outer_angle)),
      outer_angle(std::max(inner_angle, outer_angle)) {}

SpotLight SpotLight::from_degrees(const Vector3& position, const Vector3& direction,
                                  const Color& color, double intensity,
                                  double inner_degrees, double outer_degrees) {
    return SpotLight(position, direction, color, intensity,
                     inner_degrees * PI / 180.0, outer_degrees * PI / 180.0);
}

double SpotLight::attenuation(const Vector3& frag_pos) const {
    return distance_attenuation((frag_pos - position).length());
}

double SpotLight::cone_factor(const Vector3& frag_pos) const {
    // The fields are public, so normalize and order them here as well
    Vector3 to_frag = (frag_pos - position).normalized();
    double cos_theta = direction.normalized().dot(to_frag);

    double cos_inner = std::cos(std::min(inner_angle, outer_angle));
    double cos_outer = std::cos(std::max(inner_angle, outer_angle));

    if (cos_theta < cos_outer) {
        return 0.0;
    }
    if (cos_theta >= cos_inner) {
        return 1.0;
    }
    // cos_inner > cos_theta >= cos_outer here, so the span is positive
    return (cos_theta - cos_outer) / (cos_inner - cos_outer);
}

LightKind light_kind(const Light& light) {
    struct KindOf {
        LightKind operator()(const DirectionalLight&) const { return LightKind::Directional; }
        LightKind operator()(const PointLight&) const { return LightKind::Point; }
        LightKind operator()(const SpotLight&) const { return LightKind::Spot; }
    };
    return std::visit(KindOf{}, light);
}

const Color& light_color(const Light& light) {
    return std::visit([](const auto& l) -> const Color& { return l.color; }, light);
}

double light_intensity(const Light& light) {
    return std::visit([](const auto& l) { return l.intensity; }, light);
}

}  // namespace termrast
