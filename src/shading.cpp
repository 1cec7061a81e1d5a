#include "termrast/shading.hpp"

#include <algorithm>
#include <cmath>

namespace termrast {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// Calls fn(to_light, color, scale) for every light, where `to_light` is the
// unit vector from the fragment toward the light and `scale` folds together
// intensity, cone and distance falloff.
template <typename Fn>
void for_each_light(const ShadingContext& ctx, const Vector3& frag_pos, Fn&& fn) {
    for (const auto& l : ctx.directional) {
        fn(-l.direction, l.color, l.intensity);
    }
    for (const auto& l : ctx.point) {
        Vector3 to_light = (l.light.position - frag_pos).normalized();
        fn(to_light, l.color, l.light.intensity * l.light.attenuation(frag_pos));
    }
    for (const auto& l : ctx.spot) {
        Vector3 to_light = (l.light.position - frag_pos).normalized();
        double cone = l.light.cone_factor(frag_pos);
        fn(to_light, l.color, l.light.intensity * cone * l.light.attenuation(frag_pos));
    }
}

}  // namespace

ShadingContext::ShadingContext(const Color& ambient_light) : ambient(ColorF::unit(ambient_light)) {}

void ShadingContext::add(const Light& light) {
    std::visit(Overloaded{
        [this](const DirectionalLight& l) {
            directional.push_back({l.direction, ColorF::unit(l.color), l.intensity});
        },
        [this](const PointLight& l) { point.push_back({l, ColorF::unit(l.color)}); },
        [this](const SpotLight& l) { spot.push_back({l, ColorF::unit(l.color)}); },
    }, light);
}

Color shade_flat(const ShadingContext& ctx, const ColorF& base_color,
                 const Vector3& normal, const Vector3& frag_pos) {
    ColorF total{
        base_color.r * ctx.ambient.r,
        base_color.g * ctx.ambient.g,
        base_color.b * ctx.ambient.b,
    };

    for_each_light(ctx, frag_pos, [&](const Vector3& to_light, const ColorF& lc, double scale) {
        double intensity = std::max(normal.dot(to_light), 0.0) * scale;
        total.r += base_color.r * lc.r * intensity;
        total.g += base_color.g * lc.g * intensity;
        total.b += base_color.b * lc.b * intensity;
    });

    return total.to_color();
}

Color shade_phong(const ShadingContext& ctx, const ColorF& base_color,
                  const Vector3& normal, const Vector3& view_dir, const Vector3& frag_pos) {
    ColorF total{
        base_color.r * ctx.ambient.r,
        base_color.g * ctx.ambient.g,
        base_color.b * ctx.ambient.b,
    };

    for_each_light(ctx, frag_pos, [&](const Vector3& to_light, const ColorF& lc, double scale) {
        // Diffuse
        double diffuse = std::max(normal.dot(to_light), 0.0) * scale;
        total.r += base_color.r * lc.r * diffuse;
        total.g += base_color.g * lc.g * diffuse;
        total.b += base_color.b * lc.b * diffuse;

        // Specular
        Vector3 reflect_dir = (normal * (2.0 * normal.dot(to_light)) - to_light).normalized();
        double spec = std::pow(std::max(view_dir.dot(reflect_dir), 0.0), SHININESS);
        double specular = 255.0 * SPECULAR_STRENGTH * spec * scale;
        total.r += lc.r * specular;
        total.g += lc.g * specular;
        total.b += lc.b * specular;
    });

    return total.to_color();
}

}  // namespace termrast
