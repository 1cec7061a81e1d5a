#include <catch2/catch.hpp>
#include <termrast/light.hpp>
#include <termrast/shading.hpp>

#include <cmath>

using namespace termrast;

namespace {
constexpr double PI = 3.14159265358979323846;

Vector3 at_angle(double degrees, double distance) {
    double rad = degrees * PI / 180.0;
    return Vector3(std::sin(rad), 0.0, std::cos(rad)) * distance;
}
}

TEST_CASE("Distance attenuation", "[light]") {
    SECTION("Full strength at the light") {
        REQUIRE(distance_attenuation(0.0) == Approx(1.0));
    }

    SECTION("Falls off with distance") {
        double previous = distance_attenuation(0.0);
        for (double d = 0.5; d < 50.0; d += 0.5) {
            double current = distance_attenuation(d);
            REQUIRE(current < previous);
            REQUIRE(current > 0.0);
            previous = current;
        }
    }

    SECTION("Matches the quadratic falloff") {
        REQUIRE(distance_attenuation(10.0) == Approx(1.0 / (1.0 + 0.1 * 10.0 + 0.02 * 100.0)));
    }

    SECTION("Point light uses the distance to the fragment") {
        PointLight light(Vector3(1.0, 0.0, 0.0), Color(255, 255, 255));
        REQUIRE(light.attenuation(Vector3(1.0, 0.0, 0.0)) == Approx(1.0));
        REQUIRE(light.attenuation(Vector3(1.0, 3.0, 4.0)) == Approx(distance_attenuation(5.0)));
    }
}

TEST_CASE("Spot light cone", "[light]") {
    SpotLight spot = SpotLight::from_degrees(Vector3(), Vector3(0.0, 0.0, 1.0),
                                             Color(255, 255, 255), 1.0, 40.0, 60.0);

    SECTION("Full strength on the axis") {
        REQUIRE(spot.cone_factor(Vector3(0.0, 0.0, 5.0)) == Approx(1.0));
        REQUIRE(spot.cone_factor(at_angle(30.0, 2.0)) == Approx(1.0));
    }

    SECTION("Dark outside the outer cone") {
        REQUIRE(spot.cone_factor(at_angle(70.0, 3.0)) == 0.0);
        REQUIRE(spot.cone_factor(Vector3(0.0, 0.0, -3.0)) == 0.0);
    }

    SECTION("Partial between the cones") {
        double factor = spot.cone_factor(at_angle(50.0, 3.0));
        REQUIRE(factor > 0.0);
        REQUIRE(factor < 1.0);
        double expected = (std::cos(50.0 * PI / 180.0) - std::cos(60.0 * PI / 180.0)) /
                          (std::cos(40.0 * PI / 180.0) - std::cos(60.0 * PI / 180.0));
        REQUIRE(factor == Approx(expected));
    }

    SECTION("Swapped angles are reordered") {
        SpotLight swapped = SpotLight::from_degrees(Vector3(), Vector3(0.0, 0.0, 1.0),
                                                    Color(255, 255, 255), 1.0, 60.0, 40.0);
        REQUIRE(swapped.inner_angle <= swapped.outer_angle);
        REQUIRE(swapped.cone_factor(at_angle(50.0, 3.0)) == Approx(spot.cone_factor(at_angle(50.0, 3.0))));
    }

    SECTION("Equal angles give a hard edge") {
        SpotLight hard = SpotLight::from_degrees(Vector3(), Vector3(0.0, 0.0, 1.0),
                                                 Color(255, 255, 255), 1.0, 30.0, 30.0);
        REQUIRE(hard.cone_factor(at_angle(20.0, 1.0)) == 1.0);
        REQUIRE(hard.cone_factor(at_angle(40.0, 1.0)) == 0.0);
    }

    SECTION("Fields assigned directly behave like constructed ones") {
        SpotLight edited;
        edited.direction = Vector3(0.0, 0.0, 5.0);
        edited.inner_angle = 60.0 * PI / 180.0;
        edited.outer_angle = 40.0 * PI / 180.0;
        REQUIRE(edited.cone_factor(Vector3(0.0, 0.0, 5.0)) == Approx(1.0));
        REQUIRE(edited.cone_factor(at_angle(70.0, 3.0)) == 0.0);
        REQUIRE(edited.cone_factor(at_angle(50.0, 3.0)) ==
                Approx(spot.cone_factor(at_angle(50.0, 3.0))));
    }
}

TEST_CASE("Light variant helpers", "[light]") {
    Light sun = DirectionalLight(Vector3(0.0, -2.0, 0.0), Color(10, 20, 30), 0.5);
    Light lamp = PointLight(Vector3(), Color(1, 2, 3), 2.0);
    Light spot = SpotLight();

    REQUIRE(light_kind(sun) == LightKind::Directional);
    REQUIRE(light_kind(lamp) == LightKind::Point);
    REQUIRE(light_kind(spot) == LightKind::Spot);

    REQUIRE(light_color(sun) == Color(10, 20, 30));
    REQUIRE(light_intensity(lamp) == Approx(2.0));

    SECTION("Directional light direction is normalized") {
        const auto& d = std::get<DirectionalLight>(sun);
        REQUIRE(d.direction == Vector3(0.0, -1.0, 0.0));
    }
}

TEST_CASE("Flat and Phong shading", "[light][shading]") {
    ColorF base{200.0, 100.0, 50.0};
    Vector3 normal(0.0, 0.0, 1.0);
    Vector3 frag(0.0, 0.0, 0.0);

    SECTION("Ambient only") {
        ShadingContext ctx(Color(255, 255, 255));
        REQUIRE(shade_flat(ctx, base, normal, frag) == Color(200, 100, 50));

        ShadingContext dark(Color(0, 0, 0));
        REQUIRE(shade_flat(dark, base, normal, frag) == Color(0, 0, 0));
    }

    SECTION("Directional light facing the surface") {
        ShadingContext ctx(Color(0, 0, 0));
        ctx.add(DirectionalLight(Vector3(0.0, 0.0, -1.0), Color(255, 255, 255)));
        REQUIRE(shade_flat(ctx, base, normal, frag) == Color(200, 100, 50));
    }

    SECTION("Light behind the surface adds nothing") {
        ShadingContext ctx(Color(0, 0, 0));
        ctx.add(DirectionalLight(Vector3(0.0, 0.0, 1.0), Color(255, 255, 255)));
        REQUIRE(shade_flat(ctx, base, normal, frag) == Color(0, 0, 0));
    }

    SECTION("Channels clamp at 255") {
        ShadingContext ctx(Color(255, 255, 255));
        ctx.add(DirectionalLight(Vector3(0.0, 0.0, -1.0), Color(255, 255, 255), 2.0));
        REQUIRE(shade_flat(ctx, base, normal, frag) == Color(255, 255, 150));
    }

    SECTION("Point light is attenuated") {
        ShadingContext ctx(Color(0, 0, 0));
        ctx.add(PointLight(Vector3(0.0, 0.0, 10.0), Color(255, 255, 255)));
        Color c = shade_flat(ctx, base, normal, frag);
        REQUIRE(static_cast<int>(c.r) == static_cast<int>(200.0 * distance_attenuation(10.0)));
    }

    SECTION("Phong adds a specular highlight toward the viewer") {
        ShadingContext ctx(Color(0, 0, 0));
        ctx.add(DirectionalLight(Vector3(0.0, 0.0, -1.0), Color(255, 255, 255)));
        ColorF black{0.0, 0.0, 0.0};
        Color c = shade_phong(ctx, black, normal, Vector3(0.0, 0.0, 1.0), frag);
        REQUIRE(c == Color(127, 127, 127));

        Color off_axis = shade_phong(ctx, black, normal, Vector3(1.0, 0.0, 0.0), frag);
        REQUIRE(off_axis == Color(0, 0, 0));
    }
}
