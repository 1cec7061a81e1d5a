#include <catch2/catch.hpp>
#include <termrast/renderer.hpp>

#include <limits>
#include <memory>
#include <stdexcept>

using namespace termrast;

namespace {
std::shared_ptr<Mesh> make_cube(Color color = Color(200, 200, 200)) {
    double s = 0.5;
    std::vector<Vector3> verts = {
        {-s, -s, -s}, {s, -s, -s}, {s, s, -s}, {-s, s, -s},
        {-s, -s, s},  {s, -s, s},  {s, s, s},  {-s, s, s},
    };
    std::vector<Face> faces = {
        {0, 1, 2}, {0, 2, 3}, {4, 6, 5}, {4, 7, 6},
        {0, 4, 5}, {0, 5, 1}, {3, 2, 6}, {3, 6, 7},
        {1, 5, 6}, {1, 6, 2}, {0, 3, 7}, {0, 7, 4},
    };
    return std::make_shared<Mesh>(std::move(verts), std::move(faces),
                                  std::vector<Color>(8, color));
}

// Square facing the camera, spanning [-1, 1] in x and y at depth z
std::shared_ptr<Mesh> make_quad(double z, Color color) {
    return std::make_shared<Mesh>(
        std::vector<Vector3>{{-1.0, -1.0, z}, {1.0, -1.0, z}, {1.0, 1.0, z}, {-1.0, 1.0, z}},
        std::vector<Face>{{0, 1, 2}, {0, 2, 3}},
        std::vector<Color>(4, color));
}

Camera default_camera() {
    Camera camera;
    camera.reset(-5.0);
    return camera;
}

bool all_depth_cleared(const Framebuffer& fb) {
    for (float d : fb.depth_buffer) {
        if (d != std::numeric_limits<float>::infinity()) return false;
    }
    return true;
}

int count_written(const Framebuffer& fb) {
    int count = 0;
    for (const Pixel& p : fb.color_buffer) {
        if (p.written()) count++;
    }
    return count;
}
}

TEST_CASE("Renderer buffers", "[renderer]") {
    Renderer renderer(40, 20);

    SECTION("Pixel grid from the character grid") {
        REQUIRE(renderer.pixel_width() == 40);
        REQUIRE(renderer.pixel_height() == 40);
        REQUIRE(renderer.aspect_ratio() == Approx(1.0));
    }

    SECTION("Resolution factor scales both axes") {
        renderer.set_resolution_factor(2.0);
        REQUIRE(renderer.pixel_width() == 80);
        REQUIRE(renderer.pixel_height() == 80);
        REQUIRE(renderer.framebuffer().color_buffer.size() == 80u * 80u);
        REQUIRE(renderer.framebuffer().depth_buffer.size() == 80u * 80u);
    }

    SECTION("Unusable factors fall back to 1") {
        renderer.set_resolution_factor(0.0);
        REQUIRE(renderer.resolution_factor() == Approx(1.0));
        renderer.set_resolution_factor(-3.0);
        REQUIRE(renderer.pixel_width() == 40);
    }

    SECTION("Oversized factors fall back to 1") {
        renderer.set_resolution_factor(2.0);
        renderer.set_resolution_factor(1e10);
        REQUIRE(renderer.resolution_factor() == Approx(1.0));
        REQUIRE(renderer.pixel_width() == 40);
        REQUIRE(renderer.pixel_height() == 40);
        REQUIRE(renderer.framebuffer().color_buffer.size() == 40u * 40u);

        renderer.set_resolution_factor(2000.0);
        REQUIRE(renderer.resolution_factor() == Approx(1.0));
        REQUIRE(renderer.framebuffer().depth_buffer.size() == 40u * 40u);

        Scene scene;
        scene.add_mesh_node(make_cube(), "cube");
        std::vector<std::string> lines = renderer.render_and_composite(scene, default_camera());
        REQUIRE(lines.size() == 20);
        REQUIRE(renderer.framebuffer().get_pixel(19, 19).written());
    }

    SECTION("Quality levels") {
        renderer.set_render_quality(5);
        REQUIRE(renderer.quality() == 5);
        REQUIRE(renderer.resolution_factor() == Approx(2.0));

        renderer.set_render_quality(0);
        REQUIRE(renderer.pixel_width() == 20);
        REQUIRE(renderer.pixel_height() == 20);
    }

    SECTION("Invalid quality falls back") {
        renderer.set_render_quality(9);
        REQUIRE(renderer.quality() == FALLBACK_QUALITY);
        REQUIRE(renderer.resolution_factor() == Approx(0.75));
        REQUIRE(renderer.pixel_width() == 30);
        REQUIRE(renderer.pixel_height() == 30);
    }

    SECTION("Quality map") {
        REQUIRE(*quality_factor(1) == Approx(2.0 / 3.0));
        REQUIRE(*quality_factor(7) == Approx(5.0));
        REQUIRE_FALSE(quality_factor(-1).has_value());
    }
}

TEST_CASE("Renderer resize", "[renderer]") {
    Renderer renderer(40, 20);

    SECTION("Applied at the next frame") {
        renderer.resize(50, 25);
        REQUIRE(renderer.resize_pending());
        REQUIRE(renderer.width_chars() == 40);

        renderer.begin_frame();
        REQUIRE_FALSE(renderer.resize_pending());
        REQUIRE(renderer.width_chars() == 50);
        REQUIRE(renderer.height_chars() == 25);
        REQUIRE(renderer.pixel_width() == 50);
        REQUIRE(renderer.pixel_height() == 50);
    }

    SECTION("Repeated resize is idempotent") {
        renderer.resize(50, 25);
        renderer.begin_frame();
        renderer.resize(50, 25);
        renderer.begin_frame();
        REQUIRE(renderer.pixel_width() == 50);
        REQUIRE(renderer.pixel_height() == 50);
        REQUIRE(renderer.framebuffer().color_buffer.size() == 50u * 50u);
    }

    SECTION("Clamped to the minimum grid") {
        renderer.resize(5, 2);
        renderer.begin_frame();
        REQUIRE(renderer.width_chars() == MIN_WIDTH_CHARS);
        REQUIRE(renderer.height_chars() == MIN_HEIGHT_CHARS);
    }

    SECTION("Constructor uses the same minimum") {
        Renderer small(5, 2);
        REQUIRE(small.width_chars() == MIN_WIDTH_CHARS);
        REQUIRE(small.height_chars() == MIN_HEIGHT_CHARS);
        REQUIRE(small.pixel_width() == MIN_WIDTH_CHARS);
        REQUIRE(small.pixel_height() == MIN_HEIGHT_CHARS * 2);
    }

    SECTION("Repeated resolution factor is idempotent") {
        Scene scene;
        scene.add_mesh_node(make_cube(), "cube");
        renderer.render_and_composite(scene, default_camera());
        REQUIRE(count_written(renderer.framebuffer()) > 0);

        for (int pass = 0; pass < 2; pass++) {
            renderer.set_resolution_factor(2.0);
            const Framebuffer& fb = renderer.framebuffer();
            REQUIRE(renderer.pixel_width() == 80);
            REQUIRE(renderer.pixel_height() == 80);
            REQUIRE(fb.color_buffer.size() == 80u * 80u);
            REQUIRE(count_written(fb) == 0);
            REQUIRE(all_depth_cleared(fb));
        }
    }

    SECTION("Resolution factor survives a resize") {
        renderer.set_render_quality(5);
        renderer.resize(30, 12);
        renderer.begin_frame();
        REQUIRE(renderer.pixel_width() == 60);
        REQUIRE(renderer.pixel_height() == 48);
    }
}

TEST_CASE("Rendering a cube", "[renderer]") {
    Renderer renderer(40, 20);
    Scene scene;
    Camera camera = default_camera();
    scene.add_mesh_node(make_cube(), "cube");

    std::vector<std::string> lines = renderer.render_and_composite(scene, camera);

    SECTION("Front face depth at the center") {
        // Camera 5 units back plus a zoom of 1, front face at z = -0.5
        const Framebuffer& fb = renderer.framebuffer();
        REQUIRE(fb.get_pixel(19, 19).written());
        REQUIRE(fb.get_depth(19, 19) == Approx(5.5f).epsilon(1e-3));
    }

    SECTION("Corners stay clear") {
        const Framebuffer& fb = renderer.framebuffer();
        REQUIRE_FALSE(fb.get_pixel(0, 0).written());
        REQUIRE(fb.get_pixel(0, 0).color == DEFAULT_CLEAR_COLOR);
    }

    SECTION("Frame statistics") {
        const FrameStats& stats = renderer.stats();
        REQUIRE(stats.meshes_submitted == 1);
        REQUIRE(stats.meshes_culled == 0);
        REQUIRE(stats.meshes_rasterized == 1);
        REQUIRE(stats.triangles_drawn + stats.triangles_skipped == 12);
        REQUIRE(stats.triangles_drawn > 0);
    }

    SECTION("One line per character row") {
        REQUIRE(lines.size() == 20);
    }

    SECTION("Next frame starts from a clear buffer") {
        scene.find("cube")->visible = false;
        renderer.render_and_composite(scene, camera);
        REQUIRE(count_written(renderer.framebuffer()) == 0);
        REQUIRE(renderer.stats().meshes_submitted == 0);
    }
}

TEST_CASE("Cube under a directional light", "[renderer]") {
    Camera camera = default_camera();
    std::shared_ptr<Mesh> cube = make_cube();

    Renderer renderer(40, 20);
    Scene scene;
    scene.add_mesh_node(cube, "cube");
    scene.add_light_node(DirectionalLight(Vector3(0.0, 0.0, -1.0), Color(255, 255, 255)), "sun");
    renderer.render_and_composite(scene, camera);

    // Only the two triangles of the z = +0.5 face
    auto back = std::make_shared<Mesh>(cube->verts(), std::vector<Face>{{4, 6, 5}, {4, 7, 6}},
                                       cube->colors());
    Renderer back_renderer(40, 20);
    Scene back_scene;
    back_scene.add_mesh_node(back, "back");
    back_renderer.render_and_composite(back_scene, camera);

    const Framebuffer& fb = renderer.framebuffer();
    const Framebuffer& back_fb = back_renderer.framebuffer();
    REQUIRE(fb.get_pixel(19, 19).written());
    REQUIRE(fb.get_pixel(19, 19).color != DEFAULT_CLEAR_COLOR);
    REQUIRE(back_fb.get_pixel(19, 19).written());
    REQUIRE(fb.get_depth(19, 19) == Approx(5.5f).epsilon(1e-3));
    REQUIRE(back_fb.get_depth(19, 19) == Approx(6.5f).epsilon(1e-3));
    REQUIRE(fb.get_depth(19, 19) < back_fb.get_depth(19, 19));
}

TEST_CASE("Frustum culling", "[renderer]") {
    Renderer renderer(40, 20);
    Scene scene;
    Camera camera = default_camera();
    Node* cube = scene.add_mesh_node(make_cube(), "cube");

    SECTION("Far to the side is culled") {
        cube->set_pos(50.0, 0.0, 0.0);
        renderer.render_and_composite(scene, camera);
        REQUIRE(renderer.stats().meshes_culled == 1);
        REQUIRE(renderer.stats().meshes_rasterized == 0);
        REQUIRE(count_written(renderer.framebuffer()) == 0);
    }

    SECTION("Partially visible is kept") {
        cube->set_pos(3.0, 0.0, 0.0);
        renderer.render_and_composite(scene, camera);
        REQUIRE(renderer.stats().meshes_culled == 0);
        REQUIRE(renderer.stats().meshes_rasterized == 1);
    }

    SECTION("Behind the camera draws nothing") {
        cube->set_pos(0.0, 0.0, -20.0);
        renderer.render_and_composite(scene, camera);
        REQUIRE(count_written(renderer.framebuffer()) == 0);
    }
}

TEST_CASE("Overlapping meshes are depth sorted per pixel", "[renderer]") {
    Camera camera = default_camera();
    Color near_color(220, 40, 40), far_color(40, 40, 220);

    auto render = [&](bool near_first) {
        auto renderer = std::make_unique<Renderer>(40, 20);
        Scene scene;
        scene.set_ambient_light(255, 255, 255);
        if (near_first) {
            scene.add_mesh_node(make_quad(0.0, near_color), "near");
            scene.add_mesh_node(make_quad(2.0, far_color), "far");
        } else {
            scene.add_mesh_node(make_quad(2.0, far_color), "far");
            scene.add_mesh_node(make_quad(0.0, near_color), "near");
        }
        renderer->render_and_composite(scene, camera);
        return renderer;
    };

    auto a = render(true);
    auto b = render(false);

    Pixel pa = a->framebuffer().get_pixel(19, 19);
    Pixel pb = b->framebuffer().get_pixel(19, 19);
    REQUIRE(pa.color == near_color);
    REQUIRE(pb.color == near_color);
    REQUIRE(a->framebuffer().get_depth(19, 19) == Approx(6.0f).epsilon(1e-3));
    REQUIRE(b->framebuffer().get_depth(19, 19) == Approx(6.0f).epsilon(1e-3));
}

TEST_CASE("Scene lighting", "[renderer]") {
    Camera camera = default_camera();

    auto center_color = [&](Scene& scene) {
        Renderer renderer(40, 20);
        renderer.render_and_composite(scene, camera);
        return renderer.framebuffer().get_pixel(19, 19).color;
    };

    Scene scene;
    scene.add_mesh_node(make_quad(0.0, Color(200, 200, 200)), "quad");
    Color unlit = center_color(scene);

    SECTION("Ambient only") {
        // 200 * 50/255 and 200 * 60/255
        REQUIRE(unlit == Color(39, 39, 47));
    }

    SECTION("Lights only add") {
        Node* lamp = scene.add_light_node(PointLight(Vector3(0.0, 0.0, -2.0), Color(255, 255, 255), 2.0),
                                          "lamp");
        Color lit = center_color(scene);
        REQUIRE(lit.r > unlit.r);
        REQUIRE(lit.g > unlit.g);
        REQUIRE(lit.b > unlit.b);

        SECTION("Hidden light nodes are ignored") {
            lamp->visible = false;
            REQUIRE(center_color(scene) == unlit);
        }
    }

    SECTION("Light positions follow their node") {
        Node* holder = scene.create_node("holder");
        scene.add_light_node(PointLight(Vector3(), Color(255, 255, 255), 2.0), "lamp", holder);
        holder->set_pos(0.0, 0.0, -2.0);
        Color near_lit = center_color(scene);
        holder->set_pos(0.0, 0.0, -40.0);
        Color far_lit = center_color(scene);
        REQUIRE(near_lit.r > far_lit.r);
    }
}

TEST_CASE("Wireframe material", "[renderer]") {
    Renderer renderer(40, 20);
    Scene scene;
    Camera camera = default_camera();
    auto cube = make_cube();
    cube->set_material(Material::Wireframe);
    scene.add_mesh_node(cube, "cube");

    renderer.render_and_composite(scene, camera);
    const Framebuffer& fb = renderer.framebuffer();

    int written = 0;
    bool all_white = true;
    for (const Pixel& p : fb.color_buffer) {
        if (!p.written()) continue;
        written++;
        if (p.color != WIREFRAME_COLOR) all_white = false;
    }
    REQUIRE(written > 0);
    REQUIRE(all_white);
    REQUIRE(written < fb.width * fb.height / 2);
}

TEST_CASE("Phong material", "[renderer]") {
    Renderer renderer(40, 20);
    Scene scene;
    Camera camera = default_camera();
    auto quad = make_quad(0.0, Color(100, 100, 100));
    quad->set_material(Material::Phong);
    scene.add_mesh_node(quad, "quad");
    scene.add_light_node(PointLight(Vector3(0.0, 0.0, -3.0), Color(255, 255, 255)), "lamp");

    renderer.render_and_composite(scene, camera);
    Color phong = renderer.framebuffer().get_pixel(19, 19).color;

    quad->set_material(Material::Flat);
    renderer.render_and_composite(scene, camera);
    Color flat = renderer.framebuffer().get_pixel(19, 19).color;

    REQUIRE(phong.r >= flat.r);
    REQUIRE(phong.g >= flat.g);
    REQUIRE(phong.b >= flat.b);
}
