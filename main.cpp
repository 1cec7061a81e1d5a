#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "termrast/camera.hpp"
#include "termrast/light.hpp"
#include "termrast/renderer.hpp"
#include "termrast/scene.hpp"

#include "app/obj_loader.hpp"
#include "app/shapes.hpp"
#include "app/terminal.hpp"

using namespace termrast;

// ============================================================================
// Configuration
// ============================================================================

constexpr int STATUS_ROWS = 3;
constexpr int DEFAULT_TARGET_FPS = 30;
constexpr int MIN_TARGET_FPS = 5;
constexpr int MAX_TARGET_FPS = 120;
constexpr int FPS_STEP = 5;
constexpr double CAMERA_STEPBACK = -6.0;

constexpr double CAM_MOVE_SPEED = 0.2;
constexpr double CAM_ROTATE_SPEED = 0.06;
constexpr double CAM_ZOOM_SPEED = 0.25;
constexpr double FOV_STEP = 5.0;

constexpr double TWO_PI = 6.28318530717958647692;

// Continuous rotation applied to a node, radians per second per axis
struct Spinner {
    Node* node;
    Vector3 rate;
};

// Rotates every spinner by rate * dt, keeping angles in [0, 2pi)
void update_spinners(const std::vector<Spinner>& spinners, double dt) {
    for (const Spinner& s : spinners) {
        Vector3& rot = s.node->transform.rot;
        rot += s.rate * dt;
        rot.x = std::fmod(rot.x, TWO_PI);
        rot.y = std::fmod(rot.y, TWO_PI);
        rot.z = std::fmod(rot.z, TWO_PI);
        if (rot.x < 0) rot.x += TWO_PI;
        if (rot.y < 0) rot.y += TWO_PI;
        if (rot.z < 0) rot.z += TWO_PI;
    }
}

// Parses a whole-string integer argument, warning and keeping `fallback`
// when it is not one
int parse_int_arg(const char* text, const char* what, int fallback) {
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0') {
        std::cerr << "Warning: " << what << " '" << text << "' is not a number, using "
                  << fallback << std::endl;
        return fallback;
    }
    return static_cast<int>(value);
}

// Centers a loaded model on its node and scales it to a 2-unit extent
void fit_to_unit(Node& node) {
    const Bounds& b = node.mesh->bounds();
    Vector3 center = (b.min + b.max) * 0.5;
    Vector3 extent = b.max - b.min;
    double largest = std::max({extent.x, extent.y, extent.z});
    double s = largest > Vector3::EPS ? 2.0 / largest : 1.0;
    node.set_scale(s, s, s);
    node.set_pos(-center.x * s, -center.y * s, -center.z * s);
}

// ============================================================================
// Scene setup
// ============================================================================

std::vector<Spinner> build_demo_scene(Scene& scene, std::shared_ptr<Mesh> model) {
    std::vector<Spinner> spinners;

    Node* frame = scene.add_mesh_node(app::build_cube(3.0, Color(255, 255, 255)), "frame");
    frame->mesh->set_material(Material::Wireframe);
    frame->add_tag("spin");
    spinners.push_back({frame, Vector3(0.0, 0.4, 0.0)});

    if (model) {
        Node* holder = scene.create_node("model_holder", frame);
        Node* node = scene.add_mesh_node(model, "model", holder);
        fit_to_unit(*node);
        node->add_tag("model");
    } else {
        Node* sphere = scene.add_mesh_node(app::build_uv_sphere(0.8, 24, 12), "sphere", frame);
        sphere->mesh->set_material(Material::Phong);
        sphere->set_pos(-1.6, 0.0, 0.0);
        sphere->add_tag("shape");

        Node* torus = scene.add_mesh_node(app::build_torus(0.7, 0.25, 32, 12), "torus", frame);
        torus->set_pos(1.6, 0.0, 0.0);
        torus->add_tag("shape");
        torus->add_tag("spin");
        spinners.push_back({torus, Vector3(0.9, 0.0, 0.5)});

        Node* cube = scene.add_mesh_node(app::build_cube(0.9), "cube", frame);
        cube->add_tag("shape");
        cube->add_tag("spin");
        spinners.push_back({cube, Vector3(0.3, 0.7, 0.0)});
    }

    Node* floor = scene.add_mesh_node(app::build_plane(8.0, 8.0, 4, 4, Color(90, 110, 90)), "floor");
    floor->set_pos(0.0, 2.0, 0.0);

    scene.add_light_node(DirectionalLight(Vector3(-0.4, 0.6, 1.0), Color(255, 244, 214), 0.9),
                         "sun");

    // Orbits with the frame
    Node* lamp = scene.add_light_node(PointLight(Vector3(), Color(120, 170, 255), 1.2), "lamp",
                                      frame);
    lamp->set_pos(0.0, -1.5, -1.5);

    scene.add_light_node(SpotLight::from_degrees(Vector3(0.0, -4.0, -2.0), Vector3(0.0, 1.0, 0.5),
                                                 Color(255, 200, 150), 1.0, 20.0, 35.0),
                         "spot");
    return spinners;
}

// ============================================================================
// Main application
// ============================================================================

int main(int argc, char* argv[]) {
    // termrast_demo [model.obj] [quality] [fps]
    std::shared_ptr<Mesh> model;
    if (argc >= 2) {
        model = app::load_obj(argv[1]);
        if (!model) {
            std::cerr << "Failed to load mesh from: " << argv[1] << std::endl;
            return 1;
        }
    }
    int quality = argc >= 3 ? parse_int_arg(argv[2], "quality", DEFAULT_QUALITY)
                            : DEFAULT_QUALITY;
    int target_fps = argc >= 4 ? parse_int_arg(argv[3], "fps", DEFAULT_TARGET_FPS)
                               : DEFAULT_TARGET_FPS;
    if (target_fps < MIN_TARGET_FPS || target_fps > MAX_TARGET_FPS) {
        std::cerr << "Warning: fps " << target_fps << " outside " << MIN_TARGET_FPS << ".."
                  << MAX_TARGET_FPS << ", clamping" << std::endl;
        target_fps = std::clamp(target_fps, MIN_TARGET_FPS, MAX_TARGET_FPS);
    }

    Scene scene;
    std::vector<Spinner> spinners;
    try {
        spinners = build_demo_scene(scene, model);
    } catch (const std::exception& e) {
        std::cerr << "Failed to build scene: " << e.what() << std::endl;
        return 1;
    }

    int term_width, term_height;
    app::get_terminal_size(term_width, term_height);

    // Status rows sit below the image while they are shown
    bool show_status = true;
    auto status_rows = [&show_status] { return show_status ? STATUS_ROWS : 0; };

    Renderer renderer(term_width, term_height - status_rows());
    renderer.set_render_quality(quality);

    Camera camera;
    camera.reset(CAMERA_STEPBACK);

    bool running = true;
    bool paused = false;
    int screenshot_count = 0;
    std::string message;

    app::Terminal terminal;
    terminal.set_title("termrast");

    // ========================================================================
    // Key bindings
    // ========================================================================
    std::map<int, std::function<void()>> bindings;
    auto bind = [&bindings](const std::string& keys, std::function<void()> action) {
        for (char key : keys) bindings[static_cast<unsigned char>(key)] = action;
    };

    bind("wW", [&] { camera.move(0.0, 0.0, CAM_MOVE_SPEED); });
    bind("sS", [&] { camera.move(0.0, 0.0, -CAM_MOVE_SPEED); });
    bind("aA", [&] { camera.move(CAM_MOVE_SPEED, 0.0, 0.0); });
    bind("dD", [&] { camera.move(-CAM_MOVE_SPEED, 0.0, 0.0); });
    bind("qQ", [&] { camera.move(0.0, CAM_MOVE_SPEED, 0.0); });
    bind("eE", [&] { camera.move(0.0, -CAM_MOVE_SPEED, 0.0); });

    bind("iI", [&] { camera.rotate(-CAM_ROTATE_SPEED, 0.0, 0.0); });
    bind("kK", [&] { camera.rotate(CAM_ROTATE_SPEED, 0.0, 0.0); });
    bind("jJ", [&] { camera.rotate(0.0, -CAM_ROTATE_SPEED, 0.0); });
    bind("lL", [&] { camera.rotate(0.0, CAM_ROTATE_SPEED, 0.0); });
    bind("uU", [&] { camera.rotate(0.0, 0.0, -CAM_ROTATE_SPEED); });
    bind("oO", [&] { camera.rotate(0.0, 0.0, CAM_ROTATE_SPEED); });

    bind("zZ", [&] { camera.zoom_by(-CAM_ZOOM_SPEED); });
    bind("cC", [&] { camera.zoom_by(CAM_ZOOM_SPEED); });
    bind("+=", [&] { camera.change_fov(FOV_STEP); });
    bind("-_", [&] { camera.change_fov(-FOV_STEP); });

    for (int level = 0; level <= 7; level++) {
        bind(std::string(1, static_cast<char>('0' + level)), [&, level] {
            renderer.set_render_quality(level);
            message = "Quality " + std::to_string(level);
        });
    }

    bind("mM", [&] {
        for (Node* node : scene.find_by_tag_any({"shape", "model"})) {
            Material next = node->mesh->material() == Material::Flat ? Material::Phong
                          : node->mesh->material() == Material::Phong ? Material::Wireframe
                          : Material::Flat;
            node->mesh->set_material(next);
            message = std::string("Material ") + material_name(next);
        }
    });
    bind("[", [&] {
        target_fps = std::max(MIN_TARGET_FPS, target_fps - FPS_STEP);
        message = "Target FPS " + std::to_string(target_fps);
    });
    bind("]", [&] {
        target_fps = std::min(MAX_TARGET_FPS, target_fps + FPS_STEP);
        message = "Target FPS " + std::to_string(target_fps);
    });
    bind("tT", [&] {
        // Hand the status rows to the image, or take them back
        show_status = !show_status;
        renderer.resize(term_width, term_height - status_rows());
        terminal.clear_screen();
    });
    bind(" ", [&] { paused = !paused; });
    bind("rR", [&] { camera.reset(CAMERA_STEPBACK); });
    bind("pP", [&] {
        char filename[64];
        snprintf(filename, sizeof(filename), "screenshot_%03d.png", screenshot_count++);
        if (renderer.save_to_file(filename)) {
            message = std::string("Saved: ") + filename;
        } else {
            message = std::string("Failed to save ") + filename;
        }
    });
    bind("xX", [&] { running = false; });
    bindings[app::KEY_ESCAPE] = [&] { running = false; };

    // ========================================================================
    // Animation loop
    // ========================================================================
    using Clock = std::chrono::steady_clock;
    auto last_time = Clock::now();
    auto fps_timer = last_time;
    int frame_count = 0;
    double fps = 0.0;

    try {
        while (running) {
            auto frame_start = Clock::now();
            double dt = std::chrono::duration<double>(frame_start - last_time).count();
            last_time = frame_start;

            // Size changes are picked up at the start of the next frame
            int new_width, new_height;
            app::get_terminal_size(new_width, new_height);
            if (new_width != term_width || new_height != term_height) {
                term_width = new_width;
                term_height = new_height;
                renderer.resize(term_width, term_height - status_rows());
                terminal.clear_screen();
            }

            while (app::keyboard_hit()) {
                int ch = app::read_key();
                if (ch < 0) break;
                auto it = bindings.find(ch);
                if (it != bindings.end()) it->second();
            }
            if (!running) break;

            if (!paused) update_spinners(spinners, dt);

            std::vector<std::string> lines = renderer.render_and_composite(scene, camera);
            terminal.present(lines);

            frame_count++;
            double since = std::chrono::duration<double>(frame_start - fps_timer).count();
            if (since >= 1.0) {
                fps = frame_count / since;
                frame_count = 0;
                fps_timer = frame_start;
            }

            if (show_status) {
                const FrameStats& frame = renderer.stats();
                SceneStats totals = scene.statistics();
                std::ostringstream info, view;
                info << "FPS: " << static_cast<int>(fps) << "/" << target_fps
                     << "  Quality: " << renderer.quality()
                     << "  Res: " << renderer.pixel_width() << "x" << renderer.pixel_height()
                     << "  Meshes: " << frame.meshes_rasterized << "/" << frame.meshes_submitted
                     << "  Tris: " << frame.triangles_drawn << "/" << totals.triangles
                     << "  Lights: " << totals.lights;
                view << std::fixed << std::setprecision(1)
                     << "Pos: (" << camera.position.x << ", " << camera.position.y << ", "
                     << camera.position.z << ")  Fov: " << camera.fov
                     << "  Zoom: " << camera.zoom << "  " << message;

                terminal.write_status(renderer.height_chars() + 1, {
                    info.str(),
                    view.str(),
                    "[WASD/QE] Move  [IJKL/UO] Look  [ZC] Zoom  [+-] Fov  [0-7] Quality  "
                    "[[]] FPS  [M] Material  [T] Status  [Space] Pause  [R] Reset  "
                    "[P] Screenshot  [X/Esc] Quit",
                });
            }

            // Sleep off the rest of the frame budget
            const auto frame_budget = std::chrono::duration<double>(1.0 / target_fps);
            auto spent = Clock::now() - frame_start;
            if (spent < frame_budget) {
                std::this_thread::sleep_for(frame_budget - spent);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Render loop failed: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
