#include "termrast/renderer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace termrast {

namespace {

int clamp_width(int width_chars) {
    return std::clamp(width_chars, MIN_WIDTH_CHARS, MAX_WIDTH_CHARS);
}

int clamp_height(int height_chars) {
    return std::clamp(height_chars, MIN_HEIGHT_CHARS, MAX_HEIGHT_CHARS);
}

// Checked in double so an oversized factor never narrows to int
bool factor_fits(int width_chars, int height_chars, double factor) {
    if (!std::isfinite(factor) || factor <= 0.0) return false;
    double pixel_width = std::floor(width_chars * factor);
    double pixel_height = std::floor(height_chars * factor) * 2.0;
    return pixel_width >= 1.0 && pixel_height >= 2.0 &&
           pixel_width * pixel_height <= static_cast<double>(MAX_FRAMEBUFFER_PIXELS);
}

void warn_invalid_factor(double factor) {
    std::cerr << "Warning: invalid resolution factor " << factor
              << ", using " << DEFAULT_RESOLUTION_FACTOR << std::endl;
}

}  // namespace

std::optional<double> quality_factor(int level) {
    switch (level) {
        case 0: return 1.0 / 2.0;
        case 1: return 2.0 / 3.0;
        case 2: return 3.0 / 4.0;
        case 3: return 1.0;
        case 4: return 3.0 / 2.0;
        case 5: return 2.0;
        case 6: return 3.0;
        case 7: return 5.0;
        default: return std::nullopt;
    }
}

Renderer::Renderer(int width_chars, int height_chars)
    : width_chars_(clamp_width(width_chars)),
      height_chars_(clamp_height(height_chars)),
      rasterizer_(fb_) {
    set_resolution_factor(DEFAULT_RESOLUTION_FACTOR);
}

double Renderer::aspect_ratio() const {
    if (fb_.height == 0) return 1.0;
    return static_cast<double>(fb_.width) / fb_.height;
}

void Renderer::set_clear_color(int r, int g, int b) {
    fb_.clear_color = Color::clamped(r, g, b);
}

// ============================================================================
// Buffer & resolution management
// ============================================================================

void Renderer::set_resolution_factor(double factor) {
    if (!factor_fits(width_chars_, height_chars_, factor)) {
        warn_invalid_factor(factor);
        factor = DEFAULT_RESOLUTION_FACTOR;
    }
    reallocate(width_chars_, height_chars_, factor);
}

void Renderer::set_render_quality(int level) {
    std::optional<double> factor = quality_factor(level);
    if (!factor) {
        std::cerr << "Warning: invalid quality level " << level
                  << ", using " << FALLBACK_QUALITY << std::endl;
        level = FALLBACK_QUALITY;
        factor = quality_factor(level);
    }
    quality_ = level;
    set_resolution_factor(*factor);
}

void Renderer::resize(int width_chars, int height_chars) {
    pending_size_ = std::make_pair(clamp_width(width_chars), clamp_height(height_chars));
}

// The grid and factor are committed only once the buffers exist
void Renderer::reallocate(int width_chars, int height_chars, double factor) {
    int pixel_width = static_cast<int>(std::floor(width_chars * factor));
    int pixel_height = static_cast<int>(std::floor(height_chars * factor)) * 2;
    fb_.resize(pixel_width, pixel_height);
    width_chars_ = width_chars;
    height_chars_ = height_chars;
    res_factor_ = factor;
}

void Renderer::clear_buffers() {
    fb_.clear();
}

void Renderer::begin_frame() {
    if (pending_size_) {
        auto [width_chars, height_chars] = *pending_size_;
        pending_size_.reset();
        double factor = res_factor_;
        if (!factor_fits(width_chars, height_chars, factor)) {
            warn_invalid_factor(factor);
            factor = DEFAULT_RESOLUTION_FACTOR;
        }
        // Same path as a resolution change
        reallocate(width_chars, height_chars, factor);
    } else {
        clear_buffers();
    }
    stats_ = FrameStats{};
}

// ============================================================================
// Frame rendering pipeline
// ============================================================================

ViewSetup Renderer::view_setup(const Camera& camera) const {
    ViewSetup setup;
    setup.view = camera.view_matrix();
    setup.projection = camera.projection_matrix(aspect_ratio());
    setup.view_projection = setup.projection * setup.view;
    return setup;
}

void Renderer::render_scene(const Scene& scene, const Camera& camera) {
    ShadingContext shading(scene.ambient_light());
    std::vector<std::pair<const Mesh*, Matrix4>> draw_list;

    // Pre-order walk accumulating world matrices; a hidden node hides its
    // whole subtree
    struct Walker {
        ShadingContext& shading;
        std::vector<std::pair<const Mesh*, Matrix4>>& draw_list;

        void visit(const Node& node, const Matrix4& parent_world) {
            if (!node.visible) return;
            Matrix4 world = parent_world * node.local_matrix();

            if (node.light) {
                Light light = *node.light;
                if (auto* p = std::get_if<PointLight>(&light)) {
                    p->position = world.transform_point(p->position);
                } else if (auto* s = std::get_if<SpotLight>(&light)) {
                    s->position = world.transform_point(s->position);
                }
                shading.add(light);
            }
            if (node.mesh) {
                draw_list.emplace_back(node.mesh.get(), world);
            }
            for (const auto& child : node.children()) {
                visit(*child, world);
            }
        }
    };
    Walker{shading, draw_list}.visit(scene.root(), Matrix4::identity());

    for (const auto& [mesh, world] : draw_list) {
        render_mesh(*mesh, world, camera, shading);
    }
}

bool Renderer::render_mesh(const Mesh& mesh, const Matrix4& world, const Camera& camera,
                           const ShadingContext& shading) {
    stats_.meshes_submitted++;

    ViewSetup setup = view_setup(camera);
    if (!is_mesh_visible(mesh, world, setup, camera)) {
        stats_.meshes_culled++;
        return false;
    }
    stats_.meshes_rasterized++;

    std::vector<Vector3> world_verts = transform_vertices(mesh, world);
    std::vector<ScreenVertex> screen_verts = project_vertices(world_verts, setup, camera);
    rasterize_triangles(mesh, world_verts, screen_verts, shading);
    return true;
}

bool Renderer::is_mesh_visible(const Mesh& mesh, const Matrix4& world, const ViewSetup& setup,
                               const Camera& camera) const {
    double min_x = std::numeric_limits<double>::infinity();
    double min_y = min_x, min_z = min_x;
    double max_x = -std::numeric_limits<double>::infinity();
    double max_y = max_x, max_z = max_x;

    for (const Vector3& corner : mesh.bounds().corners()) {
        Vector3 p = setup.view_projection * (world * corner);
        min_x = std::min(min_x, p.x);
        min_y = std::min(min_y, p.y);
        min_z = std::min(min_z, p.z);
        max_x = std::max(max_x, p.x);
        max_y = std::max(max_y, p.y);
        max_z = std::max(max_z, p.z);
    }

    if (max_x < -1.0 - CULL_MARGIN || min_x > 1.0 + CULL_MARGIN ||
        max_y < -1.0 - CULL_MARGIN || min_y > 1.0 + CULL_MARGIN ||
        max_z < camera.z_near - CULL_MARGIN || min_z > camera.z_far + CULL_MARGIN) {
        return false;
    }
    return true;
}

std::vector<Vector3> Renderer::transform_vertices(const Mesh& mesh, const Matrix4& world) const {
    std::vector<Vector3> result;
    result.reserve(mesh.verts().size());
    for (const Vector3& v : mesh.verts()) {
        result.push_back(world * v);
    }
    return result;
}

std::vector<ScreenVertex> Renderer::project_vertices(const std::vector<Vector3>& world_verts,
                                                     const ViewSetup& setup,
                                                     const Camera& camera) const {
    std::vector<ScreenVertex> projected;
    projected.reserve(world_verts.size());

    double max_px = fb_.width - 1;
    double max_py = fb_.height - 1;

    for (const Vector3& v_world : world_verts) {
        Vector3 v_view = setup.view * v_world;
        // Zoom dollies the scene away from the eye
        double z = v_view.z + camera.zoom;
        if (z <= camera.z_near) {
            projected.push_back(ScreenVertex{});
            continue;
        }

        Vector3 ndc = setup.projection * Vector3(v_view.x, v_view.y, z);

        // NDC [-1, 1] to pixels; rows grow downward
        ScreenVertex sv;
        sv.x = std::trunc((ndc.x * 0.5 + 0.5) * max_px);
        sv.y = std::trunc((-ndc.y * 0.5 + 0.5) * max_py);
        sv.z = z;
        projected.push_back(sv);
    }
    return projected;
}

void Renderer::rasterize_triangles(const Mesh& mesh, const std::vector<Vector3>& world_verts,
                                   const std::vector<ScreenVertex>& screen_verts,
                                   const ShadingContext& shading) {
    const std::vector<Color>& colors = mesh.colors();

    for (const Face& face : mesh.faces()) {
        unsigned int i0 = face[0], i1 = face[1], i2 = face[2];

        ScreenTriangle tri = rasterizer_.prepare_triangle(screen_verts[i0], screen_verts[i1],
                                                          screen_verts[i2]);
        if (!tri.valid) {
            stats_.triangles_skipped++;
            continue;
        }

        if (mesh.material() == Material::Wireframe) {
            rasterizer_.draw_triangle_edges(tri);
            stats_.triangles_drawn++;
            continue;
        }

        if (tri.box_empty()) {
            stats_.triangles_skipped++;
            continue;
        }

        const Vector3& w0 = world_verts[i0];
        const Vector3& w1 = world_verts[i1];
        const Vector3& w2 = world_verts[i2];

        // Two-sided lighting: flip the normal for back faces
        Vector3 normal = (w1 - w0).cross(w2 - w0).normalized();
        if (!tri.front_facing()) {
            normal = -normal;
        }

        ColorF base_color{
            (colors[i0].r + colors[i1].r + colors[i2].r) / 3.0,
            (colors[i0].g + colors[i1].g + colors[i2].g) / 3.0,
            (colors[i0].b + colors[i1].b + colors[i2].b) / 3.0,
        };
        Vector3 center = (w0 + w1 + w2) * (1.0 / 3.0);

        Color color;
        if (mesh.material() == Material::Phong) {
            Vector3 view_dir = (Vector3() - center).normalized();
            color = shade_phong(shading, base_color, normal, view_dir, center);
        } else {
            color = shade_flat(shading, base_color, normal, center);
        }

        rasterizer_.rasterize_triangle(tri, color);
        stats_.triangles_drawn++;
    }
}

// ============================================================================
// Output composition
// ============================================================================

CellGrid Renderer::compose_cells() const {
    return termrast::compose_cells(fb_, width_chars_, height_chars_, res_factor_);
}

std::vector<std::string> Renderer::compose_to_chars() const {
    return format_lines(compose_cells());
}

std::vector<std::string> Renderer::render_and_composite(const Scene& scene, const Camera& camera) {
    begin_frame();
    try {
        render_scene(scene, camera);
    } catch (...) {
        // Never leave a half-drawn frame behind
        clear_buffers();
        throw;
    }
    return compose_to_chars();
}

}  // namespace termrast
