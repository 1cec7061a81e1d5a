#ifndef TERMRAST_RENDERER_HPP
#define TERMRAST_RENDERER_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "termrast/camera.hpp"
#include "termrast/compositor.hpp"
#include "termrast/framebuffer.hpp"
#include "termrast/matrix4.hpp"
#include "termrast/mesh.hpp"
#include "termrast/rasterizer.hpp"
#include "termrast/scene.hpp"
#include "termrast/shading.hpp"

namespace termrast {

// ============================================================================
// Configuration
// ============================================================================

// Slack around the clip volume before a mesh is culled
constexpr double CULL_MARGIN = 0.2;

// Character grid bounds applied by the constructor and resize()
constexpr int MIN_WIDTH_CHARS = 30;
constexpr int MIN_HEIGHT_CHARS = 12;
constexpr int MAX_WIDTH_CHARS = 4096;
constexpr int MAX_HEIGHT_CHARS = 2048;

// Largest pixel grid a resolution factor may produce. The maximum character
// grid at factor 1 fits exactly.
constexpr long long MAX_FRAMEBUFFER_PIXELS = 1LL << 24;

// Quality levels map to resolution factors; unknown levels fall back to
// FALLBACK_QUALITY
constexpr int DEFAULT_QUALITY = 3;
constexpr int FALLBACK_QUALITY = 2;
constexpr double DEFAULT_RESOLUTION_FACTOR = 1.0;

std::optional<double> quality_factor(int level);

// Counters for the most recent frame
struct FrameStats {
    size_t meshes_submitted = 0;
    size_t meshes_culled = 0;
    size_t meshes_rasterized = 0;
    size_t triangles_drawn = 0;
    size_t triangles_skipped = 0;
};

// View and projection matrices for one frame
struct ViewSetup {
    Matrix4 view;
    Matrix4 projection;
    Matrix4 view_projection;
};

// ============================================================================
// Renderer - buffers, per-mesh pipeline and terminal composition
// ============================================================================
//
// Single threaded: a frame runs clear -> transform -> cull -> rasterize ->
// compose to completion. Character grid changes requested with resize()
// are applied at the start of the next frame.

class Renderer {
public:
    // The character grid is clamped like resize()
    Renderer(int width_chars, int height_chars);

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    int width_chars() const { return width_chars_; }
    int height_chars() const { return height_chars_; }
    int pixel_width() const { return fb_.width; }
    int pixel_height() const { return fb_.height; }
    double resolution_factor() const { return res_factor_; }
    int quality() const { return quality_; }
    double aspect_ratio() const;

    const Framebuffer& framebuffer() const { return fb_; }
    const FrameStats& stats() const { return stats_; }

    void set_clear_color(int r, int g, int b);

    // pixel_width = floor(width_chars * f), pixel_height =
    // floor(height_chars * f) * 2; both buffers are reallocated and cleared.
    // A factor that is not finite, leaves no pixels or exceeds
    // MAX_FRAMEBUFFER_PIXELS falls back to 1.0.
    void set_resolution_factor(double factor);

    // Unknown levels log a warning and use FALLBACK_QUALITY
    void set_render_quality(int level);

    // Deferred to the next frame boundary; clamped to the character grid
    // bounds
    void resize(int width_chars, int height_chars);
    bool resize_pending() const { return pending_size_.has_value(); }

    void clear_buffers();

    // Applies a pending resize, clears the buffers and resets the stats
    void begin_frame();

    ViewSetup view_setup(const Camera& camera) const;

    // Draws every visible mesh node; lights in visible nodes are placed by
    // their node's world matrix
    void render_scene(const Scene& scene, const Camera& camera);

    // Full pipeline for one mesh. Returns false when the mesh was culled.
    bool render_mesh(const Mesh& mesh, const Matrix4& world, const Camera& camera,
                     const ShadingContext& shading);

    // Conservative box-corner test against the clip volume
    bool is_mesh_visible(const Mesh& mesh, const Matrix4& world, const ViewSetup& setup,
                         const Camera& camera) const;

    std::vector<Vector3> transform_vertices(const Mesh& mesh, const Matrix4& world) const;

    // Invalid vertices (at or behind the near plane after zoom) keep z = +inf
    std::vector<ScreenVertex> project_vertices(const std::vector<Vector3>& world_verts,
                                               const ViewSetup& setup, const Camera& camera) const;

    CellGrid compose_cells() const;
    std::vector<std::string> compose_to_chars() const;

    // One complete frame. If rendering throws, the buffers are reset to the
    // cleared state before the exception propagates.
    std::vector<std::string> render_and_composite(const Scene& scene, const Camera& camera);

    bool save_to_file(const char* filename) const { return fb_.save_to_file(filename); }

private:
    void rasterize_triangles(const Mesh& mesh, const std::vector<Vector3>& world_verts,
                             const std::vector<ScreenVertex>& screen_verts,
                             const ShadingContext& shading);
    void reallocate(int width_chars, int height_chars, double factor);

    int width_chars_;
    int height_chars_;
    double res_factor_ = DEFAULT_RESOLUTION_FACTOR;
    int quality_ = DEFAULT_QUALITY;
    std::optional<std::pair<int, int>> pending_size_;

    Framebuffer fb_;
    Rasterizer rasterizer_;
    FrameStats stats_;
};

}  // namespace termrast

#endif  // TERMRAST_RENDERER_HPP
