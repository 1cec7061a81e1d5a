#ifndef TERMRAST_MESH_HPP
#define TERMRAST_MESH_HPP

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "termrast/color.hpp"
#include "termrast/vector3.hpp"

namespace termrast {

enum class Material { Flat, Phong, Wireframe };

const char* material_name(Material material);
std::optional<Material> parse_material(const std::string& name);

using Face = std::array<unsigned int, 3>;

struct Bounds {
    Vector3 min;
    Vector3 max;

    // The eight box corners
    std::array<Vector3, 8> corners() const;
};

// ============================================================================
// Mesh - stores geometry data
// ============================================================================

class Mesh {
public:
    // Throws std::invalid_argument when colors.size() != verts.size() or a
    // face index is out of range.
    Mesh(std::vector<Vector3> verts, std::vector<Face> faces, std::vector<Color> colors,
         Material material = Material::Flat);

    const std::vector<Vector3>& verts() const { return verts_; }
    const std::vector<Face>& faces() const { return faces_; }
    const std::vector<Color>& colors() const { return colors_; }

    Material material() const { return material_; }
    void set_material(Material material) { material_ = material; }

    // Replaces vertex positions in place (same count); bounds are recomputed
    // on the next bounds() call.
    void set_verts(std::vector<Vector3> verts);

    // Axis-aligned bounding box; an empty mesh has a degenerate box at origin
    const Bounds& bounds() const;

private:
    std::vector<Vector3> verts_;
    std::vector<Face> faces_;
    std::vector<Color> colors_;
    Material material_;

    mutable Bounds bounds_;
    mutable bool bounds_dirty_ = true;
};

}  // namespace termrast

#endif  // TERMRAST_MESH_HPP
