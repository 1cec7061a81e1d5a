#include "termrast/mesh.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

namespace termrast {

const char* material_name(Material material) {
    switch (material) {
        case Material::Flat: return "flat";
        case Material::Phong: return "phong";
        case Material::Wireframe: return "wireframe";
    }
    return "flat";
}

std::optional<Material> parse_material(const std::string& name) {
    if (name == "flat") return Material::Flat;
    if (name == "phong") return Material::Phong;
    if (name == "wireframe") return Material::Wireframe;
    return std::nullopt;
}

std::array<Vector3, 8> Bounds::corners() const {
    return {
        Vector3(min.x, min.y, min.z),
        Vector3(max.x, min.y, min.z),
        Vector3(min.x, max.y, min.z),
        Vector3(max.x, max.y, min.z),
        Vector3(min.x, min.y, max.z),
        Vector3(max.x, min.y, max.z),
        Vector3(min.x, max.y, max.z),
        Vector3(max.x, max.y, max.z),
    };
}

Mesh::Mesh(std::vector<Vector3> verts, std::vector<Face> faces, std::vector<Color> colors,
           Material material)
    : verts_(std::move(verts)),
      faces_(std::move(faces)),
      colors_(std::move(colors)),
      material_(material) {
    if (colors_.size() != verts_.size()) {
        throw std::invalid_argument("Mesh: " + std::to_string(colors_.size()) +
                                    " colors for " + std::to_string(verts_.size()) + " vertices");
    }
    for (size_t i = 0; i < faces_.size(); i++) {
        for (unsigned int idx : faces_[i]) {
            if (idx >= verts_.size()) {
                throw std::invalid_argument("Mesh: face " + std::to_string(i) +
                                            " references vertex " + std::to_string(idx) +
                                            " of " + std::to_string(verts_.size()));
            }
        }
    }
}

void Mesh::set_verts(std::vector<Vector3> verts) {
    if (verts.size() != verts_.size()) {
        throw std::invalid_argument("Mesh::set_verts: vertex count must stay " +
                                    std::to_string(verts_.size()));
    }
    verts_ = std::move(verts);
    bounds_dirty_ = true;
}

const Bounds& Mesh::bounds() const {
    if (!bounds_dirty_) {
        return bounds_;
    }
    if (verts_.empty()) {
        bounds_ = Bounds{};
    } else {
        Vector3 min_bound(std::numeric_limits<double>::max(),
                          std::numeric_limits<double>::max(),
                          std::numeric_limits<double>::max());
        Vector3 max_bound(std::numeric_limits<double>::lowest(),
                          std::numeric_limits<double>::lowest(),
                          std::numeric_limits<double>::lowest());

        for (const auto& v : verts_) {
            min_bound.x = std::min(min_bound.x, v.x);
            min_bound.y = std::min(min_bound.y, v.y);
            min_bound.z = std::min(min_bound.z, v.z);
            max_bound.x = std::max(max_bound.x, v.x);
            max_bound.y = std::max(max_bound.y, v.y);
            max_bound.z = std::max(max_bound.z, v.z);
        }
        bounds_ = Bounds{min_bound, max_bound};
    }
    bounds_dirty_ = false;
    return bounds_;
}

}  // namespace termrast
