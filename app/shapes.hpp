#ifndef TERMRAST_APP_SHAPES_HPP
#define TERMRAST_APP_SHAPES_HPP

#include <memory>
#include <optional>

#include "termrast/color.hpp"
#include "termrast/mesh.hpp"

namespace termrast::app {

// Procedural mesh builders. Without a color each builder picks
// position-dependent vertex colors.

std::shared_ptr<Mesh> build_cube(double size = 1.0, std::optional<Color> color = std::nullopt);

std::shared_ptr<Mesh> build_uv_sphere(double radius = 1.0, int segments_x = 20, int segments_y = 10,
                                      std::optional<Color> color = std::nullopt);

// Grid in the XZ plane centered on the origin
std::shared_ptr<Mesh> build_plane(double width = 1.0, double depth = 1.0, int segments_x = 1,
                                  int segments_z = 1, std::optional<Color> color = std::nullopt);

std::shared_ptr<Mesh> build_torus(double major_radius = 2.0, double minor_radius = 0.7,
                                  int segments_major = 40, int segments_minor = 20,
                                  std::optional<Color> color = std::nullopt);

}  // namespace termrast::app

#endif  // TERMRAST_APP_SHAPES_HPP
