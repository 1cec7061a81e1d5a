#ifndef TERMRAST_APP_OBJ_LOADER_HPP
#define TERMRAST_APP_OBJ_LOADER_HPP

#include <memory>

#include "termrast/color.hpp"
#include "termrast/mesh.hpp"

namespace termrast::app {

constexpr Color OBJ_DEFAULT_COLOR(150, 150, 150);

// Loads the triangulated positions of a Wavefront OBJ file into a flat
// shaded mesh with a uniform vertex color. Returns nullptr and logs to
// stderr when the file cannot be parsed.
std::shared_ptr<Mesh> load_obj(const char* filename, Color color = OBJ_DEFAULT_COLOR);

}  // namespace termrast::app

#endif  // TERMRAST_APP_OBJ_LOADER_HPP
