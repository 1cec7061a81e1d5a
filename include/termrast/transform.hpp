#ifndef TERMRAST_TRANSFORM_HPP
#define TERMRAST_TRANSFORM_HPP

#include "termrast/matrix4.hpp"
#include "termrast/vector3.hpp"

namespace termrast {

// Local placement of a scene node. Rotation is Euler (pitch, yaw, roll) in
// radians; rotation and scale happen about `pivot`.
struct Transform {
    Vector3 pos;
    Vector3 rot;
    Vector3 scale{1.0, 1.0, 1.0};
    Vector3 pivot;

    // T(pos) * T(pivot) * Ry * Rx * Rz * S(scale) * T(-pivot)
    Matrix4 matrix() const;
};

}  // namespace termrast

#endif  // TERMRAST_TRANSFORM_HPP
