#ifndef TERMRAST_CAMERA_HPP
#define TERMRAST_CAMERA_HPP

#include "termrast/matrix4.hpp"
#include "termrast/vector3.hpp"

namespace termrast {

constexpr double MIN_FOV = 10.0;
constexpr double MAX_FOV = 160.0;

// ============================================================================
// Camera - view/projection parameters
// ============================================================================
//
// `zoom` is an extra dolly distance added to view-space z before
// projection; it does not change the field of view.

class Camera {
public:
    double fov = 60.0;  // degrees
    double z_near = 0.1;
    double z_far = 100.0;
    double zoom = 1.0;
    Vector3 position;
    Vector3 rotation;  // pitch, yaw, roll (radians)

    // Inverse camera transform: Rx(-pitch) * Ry(-yaw) * Rz(-roll) * T(-position)
    Matrix4 view_matrix() const;
    Matrix4 projection_matrix(double aspect) const;

    // Clamped to [MIN_FOV, MAX_FOV]
    void set_fov(double degrees);
    void change_fov(double delta) { set_fov(fov + delta); }

    void move(double dx, double dy, double dz);
    void rotate(double dx, double dy, double dz);
    void zoom_by(double delta) { zoom += delta; }

    // Back to the origin looking down +z from z = stepback
    void reset(double stepback);
};

}  // namespace termrast

#endif  // TERMRAST_CAMERA_HPP
