#include "termrast/camera.hpp"

#include <algorithm>

namespace termrast {

Matrix4 Camera::view_matrix() const {
    return Matrix4::rotate_x(-rotation.x) *
           Matrix4::rotate_y(-rotation.y) *
           Matrix4::rotate_z(-rotation.z) *
           Matrix4::translate(-position);
}

Matrix4 Camera::projection_matrix(double aspect) const {
    return Matrix4::perspective(fov, aspect, z_near, z_far);
}

void Camera::set_fov(double degrees) {
    fov = std::clamp(degrees, MIN_FOV, MAX_FOV);
}

void Camera::move(double dx, double dy, double dz) {
    position += Vector3(dx, dy, dz);
}

void Camera::rotate(double dx, double dy, double dz) {
    rotation += Vector3(dx, dy, dz);
}

void Camera::reset(double stepback) {
    position = Vector3(0.0, 0.0, stepback);
    rotation = Vector3();
    zoom = 1.0;
    set_fov(60.0);
}

}  // namespace termrast
