#include "termrast/transform.hpp"

namespace termrast {

Matrix4 Transform::matrix() const {
    return Matrix4::translate(pos) *
           Matrix4::translate(pivot) *
           Matrix4::rotate_y(rot.y) *
           Matrix4::rotate_x(rot.x) *
           Matrix4::rotate_z(rot.z) *
           Matrix4::scale(scale) *
           Matrix4::translate(-pivot);
}

}  // namespace termrast
