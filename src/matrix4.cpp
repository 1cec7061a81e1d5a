#include "termrast/matrix4.hpp"

#include <cmath>

namespace termrast {

Matrix4::Matrix4() : m(HMM_M4D(1.0f)) {}

Matrix4 Matrix4::scale(double x, double y, double z) {
    return Matrix4(HMM_Scale(HMM_V3(static_cast<float>(x), static_cast<float>(y), static_cast<float>(z))));
}

Matrix4 Matrix4::translate(double x, double y, double z) {
    return Matrix4(HMM_Translate(HMM_V3(static_cast<float>(x), static_cast<float>(y), static_cast<float>(z))));
}

Matrix4 Matrix4::rotate_x(double angle) {
    return Matrix4(HMM_Rotate_RH(HMM_AngleRad(static_cast<float>(angle)), HMM_V3(1.0f, 0.0f, 0.0f)));
}

Matrix4 Matrix4::rotate_y(double angle) {
    return Matrix4(HMM_Rotate_RH(HMM_AngleRad(static_cast<float>(angle)), HMM_V3(0.0f, 1.0f, 0.0f)));
}

Matrix4 Matrix4::rotate_z(double angle) {
    return Matrix4(HMM_Rotate_RH(HMM_AngleRad(static_cast<float>(angle)), HMM_V3(0.0f, 0.0f, 1.0f)));
}

Matrix4 Matrix4::perspective(double fov_degrees, double aspect, double z_near, double z_far) {
    return Matrix4(HMM_Perspective_RH_NO(HMM_AngleDeg(static_cast<float>(fov_degrees)),
                                         static_cast<float>(aspect),
                                         static_cast<float>(z_near),
                                         static_cast<float>(z_far)));
}

Matrix4 Matrix4::operator*(const Matrix4& o) const {
    return Matrix4(HMM_MulM4(m, o.m));
}

Vector3 Matrix4::transform_point(const Vector3& p) const {
    HMM_Vec4 v = HMM_MulM4V4(m, HMM_V4(static_cast<float>(p.x), static_cast<float>(p.y),
                                        static_cast<float>(p.z), 1.0f));
    if (v.W != 0.0f) {
        return Vector3(v.X / v.W, v.Y / v.W, v.Z / v.W);
    }
    return Vector3(v.X, v.Y, v.Z);
}

bool Matrix4::approx_equal(const Matrix4& o, float tolerance) const {
    for (int col = 0; col < 4; col++) {
        for (int row = 0; row < 4; row++) {
            if (std::abs(m.Elements[col][row] - o.m.Elements[col][row]) > tolerance) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace termrast
