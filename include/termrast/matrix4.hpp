#ifndef TERMRAST_MATRIX4_HPP
#define TERMRAST_MATRIX4_HPP

#include "HandmadeMath.h"

#include "termrast/vector3.hpp"

namespace termrast {

// ============================================================================
// Matrix4 - column-major 4x4 homogeneous transform backed by HMM_Mat4
// ============================================================================
//
// Composition follows the usual column-vector convention: for a point p,
// (A * B) * p == A * (B * p), i.e. B is applied first.

class Matrix4 {
public:
    // Identity
    Matrix4();
    explicit Matrix4(const HMM_Mat4& m) : m(m) {}

    static Matrix4 identity() { return Matrix4(); }
    static Matrix4 scale(double x, double y, double z);
    static Matrix4 scale(const Vector3& s) { return scale(s.x, s.y, s.z); }
    static Matrix4 translate(double x, double y, double z);
    static Matrix4 translate(const Vector3& t) { return translate(t.x, t.y, t.z); }

    // Right-handed rotations, angles in radians
    static Matrix4 rotate_x(double angle);
    static Matrix4 rotate_y(double angle);
    static Matrix4 rotate_z(double angle);

    // OpenGL style projection: f = 1/tan(fov/2), w' = -z
    static Matrix4 perspective(double fov_degrees, double aspect, double z_near, double z_far);

    Matrix4 operator*(const Matrix4& o) const;

    // Treats p as a point (w = 1). Divides by the resulting w unless it is
    // exactly zero, in which case the undivided xyz is returned.
    Vector3 transform_point(const Vector3& p) const;
    Vector3 operator*(const Vector3& p) const { return transform_point(p); }

    // Element access, column-major: index = col * 4 + row
    float operator[](int index) const { return m.Elements[index / 4][index % 4]; }
    float at(int col, int row) const { return m.Elements[col][row]; }
    float& at(int col, int row) { return m.Elements[col][row]; }

    // Element-wise comparison within tolerance
    bool approx_equal(const Matrix4& o, float tolerance = 1e-5f) const;

    const HMM_Mat4& raw() const { return m; }

private:
    HMM_Mat4 m;
};

}  // namespace termrast

#endif  // TERMRAST_MATRIX4_HPP
