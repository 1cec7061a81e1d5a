#ifndef TERMRAST_VECTOR3_HPP
#define TERMRAST_VECTOR3_HPP

#include <ostream>

namespace termrast {

// ============================================================================
// Vector3 - double precision 3D vector
// ============================================================================

class Vector3 {
public:
    // Substituted for any divisor smaller than this in magnitude
    static constexpr double EPS = 1e-9;

    double x, y, z;

    constexpr Vector3() : x(0.0), y(0.0), z(0.0) {}
    constexpr Vector3(double x, double y, double z) : x(x), y(y), z(z) {}

    Vector3 operator+(const Vector3& o) const { return Vector3(x + o.x, y + o.y, z + o.z); }
    Vector3 operator-(const Vector3& o) const { return Vector3(x - o.x, y - o.y, z - o.z); }
    Vector3 operator-() const { return Vector3(-x, -y, -z); }
    Vector3 operator*(double s) const { return Vector3(x * s, y * s, z * s); }

    // Componentwise (Hadamard) product
    Vector3 operator*(const Vector3& o) const { return Vector3(x * o.x, y * o.y, z * o.z); }

    Vector3 operator/(double s) const;
    Vector3 operator/(const Vector3& o) const;

    // Tolerant comparison (EPS per component)
    bool operator==(const Vector3& o) const;
    bool operator!=(const Vector3& o) const { return !(*this == o); }

    double dot(const Vector3& o) const { return x * o.x + y * o.y + z * o.z; }
    Vector3 cross(const Vector3& o) const;

    double length_sq() const { return x * x + y * y + z * z; }
    double length() const;

    // Unit vector in the same direction, or (0,0,0) when near zero
    Vector3 normalized() const;

    double distance(const Vector3& o) const;

    // Angle in radians, 0 when either vector is degenerate
    double angle_with(const Vector3& o) const;

    Vector3 project_on(const Vector3& o) const;
    Vector3 reject_from(const Vector3& o) const;

    // Mirror about a (unit) normal: v - 2 (v.n) n
    Vector3 reflect(const Vector3& normal) const;

    Vector3 lerp(const Vector3& o, double t) const;

    // a . (b x c)
    double scalar_triple(const Vector3& b, const Vector3& c) const;
    // a x (b x c)
    Vector3 vector_triple(const Vector3& b, const Vector3& c) const;

    // In-place variants for tight loops
    Vector3& operator+=(const Vector3& o);
    Vector3& operator-=(const Vector3& o);
    Vector3& operator*=(double s);
    Vector3& operator*=(const Vector3& o);
    Vector3& operator/=(double s);
};

inline Vector3 operator*(double s, const Vector3& v) { return v * s; }

std::ostream& operator<<(std::ostream& os, const Vector3& v);

}  // namespace termrast

#endif  // TERMRAST_VECTOR3_HPP
