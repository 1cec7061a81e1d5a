#include "termrast/vector3.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>

namespace termrast {

namespace {

inline double guard_divisor(double d) {
    return std::abs(d) > Vector3::EPS ? d : Vector3::EPS;
}

}  // namespace

Vector3 Vector3::operator/(double s) const {
    s = guard_divisor(s);
    return Vector3(x / s, y / s, z / s);
}

Vector3 Vector3::operator/(const Vector3& o) const {
    return Vector3(x / guard_divisor(o.x), y / guard_divisor(o.y), z / guard_divisor(o.z));
}

bool Vector3::operator==(const Vector3& o) const {
    return std::abs(x - o.x) <= EPS && std::abs(y - o.y) <= EPS && std::abs(z - o.z) <= EPS;
}

Vector3 Vector3::cross(const Vector3& o) const {
    return Vector3(
        y * o.z - z * o.y,
        z * o.x - x * o.z,
        x * o.y - y * o.x
    );
}

double Vector3::length() const {
    double len = std::sqrt(length_sq());
    return len > 0.0 ? len : EPS;
}

Vector3 Vector3::normalized() const {
    double l_sq = length_sq();
    if (l_sq < EPS) {
        return Vector3();
    }
    double inv = 1.0 / std::sqrt(l_sq);
    return Vector3(x * inv, y * inv, z * inv);
}

double Vector3::distance(const Vector3& o) const {
    return (*this - o).length();
}

double Vector3::angle_with(const Vector3& o) const {
    double denom = length() * o.length();
    if (denom < EPS) {
        return 0.0;
    }
    // Rounding can push the cosine slightly outside [-1, 1]
    double c = std::clamp(dot(o) / denom, -1.0, 1.0);
    return std::acos(c);
}

Vector3 Vector3::project_on(const Vector3& o) const {
    double o_len_sq = o.length_sq();
    if (o_len_sq < EPS) {
        return Vector3();
    }
    return o * (dot(o) / o_len_sq);
}

Vector3 Vector3::reject_from(const Vector3& o) const {
    return *this - project_on(o);
}

Vector3 Vector3::reflect(const Vector3& normal) const {
    double d = 2.0 * dot(normal);
    return Vector3(x - normal.x * d, y - normal.y * d, z - normal.z * d);
}

Vector3 Vector3::lerp(const Vector3& o, double t) const {
    return Vector3(
        x + (o.x - x) * t,
        y + (o.y - y) * t,
        z + (o.z - z) * t
    );
}

double Vector3::scalar_triple(const Vector3& b, const Vector3& c) const {
    return dot(b.cross(c));
}

Vector3 Vector3::vector_triple(const Vector3& b, const Vector3& c) const {
    // BAC-CAB: a x (b x c) = b (a.c) - c (a.b)
    double db = dot(b);
    double dc = dot(c);
    return Vector3(b.x * dc - c.x * db, b.y * dc - c.y * db, b.z * dc - c.z * db);
}

Vector3& Vector3::operator+=(const Vector3& o) {
    x += o.x;
    y += o.y;
    z += o.z;
    return *this;
}

Vector3& Vector3::operator-=(const Vector3& o) {
    x -= o.x;
    y -= o.y;
    z -= o.z;
    return *this;
}

Vector3& Vector3::operator*=(double s) {
    x *= s;
    y *= s;
    z *= s;
    return *this;
}

Vector3& Vector3::operator*=(const Vector3& o) {
    x *= o.x;
    y *= o.y;
    z *= o.z;
    return *this;
}

Vector3& Vector3::operator/=(double s) {
    s = guard_divisor(s);
    x /= s;
    y /= s;
    z /= s;
    return *this;
}

std::ostream& operator<<(std::ostream& os, const Vector3& v) {
    std::ios::fmtflags flags = os.flags();
    std::streamsize precision = os.precision();
    os << std::fixed << std::setprecision(3) << "(" << v.x << ", " << v.y << ", " << v.z << ")";
    os.flags(flags);
    os.precision(precision);
    return os;
}

}  // namespace termrast
