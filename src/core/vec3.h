#ifndef STRATA_CORE_VEC3_H_
#define STRATA_CORE_VEC3_H_

#include <cmath>
#include <iostream>

#include "core/constants.h"

namespace strata {

struct Vec3 {
  public:
    Float e[3];

    Vec3() : e{0, 0, 0} {}
    Vec3(Float e0, Float e1, Float e2) : e{e0, e1, e2} {}

    Float x() const { return e[0]; }
    Float y() const { return e[1]; }
    Float z() const { return e[2]; }

    Vec3 operator-() const { return Vec3(-e[0], -e[1], -e[2]); }
    Float operator[](int i) const { return e[i]; }
    Float& operator[](int i) { return e[i]; }

    Vec3& operator+=(const Vec3& v) {
        e[0] += v.e[0];
        e[1] += v.e[1];
        e[2] += v.e[2];
        return *this;
    }

    Vec3& operator*=(Float t) {
        e[0] *= t;
        e[1] *= t;
        e[2] *= t;
        return *this;
    }

    Vec3& operator/=(Float t) { return *this *= 1 / t; }

    Float Length() const { return std::sqrt(LengthSquared()); }
    Float LengthSquared() const { return e[0] * e[0] + e[1] * e[1] + e[2] * e[2]; }

    // Return true if the vector is close to zero in all dimensions
    bool NearZero() const {
        return (std::fabs(e[0]) < kNearZero) && (std::fabs(e[1]) < kNearZero) &&
               (std::fabs(e[2]) < kNearZero);
    }
};

// point alias for Vec3
using Point3 = Vec3;

inline std::ostream& operator<<(std::ostream& out, const Vec3& v) {
    return out << v.e[0] << ' ' << v.e[1] << ' ' << v.e[2];
}

inline Vec3 operator+(const Vec3& u, const Vec3& v) {
    return Vec3(u.e[0] + v.e[0], u.e[1] + v.e[1], u.e[2] + v.e[2]);
}

inline Vec3 operator-(const Vec3& u, const Vec3& v) {
    return Vec3(u.e[0] - v.e[0], u.e[1] - v.e[1], u.e[2] - v.e[2]);
}

inline Vec3 operator*(const Vec3& u, const Vec3& v) {
    return Vec3(u.e[0] * v.e[0], u.e[1] * v.e[1], u.e[2] * v.e[2]);
}

inline Vec3 operator*(Float t, const Vec3& v) { return Vec3(t * v.e[0], t * v.e[1], t * v.e[2]); }

inline Vec3 operator*(const Vec3& v, Float t) { return t * v; }

inline Vec3 operator/(const Vec3& v, Float t) { return (1 / t) * v; }

inline Float Dot(const Vec3& u, const Vec3& v) {
    return u.e[0] * v.e[0] + u.e[1] * v.e[1] + u.e[2] * v.e[2];
}

inline Vec3 Cross(const Vec3& u, const Vec3& v) {
    return Vec3(u.e[1] * v.e[2] - u.e[2] * v.e[1], u.e[2] * v.e[0] - u.e[0] * v.e[2],
                u.e[0] * v.e[1] - u.e[1] * v.e[0]);
}

inline Vec3 Normalize(const Vec3& v) { return v / v.Length(); }

// Mirror v about n: remove twice the component of v along n.
inline Vec3 Reflect(const Vec3& v, const Vec3& n) { return v - 2 * Dot(v, n) * n; }

// Snell's law: eta * sin(theta) = eta' * sin(theta').
// The refracted direction is split into parts perpendicular and parallel to n.
// uv must be unit length.
inline Vec3 Refract(const Vec3& uv, const Vec3& n, Float etai_over_etat) {
    Float cos_theta = std::fmin(Dot(-uv, n), 1.0);
    Vec3 r_out_perp = etai_over_etat * (uv + cos_theta * n);
    Vec3 r_out_parallel = -std::sqrt(std::fabs(1.0 - r_out_perp.LengthSquared())) * n;
    return r_out_perp + r_out_parallel;
}

}  // namespace strata

#endif  // STRATA_CORE_VEC3_H_
