// filename: types.hpp
// part of Equipotential Surface Mesher
// MIT License

#pragma once

#include <cmath>

namespace equipot {

constexpr double kPi = 3.14159265358979323846;

/**
 * @brief Plain 3D vector used for grid points, mesh vertices and normals.
 */
struct Vec3 {
    double x{0.0};
    double y{0.0};
    double z{0.0};
};

inline Vec3 operator+(const Vec3& a, const Vec3& b) { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
inline Vec3 operator-(const Vec3& a, const Vec3& b) { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
inline Vec3 operator*(const Vec3& a, double s) { return {a.x * s, a.y * s, a.z * s}; }

inline bool operator==(const Vec3& a, const Vec3& b) { return a.x == b.x && a.y == b.y && a.z == b.z; }
inline bool operator!=(const Vec3& a, const Vec3& b) { return !(a == b); }

[[nodiscard]] inline double dot(const Vec3& a, const Vec3& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }

[[nodiscard]] inline Vec3 cross(const Vec3& a, const Vec3& b) {
    return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x};
}

[[nodiscard]] inline double length(const Vec3& a) { return std::sqrt(dot(a, a)); }

[[nodiscard]] inline double distance(const Vec3& a, const Vec3& b) { return length(a - b); }

// a + (b - a) * t, the same blend for every edge so shared edges agree bitwise.
[[nodiscard]] inline Vec3 lerp(const Vec3& a, const Vec3& b, double t) {
    return {a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t, a.z + (b.z - a.z) * t};
}

// Zero-length (or non-finite) input yields the zero vector.
[[nodiscard]] inline Vec3 normalized(const Vec3& a) {
    const double len = length(a);
    if (!(len > 0.0) || !std::isfinite(len)) {
        return {};
    }
    return a * (1.0 / len);
}

[[nodiscard]] inline bool isFinite(const Vec3& a) {
    return std::isfinite(a.x) && std::isfinite(a.y) && std::isfinite(a.z);
}

}  // namespace equipot
