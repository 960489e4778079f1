#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>

// -----------------------------------------------------------------------------
// Small math helpers shared by the solver, the affector system and the tests.
// Vec3 is 3 packed floats so it can sit directly inside the GPU records.
// -----------------------------------------------------------------------------
struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    Vec3() = default;
    constexpr Vec3(float X, float Y, float Z) : x(X), y(Y), z(Z) {}

    Vec3 operator+(const Vec3& o) const { return Vec3(x + o.x, y + o.y, z + o.z); }
    Vec3 operator-(const Vec3& o) const { return Vec3(x - o.x, y - o.y, z - o.z); }
    Vec3 operator-() const { return Vec3(-x, -y, -z); }
    Vec3 operator*(float s) const { return Vec3(x * s, y * s, z * s); }
    Vec3 operator/(float s) const { return Vec3(x / s, y / s, z / s); }

    Vec3& operator+=(const Vec3& o) { x += o.x; y += o.y; z += o.z; return *this; }
    Vec3& operator-=(const Vec3& o) { x -= o.x; y -= o.y; z -= o.z; return *this; }
    Vec3& operator*=(float s) { x *= s; y *= s; z *= s; return *this; }

    bool operator==(const Vec3& o) const { return x == o.x && y == o.y && z == o.z; }
    bool operator!=(const Vec3& o) const { return !(*this == o); }
};

inline Vec3 operator*(float s, const Vec3& v) { return v * s; }

inline float dot(const Vec3& a, const Vec3& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }

inline Vec3 cross(const Vec3& a, const Vec3& b) {
    return Vec3(a.y * b.z - a.z * b.y,
                a.z * b.x - a.x * b.z,
                a.x * b.y - a.y * b.x);
}

inline float lengthSq(const Vec3& v) { return dot(v, v); }
inline float length(const Vec3& v) { return std::sqrt(dot(v, v)); }

inline Vec3 normalizeOrZero(const Vec3& v) {
    const float l = length(v);
    if (!(l > 1e-12f)) return Vec3();
    return v / l;
}

inline Vec3 mulComponents(const Vec3& a, const Vec3& b) { return Vec3(a.x * b.x, a.y * b.y, a.z * b.z); }
inline Vec3 absComponents(const Vec3& v) { return Vec3(std::fabs(v.x), std::fabs(v.y), std::fabs(v.z)); }
inline float maxComponent(const Vec3& v) { return std::max(v.x, std::max(v.y, v.z)); }

inline bool isFiniteVec(const Vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

// Rotation-only 3x3 stored as the upper-left block of a column-major 4x4
// (m[col*4 + row]), the same layout the GPU records carry.
struct Mat4 {
    float m[16] = { 1, 0, 0, 0,
                    0, 1, 0, 0,
                    0, 0, 1, 0,
                    0, 0, 0, 1 };

    static Mat4 identity() { return Mat4(); }

    float at(int row, int col) const { return m[col * 4 + row]; }
    float& at(int row, int col) { return m[col * 4 + row]; }

    // R * v
    Vec3 rotate(const Vec3& v) const {
        return Vec3(at(0,0) * v.x + at(0,1) * v.y + at(0,2) * v.z,
                    at(1,0) * v.x + at(1,1) * v.y + at(1,2) * v.z,
                    at(2,0) * v.x + at(2,1) * v.y + at(2,2) * v.z);
    }

    // R^T * v (inverse for a pure rotation)
    Vec3 inverseRotate(const Vec3& v) const {
        return Vec3(at(0,0) * v.x + at(1,0) * v.y + at(2,0) * v.z,
                    at(0,1) * v.x + at(1,1) * v.y + at(2,1) * v.z,
                    at(0,2) * v.x + at(1,2) * v.y + at(2,2) * v.z);
    }

    Mat4 operator*(const Mat4& o) const {
        Mat4 r;
        for (int row = 0; row < 4; ++row) {
            for (int col = 0; col < 4; ++col) {
                float s = 0.0f;
                for (int k = 0; k < 4; ++k) s += at(row, k) * o.at(k, col);
                r.at(row, col) = s;
            }
        }
        return r;
    }

    // Euler angles in degrees, applied Z first, then X, then Y (R = Ry * Rx * Rz).
    static Mat4 fromEulerDegrees(const Vec3& eulerDeg);
};

namespace sph_internal {

constexpr float kPi = 3.14159265358979323846f;
constexpr float kDeg2Rad = kPi / 180.0f;

inline int clampi(int v, int lo, int hi) {
    return std::max(lo, std::min(v, hi));
}

inline float clamp01(float x) {
    if (!std::isfinite(x)) return 0.0f;
    if (x < 0.0f) return 0.0f;
    if (x > 1.0f) return 1.0f;
    return x;
}

inline float clampf(float x, float lo, float hi) {
    if (!std::isfinite(x)) return lo;
    if (x < lo) return lo;
    if (x > hi) return hi;
    return x;
}

// Fold an angle difference in degrees into [-180, 180].
inline float wrapDegrees(float d) {
    if (d > 180.0f) d -= 360.0f;
    if (d < -180.0f) d += 360.0f;
    return d;
}

} // namespace sph_internal

inline Mat4 Mat4::fromEulerDegrees(const Vec3& eulerDeg) {
    const float ax = eulerDeg.x * sph_internal::kDeg2Rad;
    const float ay = eulerDeg.y * sph_internal::kDeg2Rad;
    const float az = eulerDeg.z * sph_internal::kDeg2Rad;

    const float cx = std::cos(ax), sx = std::sin(ax);
    const float cy = std::cos(ay), sy = std::sin(ay);
    const float cz = std::cos(az), sz = std::sin(az);

    Mat4 rx, ry, rz;
    rx.at(1,1) = cx; rx.at(1,2) = -sx;
    rx.at(2,1) = sx; rx.at(2,2) = cx;

    ry.at(0,0) = cy;  ry.at(0,2) = sy;
    ry.at(2,0) = -sy; ry.at(2,2) = cy;

    rz.at(0,0) = cz; rz.at(0,1) = -sz;
    rz.at(1,0) = sz; rz.at(1,1) = cz;

    return ry * rx * rz;
}
