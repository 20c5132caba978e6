// include/roomscatter/Math.hpp
#pragma once
#include <algorithm>
#include <cmath>

namespace roomscatter {

struct Vec3 {
    float x = 0.0f, y = 0.0f, z = 0.0f;
    Vec3() = default;
    constexpr Vec3(float X, float Y, float Z) : x(X), y(Y), z(Z) {}
};

inline constexpr Vec3 operator+(Vec3 a, Vec3 b) { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
inline constexpr Vec3 operator-(Vec3 a, Vec3 b) { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
inline constexpr Vec3 operator*(Vec3 a, float s) { return {a.x * s, a.y * s, a.z * s}; }
inline constexpr bool operator==(Vec3 a, Vec3 b) { return a.x == b.x && a.y == b.y && a.z == b.z; }

// Horizontal (XZ) distance; Y is the vertical axis.
inline float distance_xz(Vec3 a, Vec3 b) {
    const float dx = a.x - b.x;
    const float dz = a.z - b.z;
    return std::sqrt(dx * dx + dz * dz);
}

// Axis-aligned box stored as center + half-size.
struct Footprint {
    Vec3 center{};
    Vec3 extents{};

    [[nodiscard]] static Footprint from_min_max(Vec3 lo, Vec3 hi) {
        return { (lo + hi) * 0.5f, (hi - lo) * 0.5f };
    }

    [[nodiscard]] constexpr Vec3 min() const { return center - extents; }
    [[nodiscard]] constexpr Vec3 max() const { return center + extents; }
    [[nodiscard]] constexpr Vec3 size() const { return extents * 2.0f; }

    // Radius used by the cheap separation rule: half the larger horizontal side.
    [[nodiscard]] float planar_radius() const { return std::max(extents.x, extents.z); }

    [[nodiscard]] bool has_zero_axis() const {
        return extents.x <= 0.0f || extents.y <= 0.0f || extents.z <= 0.0f;
    }

    // Same box moved so that its center sits at `c`.
    [[nodiscard]] Footprint recentered(Vec3 c) const { return { c, extents }; }

    // Grow on X/Z only (Y untouched).
    [[nodiscard]] Footprint inflated_xz(float margin) const {
        return { center, { extents.x + margin, extents.y, extents.z + margin } };
    }

    // Closed-interval overlap test on all three axes.
    [[nodiscard]] bool intersects(const Footprint& o) const {
        const Vec3 a0 = min(), a1 = max(), b0 = o.min(), b1 = o.max();
        return a0.x <= b1.x && a1.x >= b0.x &&
               a0.y <= b1.y && a1.y >= b0.y &&
               a0.z <= b1.z && a1.z >= b0.z;
    }
};

// Bounds of `local` rotated by `yawDegrees` about the vertical axis through `pivot`,
// then translated so the pivot lands on `position`.
inline Footprint rotate_about_y(const Footprint& local, float yawDegrees, Vec3 position) {
    constexpr float kDegToRad = 0.017453292519943295f;
    const float r = yawDegrees * kDegToRad;
    const float c = std::cos(r);
    const float s = std::sin(r);

    const Vec3 lc = local.center;
    const Vec3 center{ position.x + c * lc.x + s * lc.z,
                       position.y + lc.y,
                       position.z - s * lc.x + c * lc.z };
    const Vec3 ext{ std::abs(c) * local.extents.x + std::abs(s) * local.extents.z,
                    local.extents.y,
                    std::abs(s) * local.extents.x + std::abs(c) * local.extents.z };
    return { center, ext };
}

} // namespace roomscatter
