// include/roomscatter/Region.hpp
#pragma once
#include <optional>

#include "roomscatter/Math.hpp"

namespace roomscatter {

// Axis-aligned room volume plus the floor elevation items rest on.
// X/Z is the floor plane; Y is up.
struct Region {
    Vec3  min{};
    Vec3  max{};
    float floorY = 0.0f;

    // Validated constructor: X and Z spans must be strictly positive.
    [[nodiscard]] static std::optional<Region> make(Vec3 lo, Vec3 hi, float floor) {
        if (!(lo.x < hi.x) || !(lo.z < hi.z))
            return std::nullopt;
        return Region{ lo, hi, floor };
    }

    // Convenience for rooms whose floor is the bottom of the bounds.
    [[nodiscard]] static std::optional<Region> from_bounds(Vec3 lo, Vec3 hi) {
        return make(lo, hi, lo.y);
    }

    [[nodiscard]] bool valid() const { return min.x < max.x && min.z < max.z; }

    [[nodiscard]] float width() const { return max.x - min.x; }
    [[nodiscard]] float depth() const { return max.z - min.z; }
    [[nodiscard]] float floor_area() const { return width() * depth(); }

    // Horizontal center at floor height.
    [[nodiscard]] Vec3 floor_center() const {
        return { (min.x + max.x) * 0.5f, floorY, (min.z + max.z) * 0.5f };
    }

    [[nodiscard]] Footprint bounds() const { return Footprint::from_min_max(min, max); }
};

} // namespace roomscatter
