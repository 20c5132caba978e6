// src/placement/FootprintCache.hpp
#pragma once
#include <optional>
#include <string>
#include <unordered_map>

#include "roomscatter/Math.hpp"
#include "roomscatter/Providers.hpp"
#include "placement/PlacementTypes.hpp"

namespace roomscatter::placement {

// Memoized pre-placement estimates. Each template is measured once per cache
// lifetime instead of once per attempt.
class FootprintCache {
public:
    FootprintCache(IGeometryProvider& geometry, float minimumSize);

    // Estimate for one template; nullopt if the provider failed.
    [[nodiscard]] std::optional<Footprint> item(const ItemRef& ref);

    // Representative box of a category: per-axis maximum over its templates.
    [[nodiscard]] std::optional<Footprint> category(const Category& cat);

    // Estimate widened on X/Z by `safetyFactor` for candidate selection.
    [[nodiscard]] static Footprint padded(const Footprint& estimate, float safetyFactor);

    void clear() noexcept;

    [[nodiscard]] std::size_t measuredCount() const noexcept { return items_.size(); }

private:
    IGeometryProvider& geometry_;
    float minimumSize_;
    std::unordered_map<std::string, std::optional<Footprint>> items_;
    std::unordered_map<std::string, std::optional<Footprint>> categories_;
};

} // namespace roomscatter::placement
