// src/placement/FootprintCache.cpp
#include "placement/FootprintCache.hpp"

#include <algorithm>
#include <exception>

#include <spdlog/spdlog.h>

namespace roomscatter::placement {

FootprintCache::FootprintCache(IGeometryProvider& geometry, float minimumSize)
    : geometry_(geometry)
    , minimumSize_(std::max(minimumSize, 1e-3f))
{
}

std::optional<Footprint> FootprintCache::item(const ItemRef& ref)
{
    if (auto it = items_.find(ref); it != items_.end())
        return it->second;

    std::optional<Footprint> est;
    try {
        Footprint fp = geometry_.estimateFootprint(ref);
        if (fp.has_zero_axis()) {
            spdlog::warn("FootprintCache: '{}' has zero bounds ({:.3f} x {:.3f} x {:.3f}); using a {:.2f} cube",
                         ref, fp.size().x, fp.size().y, fp.size().z, minimumSize_);
            const float h = 0.5f * minimumSize_;
            fp = Footprint{ fp.center, { h, h, h } };
        }
        spdlog::debug("FootprintCache: '{}' center=({:.3f}, {:.3f}, {:.3f}) size=({:.3f}, {:.3f}, {:.3f})",
                      ref, fp.center.x, fp.center.y, fp.center.z, fp.size().x, fp.size().y, fp.size().z);
        est = fp;
    } catch (const std::exception& e) {
        spdlog::warn("FootprintCache: estimate for '{}' failed: {}", ref, e.what());
    }

    items_.emplace(ref, est);
    return est;
}

std::optional<Footprint> FootprintCache::category(const Category& cat)
{
    if (auto it = categories_.find(cat.id); it != categories_.end())
        return it->second;

    std::optional<Footprint> rep;
    for (const ItemRef& ref : cat.items) {
        const auto est = item(ref);
        if (!est)
            continue;
        if (!rep) {
            rep = Footprint{ Vec3{}, est->extents };
            continue;
        }
        rep->extents.x = std::max(rep->extents.x, est->extents.x);
        rep->extents.y = std::max(rep->extents.y, est->extents.y);
        rep->extents.z = std::max(rep->extents.z, est->extents.z);
    }

    categories_.emplace(cat.id, rep);
    return rep;
}

Footprint FootprintCache::padded(const Footprint& estimate, float safetyFactor)
{
    const float f = std::max(safetyFactor, 1.0f);
    return { estimate.center, { estimate.extents.x * f, estimate.extents.y, estimate.extents.z * f } };
}

void FootprintCache::clear() noexcept
{
    items_.clear();
    categories_.clear();
}

} // namespace roomscatter::placement
