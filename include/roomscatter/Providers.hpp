// include/roomscatter/Providers.hpp
#pragma once
// -----------------------------------------------------------------------------
// Providers.hpp - seams between the placement core and the host scene.
// -----------------------------------------------------------------------------
// The placement core never touches scene objects directly. A host (game engine,
// editor, the bundled SimulatedScene) implements these interfaces:
//
//   IRegionProvider        room bounds, announced through evt::RegionReady
//   IGeometryProvider      estimated and exact axis-aligned footprints
//   IInstantiationService  create / move / destroy live instances
//   IDebugDraw             optional box drawing when debug bounds are enabled
//
// Calls are synchronous and are never reordered by the core. Any method may
// throw a std::exception; the core treats that as a failed attempt.
// -----------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <string>

#include "roomscatter/Math.hpp"
#include "roomscatter/Region.hpp"

namespace roomscatter {

// Name of a placeable template (prefab, model id, ...). Resolved by the host.
using ItemRef = std::string;

enum class InstanceHandle : std::uint32_t {};
inline constexpr InstanceHandle kNoInstance = static_cast<InstanceHandle>(0xFFFFFFFFu);

class IRegionProvider {
public:
    virtual ~IRegionProvider() = default;

    // Current room bounds, or nullopt when no room has been discovered yet.
    [[nodiscard]] virtual std::optional<Region> regionBounds() const = 0;
};

class IGeometryProvider {
public:
    virtual ~IGeometryProvider() = default;

    // Cheap pre-placement bounds of a template at identity orientation, origin pivot.
    [[nodiscard]] virtual Footprint estimateFootprint(const ItemRef& item) = 0;

    // World-space bounds of a live instance.
    [[nodiscard]] virtual Footprint measureExactFootprint(InstanceHandle instance) = 0;
};

class IInstantiationService {
public:
    virtual ~IInstantiationService() = default;

    virtual InstanceHandle create(const ItemRef& item, Vec3 position, float yawDegrees,
                                  InstanceHandle parent) = 0;
    virtual void destroy(InstanceHandle instance) = 0;

    [[nodiscard]] virtual Vec3 position(InstanceHandle instance) const = 0;
    virtual void setPosition(InstanceHandle instance, Vec3 position) = 0;
};

enum class DebugColor { Region, Committed, RolledBack };

class IDebugDraw {
public:
    virtual ~IDebugDraw() = default;
    virtual void drawBox(const Footprint& box, DebugColor color) = 0;
};

} // namespace roomscatter
