// src/scene/SimulatedScene.hpp
#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <entt/entt.hpp>

#include "roomscatter/Providers.hpp"
#include "config/PlacementConfig.hpp"

namespace roomscatter::scene {

// ECS components for instances created by SimulatedScene.
struct Transform {
    Vec3           position{};
    float          yawDegrees = 0.0f;
    InstanceHandle parent     = kNoInstance;
};

struct Shape {
    ItemRef   item;
    Footprint local{};          // bounds relative to the pivot at identity yaw
    float     exactScale = 1.0f;
};

// In-memory host backed by an entt::registry. Serves as the provider for the
// CLI and the tests; a game engine would implement the same three interfaces
// over its own scene graph.
class SimulatedScene final : public IRegionProvider,
                             public IGeometryProvider,
                             public IInstantiationService {
public:
    using CreateHook = std::function<void(const ItemRef&)>;

    SimulatedScene() = default;
    explicit SimulatedScene(const std::vector<config::TemplateConfig>& templates);

    // Templates
    void addTemplate(const ItemRef& name, Vec3 size, Vec3 pivot = {}, float exactScale = 1.0f);
    [[nodiscard]] bool hasTemplate(const ItemRef& name) const;

    // Room. setRegion broadcasts evt::RegionReady.
    void setRegion(const Region& region);
    void clearRegion();

    // Runs before every create(); may throw or call back into the populator.
    void setCreateHook(CreateHook hook) { createHook_ = std::move(hook); }

    // IRegionProvider
    [[nodiscard]] std::optional<Region> regionBounds() const override { return region_; }

    // IGeometryProvider
    [[nodiscard]] Footprint estimateFootprint(const ItemRef& item) override;
    [[nodiscard]] Footprint measureExactFootprint(InstanceHandle instance) override;

    // IInstantiationService
    InstanceHandle create(const ItemRef& item, Vec3 position, float yawDegrees,
                          InstanceHandle parent) override;
    void destroy(InstanceHandle instance) override;
    [[nodiscard]] Vec3 position(InstanceHandle instance) const override;
    void setPosition(InstanceHandle instance, Vec3 position) override;

    [[nodiscard]] bool alive(InstanceHandle instance) const;

    entt::registry&   registry()   noexcept { return reg_; }
    entt::dispatcher& dispatcher() noexcept { return disp_; }

    [[nodiscard]] std::size_t created()   const noexcept { return created_; }
    [[nodiscard]] std::size_t destroyed() const noexcept { return destroyed_; }
    [[nodiscard]] std::size_t liveCount() const;
    [[nodiscard]] std::size_t estimateQueries() const noexcept { return estimateQueries_; }

private:
    struct Template {
        Footprint local{};
        float     exactScale = 1.0f;
    };

    [[nodiscard]] entt::entity resolve(InstanceHandle instance) const;
    [[nodiscard]] const Template& lookup(const ItemRef& item) const;

    entt::registry   reg_;
    entt::dispatcher disp_;

    std::unordered_map<ItemRef, Template> templates_;
    std::optional<Region>                 region_;
    CreateHook                            createHook_;

    std::size_t created_         = 0;
    std::size_t destroyed_       = 0;
    std::size_t estimateQueries_ = 0;
};

} // namespace roomscatter::scene
