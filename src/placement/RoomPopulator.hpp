// src/placement/RoomPopulator.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <entt/entt.hpp>

#include "roomscatter/Providers.hpp"
#include "roomscatter/Region.hpp"
#include "config/PlacementConfig.hpp"
#include "placement/FootprintCache.hpp"
#include "placement/Ledger.hpp"
#include "placement/PlacementExecutor.hpp"
#include "placement/PlacementTypes.hpp"
#include "placement/Planner.hpp"
#include "scene/RoomEvents.hpp"

namespace roomscatter::placement {

// Owns the ledger for one room session and drives planning + placement when
// the room becomes available. Single-threaded; re-entrant calls made from a
// provider callback supersede the run in flight instead of nesting inside it.
class RoomPopulator {
public:
    // Regenerates requested from inside a run are replayed at most this many
    // times per outer call; past that the superseded report is returned.
    static constexpr int kMaxDeferredReruns = 8;

    RoomPopulator(config::PlacementConfig cfg,
                  IRegionProvider& regions,
                  IGeometryProvider& geometry,
                  IInstantiationService& instances);
    ~RoomPopulator();

    RoomPopulator(const RoomPopulator&) = delete;
    RoomPopulator& operator=(const RoomPopulator&) = delete;

    // Subscribe to evt::RegionReady / evt::ResetRequested.
    void attach(entt::dispatcher& dispatcher);
    void detach();

    void onRegionReady(const evt::RegionReady&);
    void onResetRequested(const evt::ResetRequested&);

    // Re-read the region from the provider, clear and populate.
    // nullopt when no valid region is available or the call was deferred.
    std::optional<RunReport> populate();

    // Destroy every placed item, then plan again on the last known region.
    std::optional<RunReport> resetAndRegenerate();

    // Destroy every placed item. Returns how many were released.
    std::size_t reset();

    void setDebugDraw(IDebugDraw* sink) noexcept { debug_ = sink; }

    [[nodiscard]] const Ledger& ledger() const noexcept { return ledger_; }
    [[nodiscard]] const std::optional<Region>& region() const noexcept { return region_; }
    [[nodiscard]] const RunReport& lastReport() const noexcept { return lastReport_; }
    [[nodiscard]] std::uint64_t generation() const noexcept { return generation_; }
    [[nodiscard]] bool running() const noexcept { return running_; }
    [[nodiscard]] const config::PlacementConfig& config() const noexcept { return cfg_; }

private:
    std::optional<RunReport> regenerate_();
    RunReport run_(Region region);

    config::PlacementConfig cfg_;
    IRegionProvider&        regions_;
    IInstantiationService&  instances_;
    FootprintCache          cache_;
    Planner                 planner_;
    PlacementExecutor       executor_;
    Ledger                  ledger_;

    std::optional<Region> region_;
    RunReport             lastReport_;
    std::uint64_t         generation_   = 0;
    bool                  running_      = false;
    bool                  rerunPending_ = false;

    entt::dispatcher* dispatcher_ = nullptr;
    IDebugDraw*       debug_      = nullptr;
};

} // namespace roomscatter::placement
