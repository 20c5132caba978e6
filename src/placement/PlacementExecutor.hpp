// src/placement/PlacementExecutor.hpp
#pragma once
// -----------------------------------------------------------------------------
// PlacementExecutor - one category at a time, one item attempt at a time.
// -----------------------------------------------------------------------------
// Item attempt state machine:
//
//   SelectItem -> EstimateFootprint -> GenerateCandidate -> ValidateEstimate
//     -> Instantiate -> ValidateExact -> AlignToFloor -> ValidateExact -> Commit
//
// A failed estimate or exact check returns to GenerateCandidate with a new
// sample at the same tier. When a tier runs out of samples (random samples plus
// the room-center fallback) the attempt escalates Strict -> Relaxed -> Forced.
// Forced keeps a token clearance but never relaxes containment in the room.
// -----------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <vector>

#include "roomscatter/Providers.hpp"
#include "roomscatter/Region.hpp"
#include "placement/CandidateGenerator.hpp"
#include "placement/ConstraintValidator.hpp"
#include "placement/FootprintCache.hpp"
#include "placement/Ledger.hpp"
#include "placement/PlacementTypes.hpp"
#include "placement/Planner.hpp"
#include "placement/Random.hpp"

namespace roomscatter::placement {

struct ExecutorSettings {
    float          estimateSafetyFactor = 1.1f;
    float          forcedClearance      = 0.01f;
    float          floorTolerance       = 1e-4f;
    bool           randomYaw            = true;
    InstanceHandle parent               = kNoInstance;
};

// Everything one run threads through the executor. No per-attempt state is
// kept on the executor itself.
struct RunContext {
    const Region&        region;
    Ledger&              ledger;
    Pcg32&               rng;
    std::uint64_t        generation = 0;
    const std::uint64_t* liveGeneration = nullptr;  // owner's counter; a mismatch means superseded
    IDebugDraw*          debug = nullptr;

    [[nodiscard]] bool current() const noexcept {
        return liveGeneration == nullptr || *liveGeneration == generation;
    }
};

// Forward a box to an optional debug sink. Sink failures are logged, never propagated.
void draw_debug_box(IDebugDraw* sink, const Footprint& box, DebugColor color) noexcept;

struct AttemptResult {
    AttemptOutcome outcome   = AttemptOutcome::NoCandidate;
    RelaxationTier tier      = RelaxationTier::Strict;
    int            rollbacks = 0;
};

class PlacementExecutor {
public:
    PlacementExecutor(IGeometryProvider& geometry,
                      IInstantiationService& instances,
                      FootprintCache& cache,
                      SamplingSettings sampling,
                      ExecutorSettings settings);

    // Run the attempt loop for `category` until `plan.target` items are
    // committed or the attempt budget is spent.
    CategoryReport placeCategory(const Category& category, const CategoryPlan& plan, RunContext& ctx);

    // Templates of `category` that fit the region at the loosest tier.
    [[nodiscard]] std::vector<ItemRef> feasibleItems(const Category& category, const Region& region);

    // One item attempt over all tiers.
    AttemptResult attemptItem(const Category& category, const std::vector<ItemRef>& pool, RunContext& ctx);

    [[nodiscard]] const ExecutorSettings& settings() const noexcept { return settings_; }

private:
    AttemptOutcome instantiateAndCommit(const Category& category, const ItemRef& item, Vec3 position,
                                        RelaxationTier tier, float clearance, RunContext& ctx);

    void rollback(InstanceHandle handle, const ItemRef& item) noexcept;

    IGeometryProvider&     geometry_;
    IInstantiationService& instances_;
    FootprintCache&        cache_;
    CandidateGenerator     generator_;
    ConstraintValidator    validator_;
    ExecutorSettings       settings_;
};

} // namespace roomscatter::placement
