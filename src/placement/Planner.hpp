// src/placement/Planner.hpp
#pragma once
#include <optional>

#include "roomscatter/Math.hpp"
#include "roomscatter/Region.hpp"
#include "placement/PlacementTypes.hpp"
#include "placement/Random.hpp"

namespace roomscatter::placement {

struct PlannerSettings {
    float averageRadius             = 0.5f;  // used when no estimate is available
    bool  measureRadiusFromEstimate = true;
    int   absoluteCap               = 100;
    int   perItemAttemptCap         = 20;
};

struct CategoryPlan {
    int theoreticalCapacity = 0;
    int adjustedMax         = 0;
    int target              = 0;
    int attemptBudget       = 0;  // hard ceiling on item attempts
    int earlyStopAt         = 0;  // attempts after which a short category gives up
};

// Turns a category's [min,max] into a concrete target for one region.
// Capacity always wins over the configured minimum.
class Planner {
public:
    explicit Planner(PlannerSettings settings) : settings_(settings) {}

    // Floor area one item is assumed to claim, clearance included.
    [[nodiscard]] double footprintArea(const Category& category,
                                       const std::optional<Footprint>& estimate) const;

    [[nodiscard]] int theoreticalCapacity(const Region& region, double footprintArea) const;

    [[nodiscard]] CategoryPlan plan(const Region& region, const Category& category,
                                    const std::optional<Footprint>& estimate, Pcg32& rng) const;

    [[nodiscard]] const PlannerSettings& settings() const noexcept { return settings_; }

    [[nodiscard]] static int attemptBudget(int target, int perItemAttemptCap) noexcept;
    [[nodiscard]] static int earlyStopThreshold(int budget) noexcept;

private:
    PlannerSettings settings_;
};

} // namespace roomscatter::placement
