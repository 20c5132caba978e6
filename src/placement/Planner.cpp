// src/placement/Planner.cpp
#include "placement/Planner.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace roomscatter::placement {

double Planner::footprintArea(const Category& category,
                              const std::optional<Footprint>& estimate) const
{
    if (settings_.measureRadiusFromEstimate && estimate) {
        const Vec3 size = estimate->size();
        const double side = static_cast<double>(std::max(size.x, size.z))
                          + static_cast<double>(std::max(category.clearance, 0.0f));
        if (side > 0.0)
            return side * side;
    }
    const double diameter = 2.0 * static_cast<double>(settings_.averageRadius);
    return diameter * diameter;
}

int Planner::theoreticalCapacity(const Region& region, double footprintArea) const
{
    const double floorArea = static_cast<double>(region.width()) * static_cast<double>(region.depth());
    if (!(floorArea > 0.0) || !(footprintArea > 0.0))
        return 0;

    const double fit = std::floor(floorArea / footprintArea);
    constexpr double kIntMax = static_cast<double>(std::numeric_limits<int>::max());
    return static_cast<int>(std::min(fit, kIntMax));
}

CategoryPlan Planner::plan(const Region& region, const Category& category,
                           const std::optional<Footprint>& estimate, Pcg32& rng) const
{
    CategoryPlan p;
    p.theoreticalCapacity = theoreticalCapacity(region, footprintArea(category, estimate));
    p.adjustedMax = std::max(0, std::min({ category.maxCount, p.theoreticalCapacity, settings_.absoluteCap }));

    const int lo = std::min(std::max(category.minCount, 0), p.adjustedMax);
    p.target = randi(rng, lo, p.adjustedMax);

    p.attemptBudget = attemptBudget(p.target, settings_.perItemAttemptCap);
    p.earlyStopAt   = earlyStopThreshold(p.attemptBudget);
    return p;
}

int Planner::attemptBudget(int target, int perItemAttemptCap) noexcept
{
    if (target <= 0 || perItemAttemptCap <= 0)
        return 0;
    const long long b = 2LL * target * perItemAttemptCap;
    return static_cast<int>(std::min<long long>(b, std::numeric_limits<int>::max()));
}

int Planner::earlyStopThreshold(int budget) noexcept
{
    if (budget <= 0)
        return 0;
    // ceil(0.8 * budget) in integers
    return static_cast<int>((4LL * budget + 4) / 5);
}

} // namespace roomscatter::placement
