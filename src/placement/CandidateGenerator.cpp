// src/placement/CandidateGenerator.cpp
#include "placement/CandidateGenerator.hpp"

#include <algorithm>

namespace roomscatter::placement {

CandidateGenerator::CandidateGenerator(SamplingSettings settings)
    : settings_(settings)
{
    settings_.samplesPerTier       = std::max(0, settings_.samplesPerTier);
    settings_.edgeInsetStep        = std::max(0.0f, settings_.edgeInsetStep);
    settings_.edgeInsetMaxFraction = std::clamp(settings_.edgeInsetMaxFraction, 0.0f, 0.95f);
}

std::optional<SampleWindow> CandidateGenerator::window(const Region& region,
                                                       const Footprint& estimate,
                                                       float effectiveClearance)
{
    // The estimate's center may sit off the pivot; shift the window so the box fits.
    const float cx = estimate.center.x;
    const float cz = estimate.center.z;

    SampleWindow w;
    w.minX = region.min.x + estimate.extents.x + effectiveClearance - cx;
    w.maxX = region.max.x - estimate.extents.x - effectiveClearance - cx;
    w.minZ = region.min.z + estimate.extents.z + effectiveClearance - cz;
    w.maxZ = region.max.z - estimate.extents.z - effectiveClearance - cz;

    if (w.minX >= w.maxX || w.minZ >= w.maxZ)
        return std::nullopt;
    return w;
}

Candidate CandidateGenerator::sample(const Region& region, const Footprint& estimate,
                                     float effectiveClearance, int index, Pcg32& rng) const
{
    Candidate c;
    const auto w = window(region, estimate, effectiveClearance);
    if (!w)
        return c;

    c.status = CandidateStatus::Ok;

    if (index >= settings_.samplesPerTier) {
        c.position = region.floor_center();
        c.centerFallback = true;
        return c;
    }

    const float halfSpan = 0.5f * std::min(w->spanX(), w->spanZ());
    const float inset = std::min(settings_.edgeInsetStep * static_cast<float>(index),
                                 settings_.edgeInsetMaxFraction * halfSpan);

    const float x = randf(rng, w->minX + inset, w->maxX - inset);
    const float z = randf(rng, w->minZ + inset, w->maxZ - inset);
    c.position = { x, region.floorY, z };
    return c;
}

} // namespace roomscatter::placement
