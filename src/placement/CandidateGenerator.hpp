// src/placement/CandidateGenerator.hpp
#pragma once
#include <optional>

#include "roomscatter/Math.hpp"
#include "roomscatter/Region.hpp"
#include "placement/Random.hpp"

namespace roomscatter::placement {

struct SamplingSettings {
    int   samplesPerTier       = 10;    // random samples before the center fallback
    float edgeInsetStep        = 0.2f;  // extra inset added per sample index
    float edgeInsetMaxFraction = 0.4f;  // cap on that inset, as a fraction of the half span
};

// Interval of pivot positions whose estimated box stays inside the inset region.
struct SampleWindow {
    float minX = 0.0f, maxX = 0.0f;
    float minZ = 0.0f, maxZ = 0.0f;

    [[nodiscard]] float spanX() const { return maxX - minX; }
    [[nodiscard]] float spanZ() const { return maxZ - minZ; }
};

enum class CandidateStatus { Ok, RegionTooSmall };

struct Candidate {
    CandidateStatus status = CandidateStatus::RegionTooSmall;
    Vec3 position{};
    bool centerFallback = false;

    [[nodiscard]] bool ok() const noexcept { return status == CandidateStatus::Ok; }
};

class CandidateGenerator {
public:
    explicit CandidateGenerator(SamplingSettings settings);

    // nullopt when the region is too small for `estimate` at this clearance.
    [[nodiscard]] static std::optional<SampleWindow> window(const Region& region,
                                                            const Footprint& estimate,
                                                            float effectiveClearance);

    // Number of calls to sample() per tier, center fallback included.
    [[nodiscard]] int samplesPerTierWithFallback() const noexcept { return settings_.samplesPerTier + 1; }

    // Sample `index` of a tier. Indices [0, samplesPerTier) are random;
    // index samplesPerTier is the region's horizontal center.
    [[nodiscard]] Candidate sample(const Region& region, const Footprint& estimate,
                                   float effectiveClearance, int index, Pcg32& rng) const;

    [[nodiscard]] const SamplingSettings& settings() const noexcept { return settings_; }

private:
    SamplingSettings settings_;
};

} // namespace roomscatter::placement
