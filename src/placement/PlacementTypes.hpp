// src/placement/PlacementTypes.hpp
#pragma once
// Plain data shared by the placement modules. Keep this header light.

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "roomscatter/Math.hpp"
#include "roomscatter/Providers.hpp"

namespace roomscatter::placement {

// One weighted group of interchangeable templates.
struct Category {
    std::string          id;
    std::vector<ItemRef> items;        // empty => category is skipped
    int                  minCount  = 0;
    int                  maxCount  = 10;
    float                clearance = 0.2f;   // wall and neighbour margin (world units)
};

// Ordered from strictest to loosest.
enum class RelaxationTier : std::uint8_t { Strict = 0, Relaxed = 1, Forced = 2 };

inline constexpr std::array<RelaxationTier, 3> kAllTiers{
    RelaxationTier::Strict, RelaxationTier::Relaxed, RelaxationTier::Forced };

[[nodiscard]] inline constexpr const char* tier_name(RelaxationTier t) noexcept {
    switch (t) {
        case RelaxationTier::Strict:  return "strict";
        case RelaxationTier::Relaxed: return "relaxed";
        case RelaxationTier::Forced:  return "forced";
    }
    return "?";
}

[[nodiscard]] inline constexpr std::size_t tier_index(RelaxationTier t) noexcept {
    return static_cast<std::size_t>(t);
}

// Clearance actually enforced at a tier. Forced keeps only `forcedClearance`.
[[nodiscard]] inline constexpr float effective_clearance(RelaxationTier t, float clearance,
                                                         float forcedClearance) noexcept {
    switch (t) {
        case RelaxationTier::Strict:  return clearance;
        case RelaxationTier::Relaxed: return clearance * 0.5f;
        case RelaxationTier::Forced:  return forcedClearance;
    }
    return clearance;
}

struct PlacedItem {
    std::uint64_t   id = 0;
    std::string     categoryId;
    ItemRef         item;
    InstanceHandle  instance = kNoInstance;
    Vec3            position{};
    float           yawDegrees = 0.0f;
    Footprint       exactFootprint{};
    RelaxationTier  tier = RelaxationTier::Strict;
    float           clearance = 0.0f;  // effective clearance it was validated with
};

enum class AttemptOutcome : std::uint8_t {
    Committed,
    NoCandidate,          // every tier ran out of samples or space
    RolledBack,           // estimate passed, exact geometry failed
    InstantiationFailed,  // provider threw
    Superseded            // a reset started while this attempt was in flight
};

[[nodiscard]] inline constexpr const char* outcome_name(AttemptOutcome o) noexcept {
    switch (o) {
        case AttemptOutcome::Committed:           return "committed";
        case AttemptOutcome::NoCandidate:         return "no-candidate";
        case AttemptOutcome::RolledBack:          return "rolled-back";
        case AttemptOutcome::InstantiationFailed: return "instantiation-failed";
        case AttemptOutcome::Superseded:          return "superseded";
    }
    return "?";
}

struct CategoryReport {
    std::string categoryId;
    int  adjustedMax  = 0;
    int  target       = 0;
    int  spawned      = 0;
    int  attempts     = 0;
    int  budget       = 0;
    int  rollbacks    = 0;
    int  failures     = 0;    // instantiation failures
    bool skipped      = false; // no candidate items
    bool infeasible   = false; // region too small at every tier
    bool stoppedEarly = false; // hit the 80% budget guard
    bool superseded   = false;
    std::array<int, 3> tierCommits{};

    [[nodiscard]] bool complete() const noexcept { return spawned >= target; }
};

struct RunReport {
    std::uint64_t               generation = 0;
    std::vector<CategoryReport> categories;
    int                         totalSpawned = 0;
    bool                        superseded   = false;
};

} // namespace roomscatter::placement
