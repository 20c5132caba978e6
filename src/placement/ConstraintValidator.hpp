// src/placement/ConstraintValidator.hpp
#pragma once
#include <cstdint>

#include "roomscatter/Math.hpp"
#include "roomscatter/Region.hpp"
#include "placement/Ledger.hpp"

namespace roomscatter::placement {

enum class Rejection : std::uint8_t {
    None,
    OutsideRegion,     // pokes through the raw room bounds
    OutsideClearance,  // inside the room but within `clearance` of a wall
    TooClose,          // center distance below the radius rule
    Overlapping,       // clearance-inflated boxes intersect
    NotGrounded        // lowest point is off the floor plane
};

[[nodiscard]] const char* rejection_name(Rejection r) noexcept;

struct Verdict {
    Rejection     reason     = Rejection::None;
    std::uint64_t conflictId = 0;     // ledger id of the offending neighbour, if any
    float         distance   = 0.0f;
    float         required   = 0.0f;

    [[nodiscard]] bool ok() const noexcept { return reason == Rejection::None; }
};

// Horizontal boundary and neighbour checks. Y is never constrained here.
class ConstraintValidator {
public:
    // Box inside the region shrunk by `inset` on X and Z.
    [[nodiscard]] static bool withinRegion(const Footprint& box, const Region& region, float inset);

    // Radius rule: half the larger side of each box plus the clearance.
    [[nodiscard]] static float requiredSeparation(const Footprint& a, const Footprint& b, float clearance);

    [[nodiscard]] Verdict checkBoundary(const Footprint& box, const Region& region, float clearance) const;
    [[nodiscard]] Verdict checkSeparation(const Footprint& box, const Ledger& ledger, float clearance) const;
    [[nodiscard]] Verdict checkOverlap(const Footprint& box, const Ledger& ledger, float clearance) const;
    [[nodiscard]] Verdict checkGrounded(const Footprint& box, const Region& region, float tolerance) const;

    // Cheap gate before instantiation: boundary + radius rule.
    [[nodiscard]] Verdict validateEstimate(const Footprint& box, const Region& region,
                                           const Ledger& ledger, float clearance) const;

    // Authoritative gate on measured geometry: boundary + radius rule + box overlap.
    [[nodiscard]] Verdict validateExact(const Footprint& box, const Region& region,
                                        const Ledger& ledger, float clearance) const;
};

} // namespace roomscatter::placement
