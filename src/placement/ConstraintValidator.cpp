// src/placement/ConstraintValidator.cpp
#include "placement/ConstraintValidator.hpp"

#include <cmath>

#include <spdlog/spdlog.h>

namespace roomscatter::placement {

const char* rejection_name(Rejection r) noexcept
{
    switch (r) {
        case Rejection::None:             return "none";
        case Rejection::OutsideRegion:    return "outside-region";
        case Rejection::OutsideClearance: return "outside-clearance";
        case Rejection::TooClose:         return "too-close";
        case Rejection::Overlapping:      return "overlapping";
        case Rejection::NotGrounded:      return "not-grounded";
    }
    return "?";
}

namespace {

void log_side_violations(const Footprint& box, const Region& region, float inset)
{
    if (!spdlog::should_log(spdlog::level::debug))
        return;

    const Vec3 lo = box.min();
    const Vec3 hi = box.max();
    if (lo.x < region.min.x + inset) spdlog::debug("  left side out by {:.4f}",  region.min.x + inset - lo.x);
    if (hi.x > region.max.x - inset) spdlog::debug("  right side out by {:.4f}", hi.x - (region.max.x - inset));
    if (lo.z < region.min.z + inset) spdlog::debug("  back side out by {:.4f}",  region.min.z + inset - lo.z);
    if (hi.z > region.max.z - inset) spdlog::debug("  front side out by {:.4f}", hi.z - (region.max.z - inset));
}

} // namespace

bool ConstraintValidator::withinRegion(const Footprint& box, const Region& region, float inset)
{
    const Vec3 lo = box.min();
    const Vec3 hi = box.max();
    return lo.x >= region.min.x + inset && hi.x <= region.max.x - inset &&
           lo.z >= region.min.z + inset && hi.z <= region.max.z - inset;
}

float ConstraintValidator::requiredSeparation(const Footprint& a, const Footprint& b, float clearance)
{
    return a.planar_radius() + b.planar_radius() + clearance;
}

Verdict ConstraintValidator::checkBoundary(const Footprint& box, const Region& region, float clearance) const
{
    Verdict v;
    if (!withinRegion(box, region, 0.0f)) {
        v.reason = Rejection::OutsideRegion;
        log_side_violations(box, region, 0.0f);
    } else if (!withinRegion(box, region, clearance)) {
        v.reason = Rejection::OutsideClearance;
        log_side_violations(box, region, clearance);
    }
    return v;
}

Verdict ConstraintValidator::checkSeparation(const Footprint& box, const Ledger& ledger, float clearance) const
{
    Verdict v;
    for (const PlacedItem& other : ledger) {
        const float d   = distance_xz(box.center, other.exactFootprint.center);
        const float req = requiredSeparation(box, other.exactFootprint, clearance);
        if (d < req) {
            v.reason     = Rejection::TooClose;
            v.conflictId = other.id;
            v.distance   = d;
            v.required   = req;
            return v;
        }
    }
    return v;
}

Verdict ConstraintValidator::checkOverlap(const Footprint& box, const Ledger& ledger, float clearance) const
{
    Verdict v;
    for (const PlacedItem& other : ledger) {
        if (other.exactFootprint.inflated_xz(clearance).intersects(box)) {
            v.reason     = Rejection::Overlapping;
            v.conflictId = other.id;
            v.distance   = distance_xz(box.center, other.exactFootprint.center);
            return v;
        }
    }
    return v;
}

Verdict ConstraintValidator::checkGrounded(const Footprint& box, const Region& region, float tolerance) const
{
    Verdict v;
    const float gap = box.min().y - region.floorY;
    if (std::abs(gap) > tolerance) {
        v.reason   = Rejection::NotGrounded;
        v.distance = gap;
        v.required = tolerance;
    }
    return v;
}

Verdict ConstraintValidator::validateEstimate(const Footprint& box, const Region& region,
                                              const Ledger& ledger, float clearance) const
{
    if (Verdict v = checkBoundary(box, region, clearance); !v.ok())
        return v;
    return checkSeparation(box, ledger, clearance);
}

Verdict ConstraintValidator::validateExact(const Footprint& box, const Region& region,
                                           const Ledger& ledger, float clearance) const
{
    if (Verdict v = checkBoundary(box, region, clearance); !v.ok())
        return v;
    if (Verdict v = checkSeparation(box, ledger, clearance); !v.ok())
        return v;
    return checkOverlap(box, ledger, clearance);
}

} // namespace roomscatter::placement
