// tests/placement/test_constraint_validator.cpp
#include <doctest/doctest.h>

#include "placement/ConstraintValidator.hpp"

#include <initializer_list>

using namespace roomscatter;
using namespace roomscatter::placement;

namespace {

const Region kRoom = *Region::make({ 0, 0, 0 }, { 4, 3, 4 }, 0.0f);

Footprint unit_at(float x, float z, float y = 0.5f)
{
    return { { x, y, z }, { 0.5f, 0.5f, 0.5f } };
}

Ledger ledger_with(std::initializer_list<Footprint> boxes)
{
    Ledger l;
    for (const Footprint& b : boxes) {
        PlacedItem p;
        p.item = "crate";
        p.exactFootprint = b;
        p.position = b.center;
        (void)l.append(p);
    }
    return l;
}

} // namespace

TEST_CASE("ConstraintValidator: boundary distinguishes walls from clearance")
{
    const ConstraintValidator v;

    CHECK(v.checkBoundary(unit_at(2.0f, 2.0f), kRoom, 0.2f).ok());
    CHECK(v.checkBoundary(unit_at(0.6f, 2.0f), kRoom, 0.2f).reason == Rejection::OutsideClearance);
    CHECK(v.checkBoundary(unit_at(0.4f, 2.0f), kRoom, 0.2f).reason == Rejection::OutsideRegion);
    CHECK(v.checkBoundary(unit_at(2.0f, 3.9f), kRoom, 0.0f).reason == Rejection::OutsideRegion);

    // Flush against the wall is inside when there is no clearance.
    CHECK(v.checkBoundary(unit_at(0.5f, 0.5f), kRoom, 0.0f).ok());
}

TEST_CASE("ConstraintValidator: height is never constrained by the boundary check")
{
    const ConstraintValidator v;
    CHECK(v.checkBoundary(unit_at(2.0f, 2.0f, 50.0f), kRoom, 0.2f).ok());
    CHECK(v.checkBoundary(unit_at(2.0f, 2.0f, -50.0f), kRoom, 0.2f).ok());
}

TEST_CASE("ConstraintValidator: radius rule uses half the larger side plus clearance")
{
    const ConstraintValidator v;
    const Ledger l = ledger_with({ unit_at(1.0f, 1.0f) });

    CHECK(ConstraintValidator::requiredSeparation(unit_at(0, 0), unit_at(0, 0), 0.2f) == doctest::Approx(1.2f));

    const Verdict close = v.checkSeparation(unit_at(2.1f, 1.0f), l, 0.2f);
    CHECK(close.reason == Rejection::TooClose);
    CHECK(close.conflictId == 1);
    CHECK(close.distance == doctest::Approx(1.1f));
    CHECK(close.required == doctest::Approx(1.2f));

    CHECK(v.checkSeparation(unit_at(2.25f, 1.0f), l, 0.2f).ok());
    // Diagonal neighbours are measured center to center.
    CHECK(v.checkSeparation(unit_at(1.9f, 1.9f), l, 0.2f).ok());
}

TEST_CASE("ConstraintValidator: overlap check inflates neighbours by the clearance")
{
    const ConstraintValidator v;
    const Ledger l = ledger_with({ unit_at(1.0f, 1.0f) });

    CHECK(v.checkOverlap(unit_at(2.1f, 1.0f), l, 0.0f).ok());
    const Verdict hit = v.checkOverlap(unit_at(2.1f, 1.0f), l, 0.2f);
    CHECK(hit.reason == Rejection::Overlapping);
    CHECK(hit.conflictId == 1);

    // Boxes stacked above each other still collide on Y.
    CHECK(v.checkOverlap(unit_at(1.0f, 1.0f, 0.9f), l, 0.0f).reason == Rejection::Overlapping);
    CHECK(v.checkOverlap(unit_at(1.0f, 1.0f, 2.0f), l, 0.0f).ok());
}

TEST_CASE("ConstraintValidator: exact validation adds the overlap test to the estimate checks")
{
    const ConstraintValidator v;
    const Ledger empty;
    CHECK(v.validateEstimate(unit_at(2, 2), kRoom, empty, 0.2f).ok());
    CHECK(v.validateExact(unit_at(2, 2), kRoom, empty, 0.2f).ok());

    // Diagonal neighbour: far enough for the radius rule, corners still overlap.
    const Ledger l = ledger_with({ unit_at(1.0f, 1.0f) });
    const Footprint diagonal = unit_at(1.95f, 1.95f);
    CHECK(v.checkSeparation(diagonal, l, 0.0f).ok());
    CHECK(v.validateEstimate(diagonal, kRoom, l, 0.0f).ok());
    CHECK(v.validateExact(diagonal, kRoom, l, 0.0f).reason == Rejection::Overlapping);
}

TEST_CASE("ConstraintValidator: grounded check tolerates tiny float drift only")
{
    const ConstraintValidator v;
    CHECK(v.checkGrounded(unit_at(2, 2, 0.5f), kRoom, 1e-4f).ok());
    CHECK(v.checkGrounded(unit_at(2, 2, 0.50005f), kRoom, 1e-4f).ok());
    CHECK(v.checkGrounded(unit_at(2, 2, 0.6f), kRoom, 1e-4f).reason == Rejection::NotGrounded);
    CHECK(v.checkGrounded(unit_at(2, 2, 0.4f), kRoom, 1e-4f).reason == Rejection::NotGrounded);
}
