// tests/placement/test_region_math.cpp
#include <doctest/doctest.h>

#include "roomscatter/Math.hpp"
#include "roomscatter/Region.hpp"
#include "placement/Random.hpp"

using namespace roomscatter;

TEST_CASE("Region: make rejects empty or inverted floor spans")
{
    CHECK_FALSE(Region::make({ 0, 0, 0 }, { 0, 1, 4 }, 0.0f).has_value());
    CHECK_FALSE(Region::make({ 0, 0, 0 }, { 4, 1, 0 }, 0.0f).has_value());
    CHECK_FALSE(Region::make({ 2, 0, 0 }, { 1, 1, 4 }, 0.0f).has_value());

    // A flat room (zero height) is still a valid floor.
    const auto r = Region::make({ 0, 0, 0 }, { 4, 0, 4 }, 0.0f);
    REQUIRE(r.has_value());
    CHECK(r->floor_area() == doctest::Approx(16.0));
    CHECK(r->floor_center() == Vec3{ 2.0f, 0.0f, 2.0f });
}

TEST_CASE("Region: from_bounds puts the floor at the bottom")
{
    const auto r = Region::from_bounds({ -1, 2, -3 }, { 1, 5, 3 });
    REQUIRE(r.has_value());
    CHECK(r->floorY == doctest::Approx(2.0f));
    CHECK(r->width() == doctest::Approx(2.0f));
    CHECK(r->depth() == doctest::Approx(6.0f));
}

TEST_CASE("Footprint: touching faces count as intersecting")
{
    const Footprint a = Footprint::from_min_max({ 0, 0, 0 }, { 1, 1, 1 });
    const Footprint b = Footprint::from_min_max({ 1, 0, 0 }, { 2, 1, 1 });
    const Footprint c = Footprint::from_min_max({ 1.01f, 0, 0 }, { 2, 1, 1 });

    CHECK(a.intersects(b));
    CHECK_FALSE(a.intersects(c));
    CHECK(a.inflated_xz(0.05f).intersects(c));
}

TEST_CASE("Footprint: planar radius uses the larger horizontal side")
{
    const Footprint f{ {}, { 0.3f, 2.0f, 0.7f } };
    CHECK(f.planar_radius() == doctest::Approx(0.7f));
    CHECK_FALSE(f.has_zero_axis());
    CHECK(Footprint{ {}, { 0.3f, 0.0f, 0.7f } }.has_zero_axis());
}

TEST_CASE("rotate_about_y: quarter turn swaps X and Z extents and orbits the offset")
{
    const Footprint local{ { 1.0f, 0.5f, 0.0f }, { 2.0f, 0.5f, 0.5f } };
    const Footprint w = rotate_about_y(local, 90.0f, { 10.0f, 0.0f, 10.0f });

    CHECK(w.extents.x == doctest::Approx(0.5f).epsilon(1e-4));
    CHECK(w.extents.z == doctest::Approx(2.0f).epsilon(1e-4));
    CHECK(w.center.x == doctest::Approx(10.0f).epsilon(1e-4));
    CHECK(w.center.y == doctest::Approx(0.5f));
    CHECK(w.center.z == doctest::Approx(9.0f).epsilon(1e-4));
}

TEST_CASE("Random: category streams are stable and independent")
{
    using namespace roomscatter::placement;

    Pcg32 a = category_rng(7, 1, "chairs");
    Pcg32 b = category_rng(7, 1, "chairs");
    Pcg32 c = category_rng(7, 1, "tables");
    Pcg32 d = category_rng(7, 2, "chairs");

    const auto first = a.next();
    CHECK(first == b.next());
    CHECK(first != c.next());
    CHECK(first != d.next());

    Pcg32 rng(99);
    for (int i = 0; i < 1000; ++i) {
        const int v = randi(rng, 3, 7);
        CHECK(v >= 3);
        CHECK(v <= 7);
        const float f = randf(rng, -1.0f, 1.0f);
        CHECK(f >= -1.0f);
        CHECK(f < 1.0f);
    }
    CHECK(randi(rng, 5, 5) == 5);
    CHECK(randf(rng, 2.0f, 2.0f) == 2.0f);
}
