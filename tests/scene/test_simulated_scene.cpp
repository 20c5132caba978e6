// tests/scene/test_simulated_scene.cpp
#include <doctest/doctest.h>

#include "scene/RoomEvents.hpp"
#include "scene/SimulatedScene.hpp"

#include <stdexcept>

using namespace roomscatter;

namespace {

struct ReadyListener {
    int calls = 0;
    void on(const evt::RegionReady&) { ++calls; }
};

} // namespace

TEST_CASE("SimulatedScene: estimates come from templates")
{
    scene::SimulatedScene s;
    s.addTemplate("table", { 2.0f, 1.0f, 1.0f }, { 0.0f, 0.5f, 0.0f });
    CHECK(s.hasTemplate("table"));
    CHECK_FALSE(s.hasTemplate("sofa"));

    const Footprint f = s.estimateFootprint("table");
    CHECK(f.center == Vec3{ 0.0f, 0.5f, 0.0f });
    CHECK(f.extents == Vec3{ 1.0f, 0.5f, 0.5f });

    CHECK_THROWS_AS((void)s.estimateFootprint("sofa"), std::out_of_range);
    CHECK_THROWS_AS(s.create("sofa", {}, 0.0f, kNoInstance), std::out_of_range);
}

TEST_CASE("SimulatedScene: exact bounds follow position, yaw and exact scale")
{
    scene::SimulatedScene s;
    s.addTemplate("table", { 2.0f, 1.0f, 1.0f }, { 0.0f, 0.5f, 0.0f });
    s.addTemplate("grown", { 1.0f, 1.0f, 1.0f }, { 0.0f, 0.5f, 0.0f }, 2.0f);

    const InstanceHandle t = s.create("table", { 3.0f, 1.0f, 4.0f }, 90.0f, kNoInstance);
    const Footprint ft = s.measureExactFootprint(t);
    CHECK(ft.center.x == doctest::Approx(3.0f));
    CHECK(ft.center.y == doctest::Approx(1.5f));
    CHECK(ft.center.z == doctest::Approx(4.0f));
    CHECK(ft.extents.x == doctest::Approx(0.5f).epsilon(1e-4));
    CHECK(ft.extents.z == doctest::Approx(1.0f).epsilon(1e-4));

    const InstanceHandle g = s.create("grown", {}, 0.0f, kNoInstance);
    CHECK(s.measureExactFootprint(g).size().x == doctest::Approx(2.0f));

    s.setPosition(t, { 0.0f, 0.0f, 0.0f });
    CHECK(s.position(t) == Vec3{});
    CHECK(s.measureExactFootprint(t).min().y == doctest::Approx(0.0f));
}

TEST_CASE("SimulatedScene: destroyed handles are rejected")
{
    scene::SimulatedScene s;
    s.addTemplate("crate", { 1, 1, 1 });

    const InstanceHandle h = s.create("crate", {}, 0.0f, kNoInstance);
    CHECK(s.alive(h));
    CHECK(s.liveCount() == 1);

    s.destroy(h);
    CHECK_FALSE(s.alive(h));
    CHECK(s.liveCount() == 0);
    CHECK_THROWS_AS(s.destroy(h), std::out_of_range);
    CHECK_THROWS_AS((void)s.position(h), std::out_of_range);
    CHECK_THROWS_AS((void)s.measureExactFootprint(kNoInstance), std::out_of_range);

    // A recycled slot gets a fresh handle.
    const InstanceHandle h2 = s.create("crate", {}, 0.0f, kNoInstance);
    CHECK(h2 != h);
    CHECK_FALSE(s.alive(h));
    CHECK(s.created() == 2);
    CHECK(s.destroyed() == 1);
}

TEST_CASE("SimulatedScene: instances are registry entities with transform and shape")
{
    scene::SimulatedScene s;
    s.addTemplate("crate", { 1, 1, 1 });
    const InstanceHandle parent = s.create("crate", {}, 0.0f, kNoInstance);
    (void)s.create("crate", { 1, 0, 1 }, 45.0f, parent);

    int n = 0;
    s.registry().view<scene::Transform, scene::Shape>().each(
        [&](const scene::Transform& tf, const scene::Shape& shape) {
            CHECK(shape.item == "crate");
            if (tf.yawDegrees == 45.0f)
                CHECK(tf.parent == parent);
            ++n;
        });
    CHECK(n == 2);
}

TEST_CASE("SimulatedScene: setting a region announces it")
{
    scene::SimulatedScene s;
    ReadyListener listener;
    s.dispatcher().sink<evt::RegionReady>().connect<&ReadyListener::on>(listener);

    CHECK_FALSE(s.regionBounds().has_value());
    s.setRegion(*Region::make({ 0, 0, 0 }, { 3, 2, 3 }, 0.0f));
    CHECK(listener.calls == 1);
    REQUIRE(s.regionBounds().has_value());
    CHECK(s.regionBounds()->width() == doctest::Approx(3.0f));

    s.clearRegion();
    CHECK_FALSE(s.regionBounds().has_value());
    CHECK(listener.calls == 1);

    s.dispatcher().sink<evt::RegionReady>().disconnect<&ReadyListener::on>(listener);
}

TEST_CASE("SimulatedScene: create hook runs before the instance exists")
{
    scene::SimulatedScene s;
    s.addTemplate("crate", { 1, 1, 1 });
    std::size_t liveAtHook = 99;
    s.setCreateHook([&](const ItemRef&) { liveAtHook = s.liveCount(); });

    (void)s.create("crate", {}, 0.0f, kNoInstance);
    CHECK(liveAtHook == 0);

    s.setCreateHook([](const ItemRef&) { throw std::runtime_error("boom"); });
    CHECK_THROWS_AS(s.create("crate", {}, 0.0f, kNoInstance), std::runtime_error);
    CHECK(s.liveCount() == 1);
}
