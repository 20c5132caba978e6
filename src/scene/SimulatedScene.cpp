// src/scene/SimulatedScene.cpp
#include "scene/SimulatedScene.hpp"

#include <cstdint>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "scene/RoomEvents.hpp"

namespace roomscatter::scene {

namespace {

InstanceHandle to_handle(entt::entity e)
{
    return static_cast<InstanceHandle>(static_cast<std::uint32_t>(entt::to_integral(e)));
}

} // namespace

SimulatedScene::SimulatedScene(const std::vector<config::TemplateConfig>& templates)
{
    for (const auto& t : templates)
        addTemplate(t.name, t.size, t.pivot, t.exactScale);
}

void SimulatedScene::addTemplate(const ItemRef& name, Vec3 size, Vec3 pivot, float exactScale)
{
    Template t;
    t.local      = { pivot, size * 0.5f };
    t.exactScale = exactScale;
    templates_[name] = t;
}

bool SimulatedScene::hasTemplate(const ItemRef& name) const
{
    return templates_.find(name) != templates_.end();
}

void SimulatedScene::setRegion(const Region& region)
{
    region_ = region;
    disp_.trigger(evt::RegionReady{});
}

void SimulatedScene::clearRegion()
{
    region_.reset();
}

const SimulatedScene::Template& SimulatedScene::lookup(const ItemRef& item) const
{
    const auto it = templates_.find(item);
    if (it == templates_.end())
        throw std::out_of_range("unknown template '" + item + "'");
    return it->second;
}

entt::entity SimulatedScene::resolve(InstanceHandle instance) const
{
    const auto e = static_cast<entt::entity>(static_cast<std::uint32_t>(instance));
    if (instance == kNoInstance || !reg_.valid(e))
        throw std::out_of_range("stale instance handle " + std::to_string(static_cast<std::uint32_t>(instance)));
    return e;
}

Footprint SimulatedScene::estimateFootprint(const ItemRef& item)
{
    ++estimateQueries_;
    return lookup(item).local;
}

Footprint SimulatedScene::measureExactFootprint(InstanceHandle instance)
{
    const entt::entity e = resolve(instance);
    const auto& tf    = reg_.get<Transform>(e);
    const auto& shape = reg_.get<Shape>(e);

    Footprint local = shape.local;
    local.extents = local.extents * shape.exactScale;
    return rotate_about_y(local, tf.yawDegrees, tf.position);
}

InstanceHandle SimulatedScene::create(const ItemRef& item, Vec3 position, float yawDegrees,
                                      InstanceHandle parent)
{
    if (createHook_)
        createHook_(item);

    const Template& t = lookup(item);

    const entt::entity e = reg_.create();
    reg_.emplace<Transform>(e, Transform{ position, yawDegrees, parent });
    reg_.emplace<Shape>(e, Shape{ item, t.local, t.exactScale });
    ++created_;
    return to_handle(e);
}

void SimulatedScene::destroy(InstanceHandle instance)
{
    reg_.destroy(resolve(instance));
    ++destroyed_;
}

Vec3 SimulatedScene::position(InstanceHandle instance) const
{
    return reg_.get<Transform>(resolve(instance)).position;
}

void SimulatedScene::setPosition(InstanceHandle instance, Vec3 position)
{
    reg_.get<Transform>(resolve(instance)).position = position;
}

bool SimulatedScene::alive(InstanceHandle instance) const
{
    const auto e = static_cast<entt::entity>(static_cast<std::uint32_t>(instance));
    return instance != kNoInstance && reg_.valid(e);
}

std::size_t SimulatedScene::liveCount() const
{
    return created_ - destroyed_;
}

} // namespace roomscatter::scene
