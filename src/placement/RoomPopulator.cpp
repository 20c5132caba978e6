// src/placement/RoomPopulator.cpp
#include "placement/RoomPopulator.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

#ifdef TRACY_ENABLE
  #include <tracy/Tracy.hpp>
#endif

#include "placement/Random.hpp"

namespace roomscatter::placement {

RoomPopulator::RoomPopulator(config::PlacementConfig cfg,
                             IRegionProvider& regions,
                             IGeometryProvider& geometry,
                             IInstantiationService& instances)
    : cfg_(std::move(cfg))
    , regions_(regions)
    , instances_(instances)
    , cache_(geometry, cfg_.minimumEstimateSize)
    , planner_(cfg_.plannerSettings())
    , executor_(geometry, instances, cache_, cfg_.samplingSettings(), cfg_.executorSettings())
{
}

RoomPopulator::~RoomPopulator()
{
    detach();
}

void RoomPopulator::attach(entt::dispatcher& dispatcher)
{
    detach();
    dispatcher.sink<evt::RegionReady>().connect<&RoomPopulator::onRegionReady>(*this);
    dispatcher.sink<evt::ResetRequested>().connect<&RoomPopulator::onResetRequested>(*this);
    dispatcher_ = &dispatcher;
}

void RoomPopulator::detach()
{
    if (!dispatcher_)
        return;
    dispatcher_->sink<evt::RegionReady>().disconnect<&RoomPopulator::onRegionReady>(*this);
    dispatcher_->sink<evt::ResetRequested>().disconnect<&RoomPopulator::onResetRequested>(*this);
    dispatcher_ = nullptr;
}

void RoomPopulator::onRegionReady(const evt::RegionReady&)
{
    (void)populate();
}

void RoomPopulator::onResetRequested(const evt::ResetRequested&)
{
    (void)resetAndRegenerate();
}

std::optional<RunReport> RoomPopulator::populate()
{
    std::optional<Region> r;
    try {
        r = regions_.regionBounds();
    } catch (const std::exception& e) {
        spdlog::error("Region provider failed: {}", e.what());
    }

    if (!r || !r->valid()) {
        spdlog::error("Room is unavailable or degenerate. Cannot spawn items.");
        return std::nullopt;
    }

    if (region_ && (region_->min != r->min || region_->max != r->max || region_->floorY != r->floorY)) {
        spdlog::debug("Room changed; dropping cached footprint estimates");
        cache_.clear();
    }
    region_ = *r;
    spdlog::info("Room bounds: ({:.3f}, {:.3f}, {:.3f}) to ({:.3f}, {:.3f}, {:.3f}), floor {:.3f}",
                 r->min.x, r->min.y, r->min.z, r->max.x, r->max.y, r->max.z, r->floorY);
    return regenerate_();
}

std::optional<RunReport> RoomPopulator::resetAndRegenerate()
{
    spdlog::info("Resetting and regenerating items");
    if (!region_) {
        (void)reset();
        spdlog::warn("Cannot spawn items - no room available yet");
        return std::nullopt;
    }
    return regenerate_();
}

std::size_t RoomPopulator::reset()
{
    // Bumping the generation first makes any attempt still in flight see itself
    // as superseded before the ledger is torn down.
    ++generation_;
    const std::size_t n = ledger_.drain(instances_);
    if (n > 0)
        spdlog::info("Reset: destroyed {} items", n);
    return n;
}

std::optional<RunReport> RoomPopulator::regenerate_()
{
    if (running_) {
        // Called from inside a provider callback; let the outer run unwind first.
        ++generation_;
        rerunPending_ = true;
        spdlog::debug("Regenerate requested during a run; deferring");
        return std::nullopt;
    }

    RunReport rep;
    int reruns = 0;
    do {
        rerunPending_ = false;
        (void)reset();
        rep = run_(*region_);
    } while (rerunPending_ && region_ && ++reruns <= kMaxDeferredReruns);

    if (rerunPending_) {
        spdlog::warn("Regenerate requested on every run; giving up after {} reruns", kMaxDeferredReruns);
        rerunPending_ = false;
        rep.superseded = true;
    }

    lastReport_ = rep;
    return rep;
}

RunReport RoomPopulator::run_(Region region)
{
#ifdef TRACY_ENABLE
    ZoneScopedN("RoomPopulator::run");
#endif

    struct RunningGuard {
        bool& flag;
        explicit RunningGuard(bool& f) : flag(f) { flag = true; }
        ~RunningGuard() { flag = false; }
    } guard(running_);

    RunReport report;
    report.generation = generation_;

    if (cfg_.debugDraw)
        draw_debug_box(debug_, region.bounds(), DebugColor::Region);

    for (std::size_t idx = 0; idx < cfg_.categories.size(); ++idx) {
        const Category& cat = cfg_.categories[idx];

        if (cat.items.empty()) {
            spdlog::warn("Category '{}' has no items. Skipping.", cat.id);
            CategoryReport skipped;
            skipped.categoryId = cat.id;
            skipped.skipped = true;
            report.categories.push_back(std::move(skipped));
            continue;
        }

        Pcg32 rng = sub_rng(category_rng(cfg_.seed, report.generation, cat.id), idx);

        const CategoryPlan plan = planner_.plan(region, cat, cache_.category(cat), rng);
        spdlog::info("Attempting to spawn {} '{}' items (adjusted from max {} to {}) with clearance {:.3f}",
                     plan.target, cat.id, cat.maxCount, plan.adjustedMax, cat.clearance);

        RunContext ctx{ region, ledger_, rng, report.generation, &generation_,
                        cfg_.debugDraw ? debug_ : nullptr };
        CategoryReport rep = executor_.placeCategory(cat, plan, ctx);
        report.totalSpawned += rep.spawned;
        const bool superseded = rep.superseded;
        report.categories.push_back(std::move(rep));

        if (superseded || generation_ != report.generation) {
            report.superseded = true;
            break;
        }
    }

    spdlog::info("Run {}: {} items placed across {} categories{}", report.generation,
                 report.totalSpawned, report.categories.size(), report.superseded ? " (superseded)" : "");
    return report;
}

} // namespace roomscatter::placement
