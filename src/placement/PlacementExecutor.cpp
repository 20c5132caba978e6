// src/placement/PlacementExecutor.cpp
#include "placement/PlacementExecutor.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

#ifdef TRACY_ENABLE
  #include <tracy/Tracy.hpp>
#endif

namespace roomscatter::placement {

void draw_debug_box(IDebugDraw* sink, const Footprint& box, DebugColor color) noexcept
{
    if (!sink)
        return;
    try {
        sink->drawBox(box, color);
    } catch (const std::exception& e) {
        spdlog::warn("Debug draw failed: {}", e.what());
    }
}

PlacementExecutor::PlacementExecutor(IGeometryProvider& geometry,
                                     IInstantiationService& instances,
                                     FootprintCache& cache,
                                     SamplingSettings sampling,
                                     ExecutorSettings settings)
    : geometry_(geometry)
    , instances_(instances)
    , cache_(cache)
    , generator_(sampling)
    , settings_(settings)
{
}

std::vector<ItemRef> PlacementExecutor::feasibleItems(const Category& category, const Region& region)
{
    std::vector<ItemRef> pool;
    pool.reserve(category.items.size());
    for (const ItemRef& ref : category.items) {
        const auto est = cache_.item(ref);
        if (!est)
            continue;
        const Footprint box = FootprintCache::padded(*est, settings_.estimateSafetyFactor);
        if (CandidateGenerator::window(region, box, settings_.forcedClearance))
            pool.push_back(ref);
        else
            spdlog::debug("'{}' does not fit the room even without clearance", ref);
    }
    return pool;
}

CategoryReport PlacementExecutor::placeCategory(const Category& category, const CategoryPlan& plan, RunContext& ctx)
{
#ifdef TRACY_ENABLE
    ZoneScopedN("PlacementExecutor::placeCategory");
#endif

    CategoryReport rep;
    rep.categoryId  = category.id;
    rep.adjustedMax = plan.adjustedMax;
    rep.target      = plan.target;
    rep.budget      = plan.attemptBudget;

    if (plan.target <= 0)
        return rep;

    const std::vector<ItemRef> pool = feasibleItems(category, ctx.region);
    if (pool.empty()) {
        spdlog::warn("Category '{}': room too small for every template at every tier; abandoning", category.id);
        rep.infeasible = true;
        return rep;
    }

    while (rep.spawned < rep.target && rep.attempts < rep.budget) {
        if (!ctx.current()) {
            rep.superseded = true;
            break;
        }

        const AttemptResult r = attemptItem(category, pool, ctx);
        ++rep.attempts;
        rep.rollbacks += r.rollbacks;

        switch (r.outcome) {
            case AttemptOutcome::Committed:
                ++rep.spawned;
                ++rep.tierCommits[tier_index(r.tier)];
                break;
            case AttemptOutcome::InstantiationFailed:
                ++rep.failures;
                break;
            case AttemptOutcome::Superseded:
                rep.superseded = true;
                break;
            case AttemptOutcome::NoCandidate:
            case AttemptOutcome::RolledBack:
                break;
        }
        if (rep.superseded)
            break;

        if (rep.spawned < rep.target && rep.attempts >= plan.earlyStopAt) {
            spdlog::warn("Category '{}': approaching maximum attempts ({}/{}); stopping",
                         category.id, rep.attempts, rep.budget);
            rep.stoppedEarly = true;
            break;
        }
    }

    spdlog::info("Category '{}': spawned {}/{} after {} attempts (strict {}, relaxed {}, forced {}, rollbacks {})",
                 category.id, rep.spawned, rep.target, rep.attempts,
                 rep.tierCommits[0], rep.tierCommits[1], rep.tierCommits[2], rep.rollbacks);
    return rep;
}

AttemptResult PlacementExecutor::attemptItem(const Category& category, const std::vector<ItemRef>& pool, RunContext& ctx)
{
    AttemptResult res;
    if (pool.empty())
        return res;

    // SelectItem
    const ItemRef& item = pool[static_cast<std::size_t>(randi(ctx.rng, 0, static_cast<int>(pool.size()) - 1))];

    // EstimateFootprint (memoized)
    const auto est = cache_.item(item);
    if (!est) {
        res.outcome = AttemptOutcome::InstantiationFailed;
        return res;
    }
    const Footprint estimate = FootprintCache::padded(*est, settings_.estimateSafetyFactor);

    for (const RelaxationTier tier : kAllTiers) {
        const float clearance = effective_clearance(tier, category.clearance, settings_.forcedClearance);
        if (!CandidateGenerator::window(ctx.region, estimate, clearance)) {
            spdlog::debug("'{}': room too small at tier {} (clearance {:.3f}); escalating",
                          item, tier_name(tier), clearance);
            continue;
        }

        for (int i = 0; i < generator_.samplesPerTierWithFallback(); ++i) {
            if (!ctx.current()) {
                res.outcome = AttemptOutcome::Superseded;
                return res;
            }

            // GenerateCandidate
            const Candidate cand = generator_.sample(ctx.region, estimate, clearance, i, ctx.rng);
            if (!cand.ok())
                break;

            // ValidateEstimate
            const Footprint box = estimate.recentered(cand.position + estimate.center);
            const Verdict v = validator_.validateEstimate(box, ctx.region, ctx.ledger, clearance);
            if (!v.ok()) {
                spdlog::debug("'{}' sample {} at ({:.3f}, {:.3f}) rejected: {} (d={:.3f}, need {:.3f})",
                              item, i, cand.position.x, cand.position.z, rejection_name(v.reason),
                              v.distance, v.required);
                continue;
            }

            const AttemptOutcome o = instantiateAndCommit(category, item, cand.position, tier, clearance, ctx);
            switch (o) {
                case AttemptOutcome::Committed:
                    res.outcome = o;
                    res.tier = tier;
                    return res;
                case AttemptOutcome::RolledBack:
                    ++res.rollbacks;
                    res.outcome = o;
                    continue;
                case AttemptOutcome::InstantiationFailed:
                case AttemptOutcome::Superseded:
                    res.outcome = o;
                    return res;
                case AttemptOutcome::NoCandidate:
                    continue;
            }
        }
        spdlog::debug("'{}': tier {} exhausted", item, tier_name(tier));
    }
    return res;
}

AttemptOutcome PlacementExecutor::instantiateAndCommit(const Category& category, const ItemRef& item, Vec3 position,
                                                       RelaxationTier tier, float clearance, RunContext& ctx)
{
    const float yaw = settings_.randomYaw ? randf(ctx.rng, 0.0f, 360.0f) : 0.0f;

    InstanceHandle handle = kNoInstance;
    try {
        // Instantiate
        handle = instances_.create(item, position, yaw, settings_.parent);

        Footprint exact = geometry_.measureExactFootprint(handle);
        Verdict v = validator_.validateExact(exact, ctx.region, ctx.ledger, clearance);

        if (v.ok()) {
            // AlignToFloor
            Vec3 p = instances_.position(handle);
            const float pivotToBottom = p.y - exact.min().y;
            p.y = ctx.region.floorY + pivotToBottom;
            instances_.setPosition(handle, p);

            // ValidateExact again on the settled geometry
            exact = geometry_.measureExactFootprint(handle);
            v = validator_.validateExact(exact, ctx.region, ctx.ledger, clearance);
            if (v.ok())
                v = validator_.checkGrounded(exact, ctx.region, settings_.floorTolerance);
        }

        if (!v.ok()) {
            spdlog::warn("'{}' failed exact check at tier {} ({}); destroying", item, tier_name(tier),
                         rejection_name(v.reason));
            draw_debug_box(ctx.debug, exact, DebugColor::RolledBack);
            rollback(handle, item);
            return AttemptOutcome::RolledBack;
        }

        if (!ctx.current()) {
            rollback(handle, item);
            return AttemptOutcome::Superseded;
        }

        // Commit
        PlacedItem placed;
        placed.categoryId     = category.id;
        placed.item           = item;
        placed.instance       = handle;
        placed.position       = instances_.position(handle);
        placed.yawDegrees     = yaw;
        placed.exactFootprint = exact;
        placed.tier           = tier;
        placed.clearance      = clearance;
        const std::uint64_t id = ctx.ledger.append(std::move(placed));

        draw_debug_box(ctx.debug, exact, DebugColor::Committed);
        spdlog::debug("Committed #{} '{}' at ({:.3f}, {:.3f}, {:.3f}) yaw {:.1f} tier {}",
                      id, item, exact.center.x, exact.center.y, exact.center.z, yaw, tier_name(tier));
        return AttemptOutcome::Committed;
    } catch (const std::exception& e) {
        spdlog::warn("Error spawning '{}': {}", item, e.what());
        if (handle != kNoInstance)
            rollback(handle, item);
        return AttemptOutcome::InstantiationFailed;
    }
}

void PlacementExecutor::rollback(InstanceHandle handle, const ItemRef& item) noexcept
{
    try {
        instances_.destroy(handle);
    } catch (const std::exception& e) {
        spdlog::error("Rollback of '{}' failed: {}", item, e.what());
    }
}

} // namespace roomscatter::placement
