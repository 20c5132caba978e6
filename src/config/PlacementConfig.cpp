// src/config/PlacementConfig.cpp
#include "config/PlacementConfig.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace roomscatter::config {

namespace {

template <typename T>
T GetOr(const json& j, const char* key, const T& fallback)
{
    if (!j.is_object())
        return fallback;
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return fallback;
    try {
        return it->get<T>();
    } catch (const json::exception& e) {
        spdlog::warn("PlacementConfig: '{}' has the wrong type ({}); using default", key, e.what());
        return fallback;
    }
}

Vec3 GetVec3Or(const json& j, const char* key, Vec3 fallback)
{
    const auto v = GetOr<std::vector<float>>(j, key, {});
    if (v.size() != 3)
        return fallback;
    return { v[0], v[1], v[2] };
}

json Vec3ToJson(Vec3 v)
{
    return json::array({ v.x, v.y, v.z });
}

placement::Category ParseCategory(const json& c, std::size_t index)
{
    placement::Category cat;
    cat.id        = GetOr<std::string>(c, "id", "category_" + std::to_string(index));
    cat.items     = GetOr<std::vector<std::string>>(c, "items", {});
    cat.minCount  = GetOr<int>(c, "min", cat.minCount);
    cat.maxCount  = GetOr<int>(c, "max", cat.maxCount);
    cat.clearance = GetOr<float>(c, "clearance", cat.clearance);
    return cat;
}

TemplateConfig ParseTemplate(const json& t)
{
    TemplateConfig tc;
    tc.name       = GetOr<std::string>(t, "name", tc.name);
    tc.size       = GetVec3Or(t, "size", tc.size);
    tc.pivot      = GetVec3Or(t, "pivot", tc.pivot);
    tc.exactScale = GetOr<float>(t, "exact_scale", tc.exactScale);
    return tc;
}

} // namespace

PlacementConfig PlacementConfig::from_json(const json& root)
{
    PlacementConfig cfg;
    if (!root.is_object()) {
        spdlog::warn("PlacementConfig: root is not an object; using defaults");
        return cfg;
    }

    const json placement = root.value("placement", json::object());
    cfg.perItemAttemptCap         = GetOr<int>  (placement, "per_item_attempt_cap",         cfg.perItemAttemptCap);
    cfg.absoluteCap               = GetOr<int>  (placement, "absolute_cap",                 cfg.absoluteCap);
    cfg.samplesPerTier            = GetOr<int>  (placement, "samples_per_tier",             cfg.samplesPerTier);
    cfg.averageRadius             = GetOr<float>(placement, "average_radius",               cfg.averageRadius);
    cfg.measureRadiusFromEstimate = GetOr<bool> (placement, "measure_radius_from_estimate", cfg.measureRadiusFromEstimate);
    cfg.estimateSafetyFactor      = GetOr<float>(placement, "estimate_safety_factor",       cfg.estimateSafetyFactor);
    cfg.minimumEstimateSize       = GetOr<float>(placement, "minimum_estimate_size",        cfg.minimumEstimateSize);
    cfg.edgeInsetStep             = GetOr<float>(placement, "edge_inset_step",              cfg.edgeInsetStep);
    cfg.edgeInsetMaxFraction      = GetOr<float>(placement, "edge_inset_max_fraction",      cfg.edgeInsetMaxFraction);
    cfg.forcedClearance           = GetOr<float>(placement, "forced_clearance",             cfg.forcedClearance);
    cfg.randomYaw                 = GetOr<bool> (placement, "random_yaw",                   cfg.randomYaw);
    cfg.seed                      = GetOr<std::uint64_t>(placement, "seed",                 cfg.seed);

    const json debug = root.value("debug", json::object());
    cfg.debugDraw = GetOr<bool>       (debug, "draw_bounds", cfg.debugDraw);
    cfg.logLevel  = GetOr<std::string>(debug, "log_level",   cfg.logLevel);

    if (const auto it = root.find("categories"); it != root.end() && it->is_array()) {
        std::size_t index = 0;
        for (const json& c : *it) {
            if (c.is_object())
                cfg.categories.push_back(ParseCategory(c, index));
            ++index;
        }
    }

    if (const auto it = root.find("templates"); it != root.end() && it->is_array()) {
        for (const json& t : *it) {
            if (t.is_object())
                cfg.templates.push_back(ParseTemplate(t));
        }
    }

    return cfg;
}

json PlacementConfig::to_json() const
{
    json root;
    root["placement"] = {
        { "per_item_attempt_cap",         perItemAttemptCap },
        { "absolute_cap",                 absoluteCap },
        { "samples_per_tier",             samplesPerTier },
        { "average_radius",               averageRadius },
        { "measure_radius_from_estimate", measureRadiusFromEstimate },
        { "estimate_safety_factor",       estimateSafetyFactor },
        { "minimum_estimate_size",        minimumEstimateSize },
        { "edge_inset_step",              edgeInsetStep },
        { "edge_inset_max_fraction",      edgeInsetMaxFraction },
        { "forced_clearance",             forcedClearance },
        { "random_yaw",                   randomYaw },
        { "seed",                         seed },
    };
    root["debug"] = { { "draw_bounds", debugDraw }, { "log_level", logLevel } };

    json cats = json::array();
    for (const auto& c : categories) {
        cats.push_back({ { "id", c.id }, { "items", c.items }, { "min", c.minCount },
                         { "max", c.maxCount }, { "clearance", c.clearance } });
    }
    root["categories"] = std::move(cats);

    json tpls = json::array();
    for (const auto& t : templates) {
        tpls.push_back({ { "name", t.name }, { "size", Vec3ToJson(t.size) },
                         { "pivot", Vec3ToJson(t.pivot) }, { "exact_scale", t.exactScale } });
    }
    root["templates"] = std::move(tpls);
    return root;
}

bool PlacementConfig::try_load(const fs::path& path, PlacementConfig& out)
{
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f)
        return false;

    json root;
    try {
        f >> root;
    } catch (const json::exception& e) {
        spdlog::warn("PlacementConfig: parse error in '{}': {}", path.string(), e.what());
        return false;
    }

    out = from_json(root);
    return true;
}

PlacementConfig PlacementConfig::load(const fs::path& path)
{
    PlacementConfig cfg;
    if (!try_load(path, cfg))
        throw std::runtime_error("Failed to load placement config: " + path.string());
    return cfg;
}

fs::path PlacementConfig::default_path()
{
    return fs::path("assets") / "config" / "room_scatter.json";
}

std::vector<std::string> PlacementConfig::validate()
{
    std::vector<std::string> issues;
    const PlacementConfig defaults;

    auto fixInt = [&](int& v, int lo, int def, const char* name) {
        if (v < lo) {
            issues.push_back(std::string(name) + " must be >= " + std::to_string(lo) +
                             "; using " + std::to_string(def));
            v = def;
        }
    };
    fixInt(perItemAttemptCap, 1, defaults.perItemAttemptCap, "per_item_attempt_cap");
    fixInt(absoluteCap,       0, defaults.absoluteCap,       "absolute_cap");
    fixInt(samplesPerTier,    0, defaults.samplesPerTier,    "samples_per_tier");

    if (!(averageRadius > 0.0f)) {
        issues.emplace_back("average_radius must be positive; using 0.5");
        averageRadius = defaults.averageRadius;
    }
    if (estimateSafetyFactor < 1.0f) {
        issues.emplace_back("estimate_safety_factor below 1 would shrink estimates; using 1");
        estimateSafetyFactor = 1.0f;
    }
    if (!(minimumEstimateSize > 0.0f)) {
        issues.emplace_back("minimum_estimate_size must be positive; using 0.3");
        minimumEstimateSize = defaults.minimumEstimateSize;
    }
    if (edgeInsetStep < 0.0f) {
        issues.emplace_back("edge_inset_step must be >= 0; using 0");
        edgeInsetStep = 0.0f;
    }
    if (edgeInsetMaxFraction < 0.0f || edgeInsetMaxFraction >= 1.0f) {
        issues.emplace_back("edge_inset_max_fraction must be in [0, 1); using 0.4");
        edgeInsetMaxFraction = defaults.edgeInsetMaxFraction;
    }
    if (forcedClearance < 0.0f) {
        issues.emplace_back("forced_clearance must be >= 0; using 0");
        forcedClearance = 0.0f;
    }

    for (auto& c : categories) {
        if (c.minCount < 0) {
            issues.push_back("category '" + c.id + "': min < 0; using 0");
            c.minCount = 0;
        }
        if (c.maxCount < c.minCount) {
            issues.push_back("category '" + c.id + "': max < min; raising max to " + std::to_string(c.minCount));
            c.maxCount = c.minCount;
        }
        if (c.clearance < 0.0f) {
            issues.push_back("category '" + c.id + "': clearance < 0; using 0");
            c.clearance = 0.0f;
        }
    }

    for (auto& t : templates) {
        if (t.size.x < 0.0f || t.size.y < 0.0f || t.size.z < 0.0f) {
            issues.push_back("template '" + t.name + "': negative size; using absolute values");
            t.size = { std::abs(t.size.x), std::abs(t.size.y), std::abs(t.size.z) };
        }
        if (!(t.exactScale > 0.0f)) {
            issues.push_back("template '" + t.name + "': exact_scale must be positive; using 1");
            t.exactScale = 1.0f;
        }
    }

    for (const auto& msg : issues)
        spdlog::warn("PlacementConfig: {}", msg);
    return issues;
}

placement::PlannerSettings PlacementConfig::plannerSettings() const
{
    placement::PlannerSettings s;
    s.averageRadius             = averageRadius;
    s.measureRadiusFromEstimate = measureRadiusFromEstimate;
    s.absoluteCap               = absoluteCap;
    s.perItemAttemptCap         = perItemAttemptCap;
    return s;
}

placement::SamplingSettings PlacementConfig::samplingSettings() const
{
    placement::SamplingSettings s;
    s.samplesPerTier       = samplesPerTier;
    s.edgeInsetStep        = edgeInsetStep;
    s.edgeInsetMaxFraction = edgeInsetMaxFraction;
    return s;
}

placement::ExecutorSettings PlacementConfig::executorSettings() const
{
    placement::ExecutorSettings s;
    s.estimateSafetyFactor = estimateSafetyFactor;
    s.forcedClearance      = forcedClearance;
    s.randomYaw            = randomYaw;
    return s;
}

} // namespace roomscatter::config
