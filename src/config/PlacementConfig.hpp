// src/config/PlacementConfig.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "roomscatter/Math.hpp"
#include "placement/CandidateGenerator.hpp"
#include "placement/PlacementExecutor.hpp"
#include "placement/PlacementTypes.hpp"
#include "placement/Planner.hpp"

namespace roomscatter::config {

// Shape of a template for the bundled SimulatedScene backend. Hosts with a real
// scene graph ignore this section.
struct TemplateConfig {
    std::string name;
    Vec3  size{ 1.0f, 1.0f, 1.0f };
    Vec3  pivot{};             // local bounds center relative to the instance pivot
    float exactScale = 1.0f;   // measured geometry vs. estimate (1 = identical)
};

// Everything a placement run reads. Defaults mirror the shipped config.
struct PlacementConfig {
    std::vector<placement::Category> categories;
    std::vector<TemplateConfig>      templates;

    int   perItemAttemptCap         = 20;
    int   absoluteCap               = 100;
    int   samplesPerTier            = 10;
    float averageRadius             = 0.5f;
    bool  measureRadiusFromEstimate = true;
    float estimateSafetyFactor      = 1.1f;
    float minimumEstimateSize       = 0.3f;
    float edgeInsetStep             = 0.2f;
    float edgeInsetMaxFraction      = 0.4f;
    float forcedClearance           = 0.01f;
    bool  randomYaw                 = true;
    std::uint64_t seed              = 0x5EEDull;

    // [debug]
    bool        debugDraw = false;
    std::string logLevel  = "info";

    // Load or throw std::runtime_error when the file cannot be read or parsed.
    static PlacementConfig load(const std::filesystem::path& path);

    // Load but never throw; `out` keeps its defaults on failure.
    static bool try_load(const std::filesystem::path& path, PlacementConfig& out);

    // Missing or mistyped keys fall back to defaults.
    static PlacementConfig from_json(const nlohmann::json& root);
    [[nodiscard]] nlohmann::json to_json() const;

    // assets/config/room_scatter.json
    static std::filesystem::path default_path();

    // Clamp out-of-range values in place; one message per correction.
    std::vector<std::string> validate();

    [[nodiscard]] placement::PlannerSettings  plannerSettings() const;
    [[nodiscard]] placement::SamplingSettings samplingSettings() const;
    [[nodiscard]] placement::ExecutorSettings executorSettings() const;
};

} // namespace roomscatter::config
