// Populate a simulated room from a placement config and dump the result as JSON.
// Example:
//   room_scatter --config assets/config/room_scatter.json --min 0 0 0 --max 6 3 4 --seed 42 --out room.json

#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <cstdlib>
#include <cstdint>
#include <optional>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "config/PlacementConfig.hpp"
#include "logging/Log.h"
#include "placement/RoomPopulator.hpp"
#include "scene/SimulatedScene.hpp"

using roomscatter::Vec3;
using json = nlohmann::json;

struct Args {
    std::optional<std::string> configPath;   // if empty => default path, then built-in demo
    std::optional<std::uint64_t> seed;
    Vec3  min{ 0.f, 0.f, 0.f };
    Vec3  max{ 6.f, 3.f, 4.f };
    std::optional<float> floorY;             // if empty => min.y
    int   regenerate = 0;
    std::optional<std::string> logLevel;
    std::optional<std::string> logFile;
    bool  debugDraw = false;
    std::optional<std::string> outPath;      // if empty => stdout
};

static void print_usage(const char* exe) {
    std::cerr <<
    "Usage: " << exe << " [--config file.json] [--seed N] [--min X Y Z] [--max X Y Z] [--floor Y]\n"
    "       [--regenerate N] [--log-level L] [--log-file path] [--debug-draw] [--out file.json]\n"
    "Places the configured categories inside the room and writes the placed items as JSON.\n";
}

static bool parse_args(int argc, char** argv, Args& a) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto has = [&](int n) { return i + n < argc; };

        if (arg == "--config" && has(1)) a.configPath = std::string(argv[++i]);
        else if (arg == "--seed" && has(1)) a.seed = std::strtoull(argv[++i], nullptr, 0);
        else if (arg == "--min" && has(3)) {
            a.min.x = std::strtof(argv[++i], nullptr);
            a.min.y = std::strtof(argv[++i], nullptr);
            a.min.z = std::strtof(argv[++i], nullptr);
        }
        else if (arg == "--max" && has(3)) {
            a.max.x = std::strtof(argv[++i], nullptr);
            a.max.y = std::strtof(argv[++i], nullptr);
            a.max.z = std::strtof(argv[++i], nullptr);
        }
        else if (arg == "--floor" && has(1)) a.floorY = std::strtof(argv[++i], nullptr);
        else if (arg == "--regenerate" && has(1)) a.regenerate = std::atoi(argv[++i]);
        else if (arg == "--log-level" && has(1)) a.logLevel = std::string(argv[++i]);
        else if (arg == "--log-file" && has(1)) a.logFile = std::string(argv[++i]);
        else if (arg == "--debug-draw") a.debugDraw = true;
        else if (arg == "--out" && has(1)) a.outPath = std::string(argv[++i]);
        else if (arg == "--help" || arg == "-h") { print_usage(argv[0]); std::exit(0); }
        else { std::cerr << "Unknown or incomplete arg: " << arg << "\n"; print_usage(argv[0]); return false; }
    }
    return true;
}

// Used when no config file is given and none exists at the default path.
static roomscatter::config::PlacementConfig demo_config() {
    roomscatter::config::PlacementConfig cfg;
    cfg.templates = {
        { "crate",        { 0.8f, 0.8f, 0.8f }, { 0.f, 0.4f, 0.f },  1.0f },
        { "barrel",       { 0.6f, 1.0f, 0.6f }, { 0.f, 0.5f, 0.f },  1.0f },
        { "table",        { 1.6f, 0.8f, 0.9f }, { 0.f, 0.4f, 0.f },  1.0f },
        { "chair",        { 0.5f, 0.9f, 0.5f }, { 0.f, 0.45f, 0.f }, 1.0f },
    };
    cfg.categories = {
        { "storage",   { "crate", "barrel" }, 2, 6, 0.2f },
        { "furniture", { "table", "chair" },  1, 4, 0.3f },
    };
    return cfg;
}

// Logs every box; stands in for an engine's debug renderer.
class LogDebugDraw final : public roomscatter::IDebugDraw {
public:
    void drawBox(const roomscatter::Footprint& box, roomscatter::DebugColor color) override {
        const char* tag = color == roomscatter::DebugColor::Region    ? "region"
                        : color == roomscatter::DebugColor::Committed ? "placed"
                                                                      : "rolled-back";
        const Vec3 lo = box.min(), hi = box.max();
        spdlog::info("[draw] {} ({:.2f}, {:.2f}, {:.2f}) - ({:.2f}, {:.2f}, {:.2f})",
                     tag, lo.x, lo.y, lo.z, hi.x, hi.y, hi.z);
    }
};

static json report_to_json(const roomscatter::placement::RunReport& rep,
                           const roomscatter::placement::Ledger& ledger) {
    using roomscatter::placement::tier_name;

    json cats = json::array();
    for (const auto& c : rep.categories) {
        cats.push_back({
            { "id", c.categoryId }, { "target", c.target }, { "adjusted_max", c.adjustedMax },
            { "spawned", c.spawned }, { "attempts", c.attempts }, { "budget", c.budget },
            { "rollbacks", c.rollbacks }, { "failures", c.failures },
            { "stopped_early", c.stoppedEarly }, { "infeasible", c.infeasible },
        });
    }

    json items = json::array();
    for (const auto& p : ledger) {
        const Vec3 lo = p.exactFootprint.min(), hi = p.exactFootprint.max();
        items.push_back({
            { "id", p.id }, { "category", p.categoryId }, { "item", p.item },
            { "position", { p.position.x, p.position.y, p.position.z } },
            { "yaw", p.yawDegrees }, { "tier", tier_name(p.tier) },
            { "bounds_min", { lo.x, lo.y, lo.z } }, { "bounds_max", { hi.x, hi.y, hi.z } },
        });
    }

    return { { "generation", rep.generation }, { "total_spawned", rep.totalSpawned },
             { "categories", std::move(cats) }, { "items", std::move(items) } };
}

int main(int argc, char** argv)
{
    Args a;
    if (!parse_args(argc, argv, a)) return 1;

    namespace cfgns = roomscatter::config;
    cfgns::PlacementConfig cfg;
    try {
        if (a.configPath)
            cfg = cfgns::PlacementConfig::load(*a.configPath);
        else if (!cfgns::PlacementConfig::try_load(cfgns::PlacementConfig::default_path(), cfg))
            cfg = demo_config();
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    if (a.seed)     cfg.seed = *a.seed;
    if (a.logLevel) cfg.logLevel = *a.logLevel;
    if (a.debugDraw) cfg.debugDraw = true;

    logsys::LogOptions lo;
    lo.level = cfg.logLevel;
    if (a.logFile) lo.file = *a.logFile;
    logsys::init(lo);

    (void)cfg.validate();

    const auto region = roomscatter::Region::make(a.min, a.max, a.floorY.value_or(a.min.y));
    if (!region) {
        spdlog::error("Room bounds must have positive width and depth");
        return 1;
    }

    roomscatter::scene::SimulatedScene scene(cfg.templates);
    roomscatter::placement::RoomPopulator populator(cfg, scene, scene, scene);
    LogDebugDraw draw;
    populator.setDebugDraw(&draw);
    populator.attach(scene.dispatcher());

    scene.setRegion(*region); // RegionReady -> populate
    for (int i = 0; i < a.regenerate; ++i)
        scene.dispatcher().trigger(roomscatter::evt::ResetRequested{});

    const json doc = report_to_json(populator.lastReport(), populator.ledger());

    std::ostream* out = &std::cout;
    std::ofstream file;
    if (a.outPath) {
        file.open(a.outPath->c_str(), std::ios::out | std::ios::trunc);
        if (!file) {
            spdlog::error("Failed to open output file: {}", *a.outPath);
            return 2;
        }
        out = &file;
    }
    *out << doc.dump(2) << "\n";

    populator.detach();
    return 0;
}
