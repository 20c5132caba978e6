#include "Log.h"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <string>
#include <vector>

namespace fs = std::filesystem;
static std::shared_ptr<spdlog::logger> g_logger;

static bool parse_level(std::string_view name, spdlog::level::level_enum& out) {
    const auto lvl = spdlog::level::from_str(std::string(name));
    // from_str maps unknown names to off; only accept "off" when asked for it
    if (lvl == spdlog::level::off && name != "off") return false;
    out = lvl;
    return true;
}

void logsys::init(const LogOptions& opts) {
    std::vector<spdlog::sink_ptr> sinks;
    if (opts.color) sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    else            sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());

    std::string fileError;
    if (!opts.file.empty()) {
        std::error_code ec;
        if (opts.file.has_parent_path()) fs::create_directories(opts.file.parent_path(), ec);
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                opts.file.string(), 1 << 20, 4)); // 1MB * 4
        } catch (const spdlog::spdlog_ex& e) {
            fileError = e.what();
        }
    }

    if (g_logger) spdlog::drop(g_logger->name());
    g_logger = std::make_shared<spdlog::logger>("roomscatter", sinks.begin(), sinks.end());
    spdlog::set_default_logger(g_logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::flush_on(spdlog::level::warn);

    if (!set_level(opts.level)) {
        spdlog::set_level(spdlog::level::info);
        spdlog::warn("Unknown log level '{}', using info", opts.level);
    }
    if (!fileError.empty())
        spdlog::warn("Log file '{}' disabled: {}", opts.file.string(), fileError);
    spdlog::debug("Logging started");
}

std::shared_ptr<spdlog::logger> logsys::get() { return g_logger ? g_logger : spdlog::default_logger(); }

bool logsys::set_level(std::string_view level) {
    spdlog::level::level_enum lvl{};
    if (!parse_level(level, lvl)) return false;
    spdlog::set_level(lvl);
    return true;
}
