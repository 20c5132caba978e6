#pragma once
#include <filesystem>
#include <memory>
#include <string_view>
#include <spdlog/spdlog.h>

namespace logsys {
    struct LogOptions {
        std::string_view      level = "info";    // trace|debug|info|warn|error|critical|off
        std::filesystem::path file;              // empty = console only
        bool                  color = true;
    };

    void init(const LogOptions& opts = {});      // installs "roomscatter" as the default logger
    std::shared_ptr<spdlog::logger> get();       // "roomscatter"
    bool set_level(std::string_view level);      // false if the name is unknown
}
