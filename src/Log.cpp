/**
 * @file Log.cpp
 * @brief The shared "tomlcli" logger
 */

#include "tomlcli/Log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tomlcli {

spdlog::logger& logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get("tomlcli");
        if (existing) return existing;
        auto created = spdlog::stderr_color_st("tomlcli");
        created->set_pattern("%n: %l: %v");
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return *instance;
}

void set_verbose(bool verbose) {
    logger().set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

} // namespace tomlcli
