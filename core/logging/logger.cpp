#include "logging/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace rebut {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get("rebut");
        if (existing) return existing;
        auto created = spdlog::stderr_color_mt("rebut");
        created->set_pattern("[%H:%M:%S] [%n] [%^%l%$] %v");
        created->set_level(spdlog::level::info);
        return created;
    }();
    return instance;
}

void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace rebut
