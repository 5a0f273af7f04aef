#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace rebut {

/// The engine's named logger ("rebut"), created on first use.
std::shared_ptr<spdlog::logger> logger();

/// Convenience for applications embedding the engine.
void setLogLevel(spdlog::level::level_enum level);

} // namespace rebut
