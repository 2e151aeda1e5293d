#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace phenom {

// ─── Logging ──────────────────────────────────────────────────
// Shared "phenom" logger. Created on first use with a colour
// stdout sink; registered with spdlog so applications embedding
// the library can reconfigure it through spdlog::get("phenom").

/// Get (or lazily create) the library logger.
std::shared_ptr<spdlog::logger> logger();

/// Set the level of the library logger.
void setLogLevel(spdlog::level::level_enum level);

} // namespace phenom
