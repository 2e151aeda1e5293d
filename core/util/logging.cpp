#include "util/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace phenom {

namespace {
constexpr const char* kLoggerName = "phenom";
}

std::shared_ptr<spdlog::logger> logger() {
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    try {
        auto log = spdlog::stdout_color_mt(kLoggerName);
        log->set_level(spdlog::level::warn);
        log->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        return log;
    } catch (const spdlog::spdlog_ex&) {
        // Lost a registration race; the winner is in the registry now.
        return spdlog::get(kLoggerName);
    }
}

void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace phenom
