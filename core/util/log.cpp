#include "util/log.hpp"

#include <mutex>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace puzlib {
namespace logging {

namespace {

constexpr const char* kLoggerName = "puzlib";

std::shared_ptr<spdlog::logger> createLogger() {
    auto existing = spdlog::get(kLoggerName);
    if (existing) return existing;

    auto logger = spdlog::stderr_color_mt(kLoggerName);
    logger->set_pattern("[%H:%M:%S.%e][%n][%l] %v");
    logger->set_level(spdlog::level::warn);

    // Applies SPDLOG_LEVEL (e.g. "puzlib=debug") to registered loggers.
    spdlog::cfg::load_env_levels();
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> get() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> logger;
    std::call_once(once, [] { logger = createLogger(); });
    return logger;
}

void setLevel(spdlog::level::level_enum level) {
    get()->set_level(level);
}

} // namespace logging
} // namespace puzlib
