#pragma once

#include <memory>
#include <spdlog/spdlog.h>

namespace puzlib {
namespace logging {

/// Shared "puzlib" logger. Created on first use with a stderr sink at
/// warn level; SPDLOG_LEVEL in the environment overrides the level.
std::shared_ptr<spdlog::logger> get();

/// Change the level of the shared logger.
void setLevel(spdlog::level::level_enum level);

} // namespace logging
} // namespace puzlib
