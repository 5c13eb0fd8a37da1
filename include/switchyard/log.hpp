#pragma once

#include "types.hpp"
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace switchyard {
namespace log {

// Component logger names
inline constexpr const char* kOrchestrator = "switchyard.orchestrator";
inline constexpr const char* kQueue = "switchyard.queue";
inline constexpr const char* kCircuit = "switchyard.circuit";
inline constexpr const char* kRouter = "switchyard.router";
inline constexpr const char* kContext = "switchyard.context";

/**
 * @brief Get (or lazily create) a named component logger
 *
 * All component loggers share one stdout color sink and the level most
 * recently passed to set_level().
 *
 * @threadsafety Thread-safe
 */
std::shared_ptr<spdlog::logger> get(const std::string& name);

/**
 * @brief Set the level of every switchyard logger, current and future
 *
 * @param level One of trace, debug, info, warn, error, critical, off
 * @return Expected<void> InvalidConfig for an unknown level name
 */
Expected<void> set_level(const std::string& level);

} // namespace log
} // namespace switchyard
