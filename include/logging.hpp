/**
 * @file logging.hpp
 * @brief Library logger.
 */

#ifndef AUV_SIM_LOGGING_HPP
#define AUV_SIM_LOGGING_HPP

#include <spdlog/spdlog.h>
#include <memory>

namespace auv_sim {

/// Name under which the library logger is registered with spdlog.
constexpr const char* kLoggerName = "auv_sim";

/**
 * @brief Shared logger used by the simulation core.
 *
 * Reuses a logger the application registered as "auv_sim", otherwise creates a
 * colored stdout logger at info level on first use.
 */
std::shared_ptr<spdlog::logger> logger();

}  // namespace auv_sim

#endif  // AUV_SIM_LOGGING_HPP
