/**
 * @file logging.cpp
 * @brief Library logger setup.
 */

#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace auv_sim {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get(kLoggerName);
        if (existing) {
            return existing;
        }
        auto created = spdlog::stdout_color_mt(kLoggerName);
        created->set_level(spdlog::level::info);
        created->set_pattern("[%H:%M:%S] [%n] [%^%l%$] %v");
        return created;
    }();
    return instance;
}

}  // namespace auv_sim
