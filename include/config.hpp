/**
 * @file config.hpp
 * @brief Configuration of the AUV path-following environment.
 *
 * Every recognized option is a field. Options that shape the reward have no
 * default: they start as NaN (or -1 for counts) and validate() reports them
 * as missing.
 */

#ifndef AUV_SIM_CONFIG_HPP
#define AUV_SIM_CONFIG_HPP

#include "errors.hpp"
#include <cstdint>
#include <limits>
#include <map>
#include <string>

namespace YAML {
class Node;
}

namespace auv_sim {

/**
 * @brief Configuration parameters for AUVEnvironment.
 */
struct AUVEnvConfig {
    static constexpr double kUnset = std::numeric_limits<double>::quiet_NaN();

    // Reward weights (required)
    double reward_ds = kUnset;                  ///< Per metre of path progress
    double reward_closeness = kUnset;           ///< Per sector, times closeness^2
    double reward_surge_error = kUnset;         ///< Per unit of normalized speed below cruise
    double reward_cross_track_error = kUnset;   ///< Per unit of normalized cross-track error
    double reward_collision = kUnset;           ///< On collision, if terminate_on_collision

    // Episode and sensing (required)
    int nobstacles = -1;                        ///< Obstacles per episode
    double los_dist = kUnset;                   ///< Line-of-sight distance [m]
    double obst_range = kUnset;                 ///< Obstacle detection range [m]
    double t_step = kUnset;                     ///< Simulation timestep [s]
    double cruise_speed = kUnset;               ///< Desired surge speed [m/s]

    // Optional
    bool terminate_on_collision = false;        ///< End the episode when the hull hits an obstacle
    int nwaypoints = 6;                         ///< Random path refinement points
    double path_length = 400.0;                 ///< Start-to-end distance of random paths [m]
    uint32_t seed = 5;                          ///< Seed used when reset() gets none
    int max_generation_attempts = 3;            ///< Episode generation retries on degenerate geometry

    /**
     * @brief Validate configuration parameters.
     * @throws ConfigError naming the first missing or invalid option
     */
    void validate() const;

    /**
     * @brief Load from a YAML file with one top-level key per option.
     * @throws ConfigError on a missing/malformed option or unreadable file
     */
    static AUVEnvConfig from_yaml_file(const std::string& path);

    /// Load from a parsed YAML map
    static AUVEnvConfig from_yaml(const YAML::Node& node);

    /**
     * @brief Load from a key/value map.
     *
     * Counts and the collision flag are read from their numeric value; unknown
     * keys are rejected.
     */
    static AUVEnvConfig from_map(const std::map<std::string, double>& values);
};

}  // namespace auv_sim

#endif  // AUV_SIM_CONFIG_HPP
