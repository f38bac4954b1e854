/**
 * @file environment.hpp
 * @brief Episode controller of the AUV path-following environment.
 *
 * Each step:
 * 1. Advances the vehicle with the action
 * 2. Recomputes path progress as the closest-point arc length
 * 3. Builds the observation
 * 4. Evaluates reward and termination
 */

#ifndef AUV_SIM_ENVIRONMENT_HPP
#define AUV_SIM_ENVIRONMENT_HPP

#include "config.hpp"
#include "dynamics.hpp"
#include "obstacles.hpp"
#include "perception.hpp"
#include "reference_path.hpp"
#include "reward.hpp"
#include "types.hpp"
#include <cstdint>
#include <optional>
#include <random>

namespace auv_sim {

/**
 * @brief Lifecycle phase of an episode.
 */
enum class EpisodePhase {
    ACTIVE,  ///< step() may be called
    DONE     ///< Terminal; reset() starts a new episode
};

/**
 * @brief AUV following a random path among static obstacles.
 */
class AUVEnvironment {
public:
    /**
     * @brief Validate the configuration, seed the generator and start an episode.
     * @param config Environment configuration
     * @throws ConfigError if an option is missing or invalid
     */
    explicit AUVEnvironment(const AUVEnvConfig& config);

    /**
     * @brief Generate a new episode.
     *
     * Draws a random path through the origin, places the vehicle near its
     * start and scatters obstacles along it. Degenerate geometry is retried
     * with fresh draws up to max_generation_attempts times.
     *
     * @param seed Reseeds the generator when given; otherwise the draws
     *             continue from the previous episode
     * @return Initial observation
     * @throws GeometryError if every generation attempt was degenerate
     */
    Observation reset(std::optional<uint32_t> seed = std::nullopt);

    /**
     * @brief Start an episode from caller-provided geometry.
     * @param path Path to follow
     * @param obstacles Obstacle field
     * @param init_pose Vehicle [x, y, psi]; velocities start at zero
     * @return Initial observation
     * @throws GeometryError if the path was never built from waypoints
     * @throws std::invalid_argument on a non-finite pose
     */
    Observation load_scenario(const ReferencePath& path,
                              const ObstacleField& obstacles,
                              const Eigen::Vector3d& init_pose);

    /**
     * @brief Advance one timestep.
     * @param action [propeller_input, rudder_position], clamped by the vehicle
     * @return Observation, step reward, done flag and info
     * @throws std::logic_error if the episode is already DONE
     * @throws std::invalid_argument on a non-finite action; the episode
     *         continues unchanged
     * @throws GeometryError if the closest-point search fails; the episode
     *         is then DONE
     */
    StepResult step(const Eigen::Vector2d& action);

    const AUVEnvConfig& config() const { return config_; }
    const AUV2D& vehicle() const { return *vehicle_; }
    const ReferencePath& path() const { return path_; }
    const ObstacleField& obstacles() const { return obstacles_; }

    /// Arc length of the closest path point after the last step
    double progress() const { return progress_; }

    double accumulated_reward() const { return accumulated_reward_; }
    const Eigen::Vector2d& last_action() const { return last_action_; }
    EpisodePhase phase() const { return phase_; }
    TerminationReason termination_reason() const { return termination_reason_; }
    int step_count() const { return step_count_; }

private:
    /// Draw path, vehicle pose and obstacles from the generator
    void generate();

    /// Reset bookkeeping and build the initial observation
    Observation begin_episode();

    PerceptionParams perception_params() const;

    AUVEnvConfig config_;
    RewardFunction reward_function_;
    std::mt19937 rng_;

    ReferencePath path_;
    ObstacleField obstacles_;
    std::optional<AUV2D> vehicle_;

    double progress_ = 0.0;
    double accumulated_reward_ = 0.0;
    Eigen::Vector2d last_action_ = Eigen::Vector2d::Zero();
    EpisodePhase phase_ = EpisodePhase::DONE;
    TerminationReason termination_reason_ = TerminationReason::NONE;
    int step_count_ = 0;
    int episode_count_ = 0;
};

}  // namespace auv_sim

#endif  // AUV_SIM_ENVIRONMENT_HPP
