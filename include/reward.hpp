/**
 * @file reward.hpp
 * @brief Per-step reward and termination decision.
 */

#ifndef AUV_SIM_REWARD_HPP
#define AUV_SIM_REWARD_HPP

#include "config.hpp"
#include "types.hpp"

namespace auv_sim {

/**
 * @brief Geometry and bookkeeping of one step, as seen by the reward.
 */
struct RewardInput {
    Observation observation;            ///< Observation after the step
    double delta_progress = 0.0;        ///< Change of path progress this step [m]
    double progress = 0.0;              ///< Path progress after the step [m]
    double path_length = 0.0;           ///< Total path length [m]
    double distance_to_endpoint = 0.0;  ///< Vehicle to path endpoint [m]
    double accumulated_reward = 0.0;    ///< Episode reward before this step
    bool collided = false;              ///< Hull overlaps an obstacle
    double max_speed = 1.0;             ///< Vehicle speed bound [m/s]

    RewardInput() : observation(Observation::Zero()) {}
};

/**
 * @brief Reward of one step and whether it ends the episode.
 */
struct RewardOutcome {
    double reward = 0.0;
    bool done = false;
    TerminationReason reason = TerminationReason::NONE;
};

/**
 * @brief Reward shaping for path following with obstacle avoidance.
 *
 * Terms, weights from AUVEnvConfig:
 * - reward_ds * delta_progress
 * - reward_closeness * closeness^2 for every sector (also on terminal steps)
 * - reward_cross_track_error * |cross-track observation|
 * - reward_surge_error * max(0, cruise_speed / max_speed - surge observation)
 *
 * The episode ends when progress is within kPathEndTolerance of the path
 * length, the vehicle is within kGoalRadius of the endpoint, the accumulated
 * reward including this step falls below kDivergenceFloor, or (opt-in) the
 * hull hits an obstacle.
 */
class RewardFunction {
public:
    static constexpr double kDivergenceFloor = -300.0;
    static constexpr double kPathEndTolerance = 1.0;   ///< [m] of arc length
    static constexpr double kGoalRadius = 10.0;        ///< [m]

    explicit RewardFunction(const AUVEnvConfig& config);

    RewardOutcome evaluate(const RewardInput& input) const;

private:
    double reward_ds_;
    double reward_closeness_;
    double reward_surge_error_;
    double reward_cross_track_error_;
    double reward_collision_;
    double cruise_speed_;
    bool terminate_on_collision_;
};

}  // namespace auv_sim

#endif  // AUV_SIM_REWARD_HPP
