/**
 * @file reward.cpp
 * @brief Implementation of the step reward.
 */

#include "reward.hpp"
#include <algorithm>
#include <cmath>

namespace auv_sim {

RewardFunction::RewardFunction(const AUVEnvConfig& config)
    : reward_ds_(config.reward_ds),
      reward_closeness_(config.reward_closeness),
      reward_surge_error_(config.reward_surge_error),
      reward_cross_track_error_(config.reward_cross_track_error),
      reward_collision_(config.reward_collision),
      cruise_speed_(config.cruise_speed),
      terminate_on_collision_(config.terminate_on_collision) {}

RewardOutcome RewardFunction::evaluate(const RewardInput& input) const {
    RewardOutcome outcome;
    const Observation& obs = input.observation;

    if (std::abs(input.progress - input.path_length) < kPathEndTolerance) {
        outcome.reason = TerminationReason::PATH_COMPLETED;
    } else if (input.distance_to_endpoint < kGoalRadius) {
        outcome.reason = TerminationReason::GOAL_REACHED;
    } else if (terminate_on_collision_ && input.collided) {
        outcome.reason = TerminationReason::COLLISION;
        outcome.reward += reward_collision_;
    }

    bool terminal = outcome.reason != TerminationReason::NONE;

    if (!terminal) {
        outcome.reward += reward_ds_ * input.delta_progress;
    }

    for (int i = 0; i < kNumSectors; ++i) {
        double closeness = obs(kFirstSector + i);
        outcome.reward += reward_closeness_ * closeness * closeness;
    }

    if (!terminal) {
        double surge_deficit = cruise_speed_ / input.max_speed - obs(kSurge);
        outcome.reward += reward_cross_track_error_ * std::abs(obs(kCrossTrackError));
        outcome.reward += reward_surge_error_ * std::max(0.0, surge_deficit);

        if (input.accumulated_reward + outcome.reward < kDivergenceFloor) {
            outcome.reason = TerminationReason::DIVERGED;
        }
    }

    outcome.done = outcome.reason != TerminationReason::NONE;
    return outcome;
}

}  // namespace auv_sim
