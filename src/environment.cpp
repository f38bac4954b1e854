/**
 * @file environment.cpp
 * @brief Implementation of the AUV path-following episode controller.
 */

#include "environment.hpp"
#include "logging.hpp"
#include <stdexcept>

namespace auv_sim {

namespace {

AUVEnvConfig validated(const AUVEnvConfig& config) {
    config.validate();
    return config;
}

}  // anonymous namespace

AUVEnvironment::AUVEnvironment(const AUVEnvConfig& config)
    : config_(validated(config)),
      reward_function_(config_),
      rng_(config_.seed) {
    reset();
}

Observation AUVEnvironment::reset(std::optional<uint32_t> seed) {
    if (seed.has_value()) {
        rng_.seed(*seed);
    }

    for (int attempt = 1; attempt <= config_.max_generation_attempts; ++attempt) {
        try {
            generate();
            break;
        } catch (const GeometryError& e) {
            if (attempt == config_.max_generation_attempts) {
                logger()->error("Episode generation failed after {} attempts: {}",
                                attempt, e.what());
                phase_ = EpisodePhase::DONE;
                throw;
            }
            logger()->warn("Episode generation attempt {} degenerate ({}), retrying",
                           attempt, e.what());
        }
    }

    return begin_episode();
}

Observation AUVEnvironment::load_scenario(const ReferencePath& path,
                                          const ObstacleField& obstacles,
                                          const Eigen::Vector3d& init_pose) {
    if (path.num_points() == 0) {
        throw GeometryError("scenario path has no waypoints");
    }
    if (!init_pose.allFinite()) {
        throw std::invalid_argument("scenario initial pose must be finite");
    }

    path_ = path;
    obstacles_ = obstacles;
    vehicle_.emplace(config_.t_step, init_pose);
    return begin_episode();
}

void AUVEnvironment::generate() {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    ReferencePath path = ReferencePath::create_random_through_origin(
        rng_, config_.nwaypoints, config_.path_length);

    Eigen::Vector2d init_pos = path.position(0);
    double init_angle = path.direction(0);
    init_pos(0) += 2 * (uniform(rng_) - 0.5);
    init_pos(1) += 2 * (uniform(rng_) - 0.5);
    init_angle += 0.1 * (uniform(rng_) - 0.5);

    ObstacleField obstacles = ObstacleField::scatter_along_path(path, config_.nobstacles, rng_);

    path_ = std::move(path);
    obstacles_ = std::move(obstacles);
    vehicle_.emplace(config_.t_step, Eigen::Vector3d(init_pos(0), init_pos(1), init_angle));

    logger()->debug("Generated path of length {:.1f} m with {} waypoints and {} obstacles",
                    path_.length(), path_.waypoints().size(), obstacles_.size());
}

Observation AUVEnvironment::begin_episode() {
    progress_ = 0.0;
    accumulated_reward_ = 0.0;
    last_action_ = Eigen::Vector2d::Zero();
    step_count_ = 0;
    termination_reason_ = TerminationReason::NONE;
    phase_ = EpisodePhase::ACTIVE;
    episode_count_++;

    logger()->info("Episode {} started: path length {:.1f} m, {} obstacles",
                   episode_count_, path_.length(), obstacles_.size());

    return observe(*vehicle_, path_, obstacles_, progress_, last_action_, perception_params());
}

StepResult AUVEnvironment::step(const Eigen::Vector2d& action) {
    if (phase_ == EpisodePhase::DONE) {
        throw std::logic_error("step() called on a finished episode; call reset()");
    }
    if (!action.allFinite()) {
        throw std::invalid_argument("action must be finite");
    }

    last_action_ = action;
    vehicle_->step(action);

    double prog;
    try {
        prog = path_.closest_arc_length(vehicle_->position());
    } catch (const GeometryError& e) {
        phase_ = EpisodePhase::DONE;
        logger()->error("Episode {} aborted at step {}: {}", episode_count_, step_count_, e.what());
        throw;
    }
    double delta_progress = prog - progress_;
    progress_ = prog;

    StepResult result;
    result.observation = observe(*vehicle_, path_, obstacles_, progress_, last_action_,
                                 perception_params());

    RewardInput input;
    input.observation = result.observation;
    input.delta_progress = delta_progress;
    input.progress = progress_;
    input.path_length = path_.length();
    input.distance_to_endpoint = (vehicle_->position() - path_.endpoint()).norm();
    input.accumulated_reward = accumulated_reward_;
    input.collided = obstacles_.first_collision(vehicle_->position(), vehicle_->radius()).has_value();
    input.max_speed = vehicle_->max_speed();

    RewardOutcome outcome = reward_function_.evaluate(input);

    accumulated_reward_ += outcome.reward;
    step_count_++;

    result.reward = outcome.reward;
    result.done = outcome.done;

    if (outcome.done) {
        phase_ = EpisodePhase::DONE;
        termination_reason_ = outcome.reason;
        logger()->info("Episode {} finished after {} steps ({}): reward {:.2f}, progress {:.1f}/{:.1f} m",
                       episode_count_, step_count_, to_string(outcome.reason),
                       accumulated_reward_, progress_, path_.length());
    }

    return result;
}

PerceptionParams AUVEnvironment::perception_params() const {
    PerceptionParams params;
    params.los_dist = config_.los_dist;
    params.obst_range = config_.obst_range;
    return params;
}

}  // namespace auv_sim
