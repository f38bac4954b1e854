/**
 * @file test_environment.cpp
 * @brief Tests for perception, reward and the episode lifecycle.
 *
 * Hand-built scenarios are loaded with AUVEnvironment::load_scenario so the
 * expected observations and rewards can be computed in closed form.
 */

#include <iostream>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>

#include "environment.hpp"
#include "geometry.hpp"
#include "logging.hpp"
#include "perception.hpp"
#include "reward.hpp"

using namespace auv_sim;

// Simple test macros
#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "..." << std::flush; \
    try { \
        test_##name(); \
        std::cout << " PASSED" << std::endl; \
        passed++; \
    } catch (const std::exception& e) { \
        std::cout << " FAILED: " << e.what() << std::endl; \
        failed++; \
    } \
} while(0)

#define ASSERT_TRUE(cond) do { \
    if (!(cond)) throw std::runtime_error("Assertion failed: " #cond); \
} while(0)

#define ASSERT_FALSE(cond) ASSERT_TRUE(!(cond))

#define ASSERT_NEAR(a, b, tol) do { \
    if (std::abs((a) - (b)) > (tol)) { \
        throw std::runtime_error("Assertion failed: abs(" #a " - " #b ") <= " #tol); \
    } \
} while(0)

#define ASSERT_EQ(a, b) ASSERT_TRUE((a) == (b))

#define ASSERT_THROWS(expr, exc) do { \
    bool threw_ = false; \
    try { expr; } catch (const exc&) { threw_ = true; } \
    if (!threw_) throw std::runtime_error("Expected " #exc " from " #expr); \
} while(0)

namespace {

AUVEnvConfig make_config() {
    AUVEnvConfig config;
    config.reward_ds = 1.0;
    config.reward_closeness = -0.5;
    config.reward_surge_error = -0.1;
    config.reward_cross_track_error = -0.5;
    config.reward_collision = -100.0;
    config.nobstacles = 20;
    config.los_dist = 100.0;
    config.obst_range = 50.0;
    config.t_step = 0.1;
    config.cruise_speed = 1.0;
    return config;
}

bool observation_in_bounds(const Observation& obs) {
    if (!obs.allFinite()) {
        return false;
    }
    if (obs(kSurge) < 0.0 || obs(kSurge) > 1.0 ||
        obs(kPropellerAction) < 0.0 || obs(kPropellerAction) > 1.0) {
        return false;
    }
    for (int i : {kSway, kHeadingError, kCrossTrackError, kRudderAction}) {
        if (std::abs(obs(i)) > 1.0) {
            return false;
        }
    }
    for (int i = kFirstSector; i < kObservationSize; ++i) {
        if (obs(i) < 0.0 || obs(i) > 1.0) {
            return false;
        }
    }
    return true;
}

}  // namespace

// =============================================================================
// Test Perception
// =============================================================================

TEST(bearing_sectors) {
    ASSERT_EQ(bearing_sector(0.0), kNumSectors / 2);
    ASSERT_EQ(bearing_sector(-0.1), kNumSectors / 2 - 1);
    ASSERT_EQ(bearing_sector(M_PI / 2), 6);
    ASSERT_EQ(bearing_sector(-M_PI / 2), 2);
    ASSERT_EQ(bearing_sector(M_PI), kNumSectors - 1);
    ASSERT_EQ(bearing_sector(-M_PI + 0.01), 0);
    ASSERT_EQ(bearing_sector(2 * M_PI + 0.05), kNumSectors / 2);
}

TEST(obstacle_ahead_lights_forward_sector) {
    ObstacleField field({Obstacle(20.0, 0.0, 5.0)});
    SectorCloseness closeness = sector_closeness(
        Eigen::Vector2d(0.0, 0.0), 0.0, 2.0, field, 50.0);

    // 1 - (20 - 2 - 5) / 50
    ASSERT_NEAR(closeness[4], 0.74, 1e-12);
    for (int i = 0; i < kNumSectors; ++i) {
        if (i != 4) {
            ASSERT_EQ(closeness[i], 0.0);
        }
    }

    // Rotating the vehicle moves the obstacle to the starboard side
    SectorCloseness turned = sector_closeness(
        Eigen::Vector2d(0.0, 0.0), M_PI / 2, 2.0, field, 50.0);
    ASSERT_NEAR(turned[2], 0.74, 1e-12);
    ASSERT_EQ(turned[4], 0.0);
}

TEST(sector_keeps_closest_obstacle) {
    ObstacleField field({Obstacle(40.0, 1.0, 2.0), Obstacle(10.0, 0.5, 1.0)});
    SectorCloseness closeness = sector_closeness(
        Eigen::Vector2d(0.0, 0.0), 0.0, 2.0, field, 50.0);

    double near_dist = Eigen::Vector2d(10.0, 0.5).norm();
    ASSERT_NEAR(closeness[4], 1.0 - (near_dist - 3.0) / 50.0, 1e-12);
}

TEST(far_and_touching_obstacles) {
    ObstacleField far({Obstacle(200.0, 0.0, 5.0), Obstacle(0.0, -55.0, 5.0)});
    SectorCloseness none = sector_closeness(Eigen::Vector2d(0.0, 0.0), 0.0, 2.0, far, 50.0);
    for (double c : none) {
        ASSERT_EQ(c, 0.0);
    }

    ObstacleField touching({Obstacle(-3.0, 0.0, 2.0)});
    SectorCloseness full = sector_closeness(Eigen::Vector2d(0.0, 0.0), 0.0, 2.0, touching, 50.0);
    ASSERT_EQ(full[kNumSectors - 1], 1.0);
}

TEST(initial_observation_from_scenario) {
    AUVEnvironment env(make_config());
    ReferencePath path = ReferencePath::create_straight(
        Eigen::Vector2d(0.0, 0.0), Eigen::Vector2d(300.0, 0.0));
    ObstacleField field({Obstacle(20.0, 0.0, 5.0), Obstacle(-200.0, 0.0, 5.0)});

    Observation obs = env.load_scenario(path, field, Eigen::Vector3d(0.0, 0.0, 0.0));

    ASSERT_EQ(env.phase(), EpisodePhase::ACTIVE);
    ASSERT_EQ(env.step_count(), 0);
    ASSERT_NEAR(obs(kSurge), 0.0, 1e-12);
    ASSERT_NEAR(obs(kHeadingError), 0.0, 1e-9);
    ASSERT_NEAR(obs(kCrossTrackError), 0.0, 1e-9);
    ASSERT_NEAR(obs(kFirstSector + 4), 0.74, 1e-12);
    ASSERT_EQ(obs(kFirstSector + 0), 0.0);
    ASSERT_EQ(obs(kFirstSector + kNumSectors - 1), 0.0);
}

TEST(observation_clamps_actions) {
    AUVEnvironment env(make_config());
    ReferencePath path = ReferencePath::create_straight(
        Eigen::Vector2d(0.0, 0.0), Eigen::Vector2d(300.0, 0.0));
    env.load_scenario(path, ObstacleField(), Eigen::Vector3d(0.0, 0.0, 0.0));

    StepResult result = env.step(Eigen::Vector2d(3.0, -7.0));
    ASSERT_EQ(result.observation(kPropellerAction), 1.0);
    ASSERT_EQ(result.observation(kRudderAction), -1.0);
    ASSERT_TRUE(env.last_action() == Eigen::Vector2d(3.0, -7.0));
    ASSERT_NEAR(env.vehicle().input().rudder, -hydro::kRudderMax, 1e-12);
}

TEST(observation_bounds_random_episodes) {
    AUVEnvironment env(make_config());
    std::mt19937 rng(99);
    std::uniform_real_distribution<double> action(-2.0, 2.0);

    for (int episode = 0; episode < 3; ++episode) {
        Observation obs = env.reset();
        ASSERT_TRUE(observation_in_bounds(obs));
        ASSERT_EQ(env.obstacles().size(), 20u);

        for (int i = 0; i < 400; ++i) {
            StepResult result = env.step(Eigen::Vector2d(action(rng), action(rng)));
            ASSERT_TRUE(observation_in_bounds(result.observation));
            ASSERT_TRUE(std::isfinite(result.reward));
            ASSERT_TRUE(result.info.empty());
            if (result.done) {
                break;
            }
        }
    }
}

// =============================================================================
// Test Reward and Termination
// =============================================================================

TEST(straight_run_reaches_goal) {
    AUVEnvironment env(make_config());
    ReferencePath path = ReferencePath::create_straight(
        Eigen::Vector2d(0.0, 0.0), Eigen::Vector2d(100.0, 0.0));
    env.load_scenario(path, ObstacleField(), Eigen::Vector3d(0.0, 0.0, 0.0));

    double prev_x = 0.0;
    double prev_progress = 0.0;
    double total = 0.0;
    bool done = false;

    for (int i = 0; i < 3000 && !done; ++i) {
        StepResult result = env.step(Eigen::Vector2d(1.0, 0.0));
        total += result.reward;
        done = result.done;

        // Starting from rest, the first Euler step leaves x unchanged
        if (i == 0) {
            ASSERT_NEAR(env.vehicle().position().x(), 0.0, 1e-12);
        } else {
            ASSERT_TRUE(env.vehicle().position().x() > prev_x);
        }
        ASSERT_NEAR(env.vehicle().position().y(), 0.0, 1e-9);
        ASSERT_TRUE(env.progress() >= prev_progress - 1e-6);
        prev_x = env.vehicle().position().x();
        prev_progress = env.progress();
    }

    ASSERT_TRUE(done);
    ASSERT_EQ(env.phase(), EpisodePhase::DONE);
    ASSERT_EQ(env.termination_reason(), TerminationReason::GOAL_REACHED);
    ASSERT_TRUE(env.vehicle().position().x() > 90.0);
    ASSERT_TRUE(env.vehicle().position().x() < 91.0);
    ASSERT_NEAR(env.accumulated_reward(), total, 1e-9);
}

TEST(divergence_ends_episode) {
    AUVEnvConfig config = make_config();
    config.reward_ds = 0.0;
    config.reward_closeness = -10.0;
    AUVEnvironment env(config);

    // Four obstacles 5 m away in the port, starboard, bow and stern sectors
    ObstacleField field({
        Obstacle(5.0, 0.0, 2.0), Obstacle(0.0, 5.0, 2.0),
        Obstacle(-5.0, 0.0, 2.0), Obstacle(0.0, -5.0, 2.0)
    });
    ReferencePath path = ReferencePath::create_straight(
        Eigen::Vector2d(-200.0, 0.0), Eigen::Vector2d(200.0, 0.0));
    env.load_scenario(path, field, Eigen::Vector3d(0.0, 0.0, 0.0));

    // Stationary vehicle: closeness 0.98 in four sectors plus the surge deficit
    const double expected_step = -10.0 * 4 * 0.98 * 0.98 - 0.1 * 0.5;

    double total = 0.0;
    int steps = 0;
    bool done = false;
    while (!done) {
        StepResult result = env.step(Eigen::Vector2d(0.0, 0.0));
        steps++;
        total += result.reward;
        done = result.done;

        ASSERT_NEAR(result.reward, expected_step, 1e-9);
        ASSERT_EQ(done, total < RewardFunction::kDivergenceFloor);
        ASSERT_TRUE(steps <= 8);
    }

    ASSERT_EQ(steps, 8);
    ASSERT_EQ(env.termination_reason(), TerminationReason::DIVERGED);
    ASSERT_EQ(env.step_count(), 8);
}

TEST(collision_terminates_when_enabled) {
    AUVEnvConfig config = make_config();
    config.terminate_on_collision = true;
    AUVEnvironment env(config);

    ReferencePath path = ReferencePath::create_straight(
        Eigen::Vector2d(0.0, 0.0), Eigen::Vector2d(400.0, 0.0));
    ObstacleField field({Obstacle(3.0, 0.0, 2.0)});
    env.load_scenario(path, field, Eigen::Vector3d(0.0, 0.0, 0.0));

    StepResult result = env.step(Eigen::Vector2d(0.0, 0.0));
    ASSERT_TRUE(result.done);
    ASSERT_EQ(env.termination_reason(), TerminationReason::COLLISION);
    // Collision penalty plus a fully lit bow sector; no progress or tracking terms
    ASSERT_NEAR(result.reward, -100.0 - 0.5, 1e-9);

    ASSERT_THROWS(env.step(Eigen::Vector2d(0.0, 0.0)), std::logic_error);
}

TEST(collision_ignored_by_default) {
    AUVEnvironment env(make_config());

    ReferencePath path = ReferencePath::create_straight(
        Eigen::Vector2d(0.0, 0.0), Eigen::Vector2d(400.0, 0.0));
    ObstacleField field({Obstacle(3.0, 0.0, 2.0)});
    env.load_scenario(path, field, Eigen::Vector3d(0.0, 0.0, 0.0));

    ASSERT_TRUE(field.first_collision(Eigen::Vector2d(0.0, 0.0), env.vehicle().radius()).has_value());

    StepResult result = env.step(Eigen::Vector2d(0.0, 0.0));
    ASSERT_FALSE(result.done);
    ASSERT_EQ(env.termination_reason(), TerminationReason::NONE);
    ASSERT_EQ(env.phase(), EpisodePhase::ACTIVE);
}

TEST(reward_function_terms) {
    AUVEnvConfig config = make_config();
    RewardFunction reward(config);

    RewardInput input;
    input.observation(kSurge) = 0.25;
    input.observation(kCrossTrackError) = -0.2;
    input.observation(kFirstSector + 1) = 0.5;
    input.delta_progress = 0.3;
    input.progress = 50.0;
    input.path_length = 400.0;
    input.distance_to_endpoint = 300.0;
    input.max_speed = 2.0;

    RewardOutcome outcome = reward.evaluate(input);
    ASSERT_FALSE(outcome.done);
    double expected = 0.3 - 0.5 * 0.25 - 0.5 * 0.2 - 0.1 * 0.25;
    ASSERT_NEAR(outcome.reward, expected, 1e-12);

    // Path completion takes precedence and drops progress and tracking terms
    input.progress = 399.5;
    outcome = reward.evaluate(input);
    ASSERT_TRUE(outcome.done);
    ASSERT_EQ(outcome.reason, TerminationReason::PATH_COMPLETED);
    ASSERT_NEAR(outcome.reward, -0.5 * 0.25, 1e-12);

    input.progress = 395.0;
    input.distance_to_endpoint = 5.0;
    outcome = reward.evaluate(input);
    ASSERT_EQ(outcome.reason, TerminationReason::GOAL_REACHED);
}

// =============================================================================
// Test Episode Lifecycle
// =============================================================================

TEST(reset_reproducible_with_seed) {
    AUVEnvConfig config = make_config();
    config.seed = 7;
    AUVEnvironment env(config);
    std::vector<Eigen::Vector2d> initial = env.path().waypoints();
    Eigen::Vector3d initial_pose(env.vehicle().position().x(), env.vehicle().position().y(),
                                 env.vehicle().heading());

    Observation first = env.reset(7);
    ASSERT_EQ(env.path().waypoints().size(), initial.size());
    for (size_t i = 0; i < initial.size(); ++i) {
        ASSERT_TRUE(env.path().waypoints()[i] == initial[i]);
    }
    ASSERT_EQ(env.vehicle().heading(), initial_pose(2));

    // Without a seed the draws continue
    env.reset();
    ASSERT_FALSE(env.path().waypoints()[0] == initial[0]);

    Observation again = env.reset(7);
    ASSERT_TRUE(first == again);
    ASSERT_EQ(env.path().path_type(), ReferencePath::PathType::RANDOM_THROUGH_ORIGIN);
}

TEST(generated_episode_layout) {
    AUVEnvironment env(make_config());
    for (int episode = 0; episode < 5; ++episode) {
        env.reset();
        const ReferencePath& path = env.path();

        ASSERT_EQ(path.waypoints().size(), 9u);
        ASSERT_NEAR(path.waypoints().front().norm(), 200.0, 1e-9);
        ASSERT_TRUE((env.vehicle().position() - path.position(0)).lpNorm<Eigen::Infinity>() <= 1.0);
        ASSERT_NEAR(wrap_to_principal(env.vehicle().heading() - path.direction(0)), 0.0, 0.05 + 1e-12);

        for (const auto& obst : env.obstacles()) {
            ASSERT_TRUE(obst.radius >= 5.0 && obst.radius <= 15.0);
        }
    }
}

TEST(reset_after_done_starts_new_episode) {
    AUVEnvConfig config = make_config();
    config.terminate_on_collision = true;
    AUVEnvironment env(config);

    ReferencePath path = ReferencePath::create_straight(
        Eigen::Vector2d(0.0, 0.0), Eigen::Vector2d(400.0, 0.0));
    env.load_scenario(path, ObstacleField({Obstacle(3.0, 0.0, 2.0)}), Eigen::Vector3d::Zero());
    ASSERT_TRUE(env.step(Eigen::Vector2d::Zero()).done);

    env.reset();
    ASSERT_EQ(env.phase(), EpisodePhase::ACTIVE);
    ASSERT_EQ(env.termination_reason(), TerminationReason::NONE);
    ASSERT_EQ(env.step_count(), 0);
    ASSERT_EQ(env.accumulated_reward(), 0.0);
    ASSERT_EQ(env.progress(), 0.0);
    env.step(Eigen::Vector2d(0.5, 0.0));
    ASSERT_EQ(env.step_count(), 1);
}

TEST(scenario_requires_built_path) {
    AUVEnvironment env(make_config());
    const double length = env.path().length();

    ASSERT_THROWS(env.load_scenario(ReferencePath(), ObstacleField(), Eigen::Vector3d::Zero()),
                  GeometryError);

    ReferencePath path = ReferencePath::create_straight(
        Eigen::Vector2d(0.0, 0.0), Eigen::Vector2d(300.0, 0.0));
    ASSERT_THROWS(env.load_scenario(path, ObstacleField(),
                                    Eigen::Vector3d(0.0, std::nan(""), 0.0)),
                  std::invalid_argument);

    // The generated episode is left in place
    ASSERT_EQ(env.phase(), EpisodePhase::ACTIVE);
    ASSERT_EQ(env.path().length(), length);
    ASSERT_EQ(env.step_count(), 0);
}

TEST(non_finite_action_rejected) {
    AUVEnvironment env(make_config());
    ReferencePath path = ReferencePath::create_straight(
        Eigen::Vector2d(0.0, 0.0), Eigen::Vector2d(300.0, 0.0));
    env.load_scenario(path, ObstacleField(), Eigen::Vector3d::Zero());

    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    ASSERT_THROWS(env.step(Eigen::Vector2d(nan, 0.0)), std::invalid_argument);
    ASSERT_THROWS(env.step(Eigen::Vector2d(0.5, -inf)), std::invalid_argument);

    // Rejected actions leave the episode untouched
    ASSERT_EQ(env.phase(), EpisodePhase::ACTIVE);
    ASSERT_EQ(env.step_count(), 0);
    ASSERT_TRUE(env.last_action() == Eigen::Vector2d::Zero());
    ASSERT_EQ(env.vehicle().path_taken().size(), 1u);

    StepResult result = env.step(Eigen::Vector2d(1.0, 0.0));
    ASSERT_TRUE(observation_in_bounds(result.observation));
    ASSERT_EQ(env.step_count(), 1);
}

TEST(failed_projection_ends_episode) {
    // A timestep this large overflows the position on the second step, so the
    // closest-point search cannot converge
    AUVEnvConfig config = make_config();
    config.t_step = 1e100;
    AUVEnvironment env(config);

    ReferencePath path = ReferencePath::create_straight(
        Eigen::Vector2d(0.0, 0.0), Eigen::Vector2d(300.0, 0.0));
    env.load_scenario(path, ObstacleField(), Eigen::Vector3d::Zero());

    StepResult first = env.step(Eigen::Vector2d(1.0, 0.0));
    ASSERT_FALSE(first.done);
    ASSERT_TRUE(observation_in_bounds(first.observation));

    ASSERT_THROWS(env.step(Eigen::Vector2d(1.0, 0.0)), GeometryError);
    ASSERT_EQ(env.phase(), EpisodePhase::DONE);
    ASSERT_THROWS(env.step(Eigen::Vector2d(1.0, 0.0)), std::logic_error);

    env.load_scenario(path, ObstacleField(), Eigen::Vector3d::Zero());
    ASSERT_EQ(env.phase(), EpisodePhase::ACTIVE);
}

TEST(invalid_config_rejected) {
    ASSERT_THROWS(AUVEnvironment{AUVEnvConfig{}}, ConfigError);

    AUVEnvConfig config = make_config();
    config.obst_range = -1.0;
    try {
        AUVEnvironment env(config);
        throw std::runtime_error("negative obst_range accepted");
    } catch (const ConfigError& e) {
        ASSERT_EQ(e.key(), std::string("obst_range"));
    }

    ASSERT_THROWS(ObstacleField({Obstacle(0.0, 0.0, -1.0)}), std::invalid_argument);
}

// =============================================================================
// Main
// =============================================================================

int main() {
    int passed = 0;
    int failed = 0;

    logger()->set_level(spdlog::level::off);

    std::cout << "Running environment tests...\n" << std::endl;

    // Perception
    RUN_TEST(bearing_sectors);
    RUN_TEST(obstacle_ahead_lights_forward_sector);
    RUN_TEST(sector_keeps_closest_obstacle);
    RUN_TEST(far_and_touching_obstacles);
    RUN_TEST(initial_observation_from_scenario);
    RUN_TEST(observation_clamps_actions);
    RUN_TEST(observation_bounds_random_episodes);

    // Reward and termination
    RUN_TEST(straight_run_reaches_goal);
    RUN_TEST(divergence_ends_episode);
    RUN_TEST(collision_terminates_when_enabled);
    RUN_TEST(collision_ignored_by_default);
    RUN_TEST(reward_function_terms);

    // Lifecycle
    RUN_TEST(reset_reproducible_with_seed);
    RUN_TEST(generated_episode_layout);
    RUN_TEST(reset_after_done_starts_new_episode);
    RUN_TEST(scenario_requires_built_path);
    RUN_TEST(non_finite_action_rejected);
    RUN_TEST(failed_projection_ends_episode);
    RUN_TEST(invalid_config_rejected);

    std::cout << "\n========================================" << std::endl;
    std::cout << "Results: " << passed << " passed, " << failed << " failed" << std::endl;

    return failed > 0 ? 1 : 0;
}
