/**
 * @file run_episode.cpp
 * @brief Run episodes of the AUV environment with a line-of-sight controller.
 *
 * Usage: run_episode [config.yaml] [episodes] [max_steps]
 *
 * This example shows how to:
 * 1. Load the environment configuration
 * 2. Reset and step the environment
 * 3. Read progress, reward and termination
 */

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "environment.hpp"
#include "logging.hpp"

using namespace auv_sim;

namespace {

/**
 * @brief Steer toward the look-ahead direction, away from close obstacles ahead.
 */
Eigen::Vector2d los_controller(const Observation& obs) {
    double rudder = 2.0 * obs(kHeadingError);

    // Sectors left and right of straight ahead
    double ahead_right = obs(kFirstSector + kNumSectors / 2 - 1);
    double ahead_left = obs(kFirstSector + kNumSectors / 2);
    if (std::max(ahead_left, ahead_right) > 0.4) {
        rudder += (ahead_left > ahead_right) ? -0.8 : 0.8;
    }

    return Eigen::Vector2d(0.8, std::clamp(rudder, -1.0, 1.0));
}

}  // anonymous namespace

int main(int argc, char** argv) {
    std::string config_path = argc > 1 ? argv[1] : "config/auv_env.yaml";
    int num_episodes = argc > 2 ? std::atoi(argv[2]) : 3;
    int max_steps = argc > 3 ? std::atoi(argv[3]) : 20000;

    spdlog::set_level(spdlog::level::info);
    logger()->set_level(spdlog::level::info);

    // Step 1: Load configuration
    AUVEnvConfig config;
    try {
        config = AUVEnvConfig::from_yaml_file(config_path);
    } catch (const ConfigError& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 1;
    }

    spdlog::info("Configuration:");
    spdlog::info("  Timestep: {} s", config.t_step);
    spdlog::info("  Obstacles: {}", config.nobstacles);
    spdlog::info("  LOS distance: {} m, obstacle range: {} m", config.los_dist, config.obst_range);
    spdlog::info("  Cruise speed: {} m/s", config.cruise_speed);

    // Step 2: Create the environment (generates the first episode)
    AUVEnvironment env(config);

    std::cout << std::endl;
    std::cout << std::setw(8) << "Episode"
              << std::setw(10) << "Steps"
              << std::setw(12) << "Reward"
              << std::setw(12) << "Progress"
              << std::setw(12) << "Length"
              << std::setw(16) << "Outcome" << std::endl;
    std::cout << std::string(70, '-') << std::endl;

    for (int episode = 0; episode < num_episodes; ++episode) {
        // Step 3: Reset and run until done
        Observation obs = episode == 0 ? env.reset(config.seed) : env.reset();
        double total_reward = 0.0;
        bool done = false;

        try {
            while (!done && env.step_count() < max_steps) {
                StepResult result = env.step(los_controller(obs));
                obs = result.observation;
                total_reward += result.reward;
                done = result.done;
            }
        } catch (const GeometryError& e) {
            spdlog::error("Episode {} aborted: {}", episode + 1, e.what());
            continue;
        }

        // Step 4: Report
        std::cout << std::setw(8) << episode + 1
                  << std::setw(10) << env.step_count()
                  << std::setw(12) << std::fixed << std::setprecision(2) << total_reward
                  << std::setw(12) << env.progress()
                  << std::setw(12) << env.path().length()
                  << std::setw(16) << (done ? to_string(env.termination_reason()) : "step_limit")
                  << std::endl;
    }

    std::cout << std::endl;
    spdlog::info("Example complete!");

    return 0;
}
