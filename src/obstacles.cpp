/**
 * @file obstacles.cpp
 * @brief Implementation of the static obstacle field.
 */

#include "obstacles.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace auv_sim {

ObstacleField::ObstacleField(std::vector<Obstacle> obstacles)
    : obstacles_(std::move(obstacles)) {
    for (size_t i = 0; i < obstacles_.size(); ++i) {
        const Obstacle& obst = obstacles_[i];
        if (!(obst.radius > 0) || !std::isfinite(obst.radius) || !obst.position.allFinite()) {
            throw std::invalid_argument("obstacle " + std::to_string(i) +
                                        " must have a finite position and positive radius");
        }
    }
}

ObstacleField ObstacleField::scatter_along_path(const ReferencePath& path, int count,
                                                std::mt19937& rng) {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    std::vector<Obstacle> obstacles;
    obstacles.reserve(count > 0 ? count : 0);

    for (int i = 0; i < count; ++i) {
        double s = 0.9 * path.length() * (uniform(rng) + 0.1);
        double dx = uniform(rng) - 0.5;
        double dy = uniform(rng) - 0.5;
        Eigen::Vector2d position = path.position(s) + 25.0 * Eigen::Vector2d(dx, dy);
        double radius = 10.0 * (uniform(rng) + 0.5);
        obstacles.emplace_back(position, radius);
    }

    return ObstacleField(std::move(obstacles));
}

std::optional<size_t> ObstacleField::first_collision(const Eigen::Vector2d& position,
                                                     double radius) const {
    for (size_t i = 0; i < obstacles_.size(); ++i) {
        double dist = (obstacles_[i].position - position).norm();
        if (dist < radius + obstacles_[i].radius) {
            return i;
        }
    }
    return std::nullopt;
}

}  // namespace auv_sim
