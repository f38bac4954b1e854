/**
 * @file obstacles.hpp
 * @brief Static obstacle field of an episode.
 */

#ifndef AUV_SIM_OBSTACLES_HPP
#define AUV_SIM_OBSTACLES_HPP

#include "reference_path.hpp"
#include "types.hpp"
#include <optional>
#include <random>
#include <vector>

namespace auv_sim {

/**
 * @brief Immutable set of circular obstacles.
 */
class ObstacleField {
public:
    ObstacleField() = default;

    /**
     * @param obstacles Obstacles of the episode
     * @throws std::invalid_argument on a non-positive or non-finite radius
     */
    explicit ObstacleField(std::vector<Obstacle> obstacles);

    /**
     * @brief Scatter obstacles along the back 90% of a path.
     *
     * Each center is the path position at 0.9 * length * (U + 0.1), offset by
     * up to +/-12.5 m per axis; radii are uniform in [5, 15].
     */
    static ObstacleField scatter_along_path(const ReferencePath& path, int count,
                                            std::mt19937& rng);

    /**
     * @brief Index of the first obstacle overlapping a disc, if any.
     */
    std::optional<size_t> first_collision(const Eigen::Vector2d& position,
                                          double radius) const;

    const std::vector<Obstacle>& obstacles() const { return obstacles_; }
    size_t size() const { return obstacles_.size(); }
    bool empty() const { return obstacles_.empty(); }

    std::vector<Obstacle>::const_iterator begin() const { return obstacles_.begin(); }
    std::vector<Obstacle>::const_iterator end() const { return obstacles_.end(); }

private:
    std::vector<Obstacle> obstacles_;
};

}  // namespace auv_sim

#endif  // AUV_SIM_OBSTACLES_HPP
