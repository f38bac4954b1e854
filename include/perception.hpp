/**
 * @file perception.hpp
 * @brief Observation model: vehicle, path and obstacles to a bounded vector.
 *
 * Layout (see ObservationIndex):
 * - 0: surge / max speed, [0, 1]
 * - 1: sway / kSwayScale, [-1, 1]
 * - 2: heading error to the look-ahead direction / pi, [-1, 1]
 * - 3: cross-track error / los distance, [-1, 1]
 * - 4, 5: last propeller and rudder action
 * - 6..13: closest obstacle per bearing sector, 0 (none) to 1 (touching)
 */

#ifndef AUV_SIM_PERCEPTION_HPP
#define AUV_SIM_PERCEPTION_HPP

#include "dynamics.hpp"
#include "obstacles.hpp"
#include "reference_path.hpp"
#include "types.hpp"
#include <array>

namespace auv_sim {

constexpr double kSwayScale = 0.2;  ///< Sway velocity normalization [m/s]

/**
 * @brief Parameters of the observation model.
 */
struct PerceptionParams {
    double los_dist = 100.0;    ///< Line-of-sight look-ahead distance [m]
    double obst_range = 50.0;   ///< Obstacle detection range [m]
};

using SectorCloseness = std::array<double, kNumSectors>;

/**
 * @brief Sector index of a bearing relative to the vehicle heading.
 *
 * The wrapped bearing is remapped to [0, 1) by (bearing + pi) / (2 pi), so a
 * bearing of 0 (straight ahead) falls into sector kNumSectors / 2.
 */
int bearing_sector(double bearing);

/**
 * @brief Closeness of each sector to the nearest obstacle in it.
 *
 * Distances are taken in the heading-aligned frame. Obstacles farther than
 * obst_range + radius are ignored; each sector keeps the maximum of
 * 1 - clamp((d - r_vehicle - r_obstacle) / obst_range, 0, 1).
 *
 * @param position Vehicle position
 * @param heading Vehicle heading [rad]
 * @param vehicle_radius Hull radius [m]
 * @param obstacles Obstacle field
 * @param obst_range Detection range [m]
 */
SectorCloseness sector_closeness(const Eigen::Vector2d& position,
                                 double heading,
                                 double vehicle_radius,
                                 const ObstacleField& obstacles,
                                 double obst_range);

/**
 * @brief Heading error to the path direction los_dist ahead of progress.
 * @return Wrapped angle in (-pi, pi]
 */
double heading_error(const AUV2D& vehicle, const ReferencePath& path,
                     double progress, double los_dist);

/**
 * @brief Build the full observation vector.
 * @param vehicle Vehicle after the current step
 * @param path Reference path
 * @param obstacles Obstacle field
 * @param progress Arc length of the closest path point
 * @param last_action Raw action applied on the current step
 * @param params Observation parameters
 */
Observation observe(const AUV2D& vehicle,
                    const ReferencePath& path,
                    const ObstacleField& obstacles,
                    double progress,
                    const Eigen::Vector2d& last_action,
                    const PerceptionParams& params);

}  // namespace auv_sim

#endif  // AUV_SIM_PERCEPTION_HPP
