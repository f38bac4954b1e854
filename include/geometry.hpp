/**
 * @file geometry.hpp
 * @brief Planar geometry helpers shared by the path, vehicle and perception code.
 */

#ifndef AUV_SIM_GEOMETRY_HPP
#define AUV_SIM_GEOMETRY_HPP

#include <Eigen/Dense>
#include <cmath>

namespace auv_sim {

/**
 * @brief Map an angle to the principal range (-pi, pi].
 * @param angle Angle [rad]
 * @return Equivalent angle in (-pi, pi]
 */
double wrap_to_principal(double angle);

/**
 * @brief Rotation about the vertical (z) axis.
 *
 * rotation_z(psi) * [u, v, r] gives the world-frame pose rate of a body-frame
 * velocity; rotation_z(-heading) * [dx, dy, 0] expresses a world vector in a
 * frame aligned with heading (index 0 along, index 1 lateral).
 *
 * @param angle Rotation angle [rad]
 * @return 3x3 rotation matrix
 */
Eigen::Matrix3d rotation_z(double angle);

/**
 * @brief Express a world-frame planar vector in a frame rotated by angle.
 * @param vec World-frame vector
 * @param angle Frame orientation [rad]
 * @return Vector in the rotated frame
 */
Eigen::Vector2d to_frame(const Eigen::Vector2d& vec, double angle);

}  // namespace auv_sim

#endif  // AUV_SIM_GEOMETRY_HPP
