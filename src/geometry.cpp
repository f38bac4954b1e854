/**
 * @file geometry.cpp
 * @brief Implementation of planar geometry helpers.
 */

#include "geometry.hpp"

namespace auv_sim {

double wrap_to_principal(double angle) {
    double wrapped = std::fmod(angle + M_PI, 2 * M_PI);
    if (wrapped <= 0) {
        wrapped += 2 * M_PI;
    }
    return wrapped - M_PI;
}

Eigen::Matrix3d rotation_z(double angle) {
    double c = std::cos(angle);
    double s = std::sin(angle);

    Eigen::Matrix3d R;
    R << c, -s, 0,
         s,  c, 0,
         0,  0, 1;
    return R;
}

Eigen::Vector2d to_frame(const Eigen::Vector2d& vec, double angle) {
    Eigen::Vector3d rotated = rotation_z(-angle) * Eigen::Vector3d(vec.x(), vec.y(), 0.0);
    return rotated.head<2>();
}

}  // namespace auv_sim
