/**
 * @file perception.cpp
 * @brief Implementation of the observation model.
 */

#include "perception.hpp"
#include "geometry.hpp"
#include <algorithm>
#include <cmath>

namespace auv_sim {

int bearing_sector(double bearing) {
    double ang = (wrap_to_principal(bearing) + M_PI) / (2 * M_PI);
    int sector = static_cast<int>(std::floor(ang * kNumSectors));
    // wrap_to_principal returns pi for -pi, which maps to 1.0
    return std::clamp(sector, 0, kNumSectors - 1);
}

SectorCloseness sector_closeness(const Eigen::Vector2d& position,
                                 double heading,
                                 double vehicle_radius,
                                 const ObstacleField& obstacles,
                                 double obst_range) {
    SectorCloseness closeness;
    closeness.fill(0.0);

    for (const auto& obst : obstacles) {
        Eigen::Vector2d rel = to_frame(obst.position - position, heading);
        double dist = rel.norm();
        if (dist >= obst_range + obst.radius) {
            continue;
        }

        double gap = (dist - vehicle_radius - obst.radius) / obst_range;
        double value = 1.0 - std::clamp(gap, 0.0, 1.0);

        int sector = bearing_sector(std::atan2(rel.y(), rel.x()));
        closeness[sector] = std::max(closeness[sector], value);
    }

    return closeness;
}

double heading_error(const AUV2D& vehicle, const ReferencePath& path,
                     double progress, double los_dist) {
    double target_heading = path.direction(progress + los_dist);
    return wrap_to_principal(target_heading - vehicle.heading());
}

Observation observe(const AUV2D& vehicle,
                    const ReferencePath& path,
                    const ObstacleField& obstacles,
                    double progress,
                    const Eigen::Vector2d& last_action,
                    const PerceptionParams& params) {
    Observation obs = Observation::Zero();

    double cross_track = path.cross_track_error(vehicle.position(), progress);

    obs(kSurge) = std::clamp(vehicle.velocity()(0) / vehicle.max_speed(), 0.0, 1.0);
    obs(kSway) = std::clamp(vehicle.velocity()(1) / kSwayScale, -1.0, 1.0);
    obs(kHeadingError) = std::clamp(
        heading_error(vehicle, path, progress, params.los_dist) / M_PI, -1.0, 1.0);
    obs(kCrossTrackError) = std::clamp(cross_track / params.los_dist, -1.0, 1.0);
    obs(kPropellerAction) = std::clamp(last_action(0), 0.0, 1.0);
    obs(kRudderAction) = std::clamp(last_action(1), -1.0, 1.0);

    SectorCloseness closeness = sector_closeness(
        vehicle.position(), vehicle.heading(), vehicle.radius(), obstacles, params.obst_range);
    for (int i = 0; i < kNumSectors; ++i) {
        obs(kFirstSector + i) = closeness[i];
    }

    return obs;
}

}  // namespace auv_sim
