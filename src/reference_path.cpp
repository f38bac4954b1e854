/**
 * @file reference_path.cpp
 * @brief Implementation of the arc-length parametrized reference path.
 */

#include "reference_path.hpp"
#include "bounded_minimizer.hpp"
#include "errors.hpp"
#include "geometry.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace auv_sim {

std::vector<double> arc_lengths(const std::vector<Eigen::Vector2d>& points) {
    std::vector<double> s(points.size(), 0.0);
    for (size_t i = 1; i < points.size(); ++i) {
        s[i] = s[i - 1] + (points[i] - points[i - 1]).norm();
    }
    return s;
}

ReferencePath::ReferencePath(const std::vector<Eigen::Vector2d>& waypoints, PathType type)
    : waypoints_(waypoints), total_length_(0), path_type_(type), reversed_(false) {
    if (waypoints.size() < 2) {
        throw GeometryError("path needs at least two waypoints, got " +
                            std::to_string(waypoints.size()));
    }
    for (const auto& p : waypoints) {
        if (!p.allFinite()) {
            throw GeometryError("non-finite waypoint");
        }
    }

    std::vector<Eigen::Vector2d> current = waypoints;
    std::vector<double> s;

    for (int pass = 0; pass < kSmoothingPasses; ++pass) {
        s = arc_lengths(current);
        coords_ = PchipInterpolator(s, current);

        std::vector<Eigen::Vector2d> resampled(kSampleCount);
        double s0 = s.front();
        double s1 = s.back();
        for (int i = 0; i < kSampleCount; ++i) {
            double t = s0 + (s1 - s0) * i / (kSampleCount - 1);
            resampled[i] = coords_(t);
        }
        current = std::move(resampled);
    }

    total_length_ = s.back();
    if (!(total_length_ > 0) || !std::isfinite(total_length_)) {
        throw GeometryError("path has zero or non-finite length");
    }

    sample_points();
}

ReferencePath ReferencePath::create_straight(const Eigen::Vector2d& start,
                                             const Eigen::Vector2d& end) {
    return ReferencePath({start, end}, PathType::STRAIGHT);
}

std::vector<Eigen::Vector2d> ReferencePath::random_waypoints_through_origin(
    std::mt19937& rng,
    int nwaypoints,
    double length
) {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    double angle_init = 2 * M_PI * (uniform(rng) - 0.5);
    Eigen::Vector2d start(0.5 * length * std::cos(angle_init),
                          0.5 * length * std::sin(angle_init));
    Eigen::Vector2d end = -start;

    std::vector<Eigen::Vector2d> waypoints = {start, end};
    int rounds = nwaypoints / 2;

    for (int i = 0; i < rounds; ++i) {
        double scale = static_cast<double>(rounds - i) / (rounds + 1);
        double spread = length / (rounds + 1);

        Eigen::Vector2d p1 = scale * start +
                             Eigen::Vector2d::Constant(spread * (uniform(rng) - 0.5));
        Eigen::Vector2d p2 = scale * end +
                             Eigen::Vector2d::Constant(spread * (uniform(rng) - 0.5));

        // Keep the outer i+1 points on each side, replace the middle
        std::vector<Eigen::Vector2d> next(waypoints.begin(), waypoints.begin() + i + 1);
        next.push_back(p1);
        next.push_back(Eigen::Vector2d::Zero());
        next.push_back(p2);
        next.insert(next.end(), waypoints.end() - (i + 1), waypoints.end());
        waypoints = std::move(next);
    }

    return waypoints;
}

ReferencePath ReferencePath::create_random_through_origin(std::mt19937& rng,
                                                          int nwaypoints,
                                                          double length) {
    return ReferencePath(random_waypoints_through_origin(rng, nwaypoints, length),
                         PathType::RANDOM_THROUGH_ORIGIN);
}

double ReferencePath::curve_parameter(double s) const {
    return reversed_ ? total_length_ - s : s;
}

Eigen::Vector2d ReferencePath::position(double s) const {
    return coords_(curve_parameter(s));
}

Eigen::Vector2d ReferencePath::tangent(double s) const {
    Eigen::Vector2d d = coords_.derivative(curve_parameter(s));
    return reversed_ ? Eigen::Vector2d(-d) : d;
}

double ReferencePath::direction(double s) const {
    Eigen::Vector2d d = tangent(s);
    return std::atan2(d.y(), d.x());
}

Eigen::Vector2d ReferencePath::endpoint() const {
    return position(total_length_);
}

double ReferencePath::closest_arc_length(const Eigen::Vector2d& position) const {
    if (points_.empty()) {
        throw GeometryError("closest point query on an empty path");
    }

    // Nearest polyline sample
    size_t best = 0;
    double min_dist = std::numeric_limits<double>::max();
    for (size_t i = 0; i < points_.size(); ++i) {
        double dist = (position - points_[i].position).squaredNorm();
        if (dist < min_dist) {
            min_dist = dist;
            best = i;
        }
    }

    double lower = points_[best == 0 ? 0 : best - 1].s;
    double upper = points_[std::min(best + 1, points_.size() - 1)].s;

    MinimizeResult result = minimize_bounded(
        [this, &position](double s) { return (this->position(s) - position).norm(); },
        lower, upper, kClosestPointTolerance, kClosestPointMaxEvaluations);

    if (!result.converged) {
        throw GeometryError("closest point search did not converge after " +
                            std::to_string(result.evaluations) + " evaluations");
    }
    return result.x;
}

std::pair<Eigen::Vector2d, double> ReferencePath::closest_point(
    const Eigen::Vector2d& position) const {
    double s = closest_arc_length(position);
    return {this->position(s), s};
}

ClosestPoint ReferencePath::closest_point_distance(const Eigen::Vector2d& position) const {
    auto [point, s] = closest_point(position);
    return ClosestPoint{(point - position).norm(), point, s};
}

double ReferencePath::cross_track_error(const Eigen::Vector2d& position, double s) const {
    Eigen::Vector2d to_path = this->position(s) - position;
    return to_frame(to_path, direction(s)).y();
}

ReferencePath ReferencePath::reversed() const {
    ReferencePath path(*this);
    path.reversed_ = !reversed_;
    std::reverse(path.waypoints_.begin(), path.waypoints_.end());
    path.sample_points();
    return path;
}

void ReferencePath::sample_points() {
    points_.clear();
    points_.reserve(kSampleCount);
    for (int i = 0; i < kSampleCount; ++i) {
        double s = total_length_ * i / (kSampleCount - 1);
        points_.emplace_back(position(s), direction(s), s);
    }
}

}  // namespace auv_sim
