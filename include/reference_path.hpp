/**
 * @file reference_path.hpp
 * @brief Arc-length parametrized reference path for the vehicle to follow.
 *
 * Waypoints are smoothed by repeatedly fitting a monotone cubic interpolant
 * against cumulative chord length and resampling it uniformly. The result is
 * a C1 curve position(s), s in [0, length], with a dense polyline kept for
 * nearest-point queries.
 */

#ifndef AUV_SIM_REFERENCE_PATH_HPP
#define AUV_SIM_REFERENCE_PATH_HPP

#include "pchip.hpp"
#include <Eigen/Dense>
#include <random>
#include <vector>

namespace auv_sim {

/**
 * @brief Sample of the dense path polyline.
 */
struct PathPoint {
    Eigen::Vector2d position;    ///< Position [x, y]
    double heading;              ///< Tangent angle [rad]
    double s;                    ///< Arc length parameter

    PathPoint() : position(Eigen::Vector2d::Zero()), heading(0), s(0) {}
    PathPoint(const Eigen::Vector2d& pos, double h, double s)
        : position(pos), heading(h), s(s) {}
};

/**
 * @brief Closest point on the path to a query position.
 */
struct ClosestPoint {
    double distance;             ///< Euclidean distance to the query [m]
    Eigen::Vector2d position;    ///< Point on the path
    double s;                    ///< Arc length of the point
};

/**
 * @brief Smooth path parametrized by arc length.
 */
class ReferencePath {
public:
    enum class PathType {
        STRAIGHT,
        RANDOM_THROUGH_ORIGIN,
        CUSTOM
    };

    static constexpr int kSmoothingPasses = 3;      ///< Fit/resample passes
    static constexpr int kSampleCount = 1000;       ///< Samples per resampling
    static constexpr double kClosestPointTolerance = 1e-6;
    static constexpr int kClosestPointMaxEvaluations = 10000;

    ReferencePath() : total_length_(0), path_type_(PathType::CUSTOM), reversed_(false) {}

    /**
     * @brief Build a path from waypoints.
     * @param waypoints Ordered waypoints, at least two, no consecutive duplicates
     * @param type Generation policy tag
     * @throws GeometryError on degenerate waypoints
     */
    explicit ReferencePath(const std::vector<Eigen::Vector2d>& waypoints,
                           PathType type = PathType::CUSTOM);

    /**
     * @brief Create a straight path between two points.
     */
    static ReferencePath create_straight(const Eigen::Vector2d& start,
                                         const Eigen::Vector2d& end);

    /**
     * @brief Create a random curve through the origin.
     *
     * Start and end lie at +/- length/2 along a random heading. Each of the
     * nwaypoints/2 refinement rounds inserts two perturbed points around a
     * midpoint forced to (0, 0).
     *
     * @param rng Episode random generator
     * @param nwaypoints Number of inserted waypoints (halved, rounded down)
     * @param length Distance between start and end [m]
     */
    static ReferencePath create_random_through_origin(std::mt19937& rng,
                                                      int nwaypoints,
                                                      double length = 400.0);

    /**
     * @brief Waypoints used by create_random_through_origin, before smoothing.
     */
    static std::vector<Eigen::Vector2d> random_waypoints_through_origin(std::mt19937& rng,
                                                                        int nwaypoints,
                                                                        double length);

    /// Position at arc length s (end pieces extrapolated outside [0, length])
    Eigen::Vector2d position(double s) const;

    /// Derivative of position with respect to arc length
    Eigen::Vector2d tangent(double s) const;

    /// Tangent angle at arc length s, atan2 range
    double direction(double s) const;

    /// Position at s = length
    Eigen::Vector2d endpoint() const;

    /**
     * @brief Arc length of the point on the path closest to position.
     *
     * The nearest polyline sample brackets the minimum, which a bounded
     * scalar minimization then refines to kClosestPointTolerance.
     *
     * @throws GeometryError if the search does not converge
     */
    double closest_arc_length(const Eigen::Vector2d& position) const;

    /// Closest point and its arc length
    std::pair<Eigen::Vector2d, double> closest_point(const Eigen::Vector2d& position) const;

    /// Distance to, position of and arc length of the closest point
    ClosestPoint closest_point_distance(const Eigen::Vector2d& position) const;

    /**
     * @brief Signed cross-track error of a position relative to the path at s.
     *
     * Lateral component of (position(s) - position) in the frame aligned with
     * the path tangent at s; positive when the path lies to the left.
     */
    double cross_track_error(const Eigen::Vector2d& position, double s) const;

    /**
     * @brief Same curve traversed from the endpoint back to the start.
     */
    ReferencePath reversed() const;

    /// Total path length
    double length() const { return total_length_; }

    /// Path type
    PathType path_type() const { return path_type_; }

    /// Number of dense polyline samples
    size_t num_points() const { return points_.size(); }

    /// Dense polyline spanning [0, length]
    const std::vector<PathPoint>& points() const { return points_; }

    /// Waypoints the path was built from
    const std::vector<Eigen::Vector2d>& waypoints() const { return waypoints_; }

private:
    std::vector<Eigen::Vector2d> waypoints_;
    std::vector<PathPoint> points_;
    PchipInterpolator coords_;
    double total_length_;
    PathType path_type_;
    bool reversed_;

    /// Parameter of the underlying interpolant for arc length s
    double curve_parameter(double s) const;

    /// Rebuild the dense polyline from the interpolant
    void sample_points();
};

/**
 * @brief Cumulative chord length of a polyline, starting at 0.
 */
std::vector<double> arc_lengths(const std::vector<Eigen::Vector2d>& points);

}  // namespace auv_sim

#endif  // AUV_SIM_REFERENCE_PATH_HPP
