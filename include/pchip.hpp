/**
 * @file pchip.hpp
 * @brief Shape-preserving piecewise cubic Hermite interpolation.
 *
 * Fits each coordinate of a sequence of 2D points against a strictly
 * increasing parameter (arc length). Interior slopes use the Fritsch-Carlson
 * weighted harmonic mean, so the interpolant does not overshoot the data;
 * end slopes use a one-sided three-point estimate.
 */

#ifndef AUV_SIM_PCHIP_HPP
#define AUV_SIM_PCHIP_HPP

#include <Eigen/Dense>
#include <vector>

namespace auv_sim {

/**
 * @brief Monotone piecewise cubic interpolant of planar points.
 */
class PchipInterpolator {
public:
    PchipInterpolator() = default;

    /**
     * @brief Fit the interpolant.
     * @param knots Strictly increasing parameter values (at least 2)
     * @param values Points at each knot
     * @throws GeometryError if the knots are not strictly increasing
     */
    PchipInterpolator(const std::vector<double>& knots,
                      const std::vector<Eigen::Vector2d>& values);

    /**
     * @brief Evaluate the interpolant.
     *
     * Outside the knot range the first or last cubic piece is extrapolated.
     */
    Eigen::Vector2d operator()(double t) const;

    /// First derivative with respect to the parameter
    Eigen::Vector2d derivative(double t) const;

    /// Parameter range covered by the data
    double lower() const { return knots_.front(); }
    double upper() const { return knots_.back(); }

    bool empty() const { return knots_.empty(); }

private:
    std::vector<double> knots_;
    std::vector<Eigen::Vector2d> values_;
    std::vector<Eigen::Vector2d> slopes_;

    /// Index of the piece used for parameter t
    size_t piece(double t) const;
};

}  // namespace auv_sim

#endif  // AUV_SIM_PCHIP_HPP
