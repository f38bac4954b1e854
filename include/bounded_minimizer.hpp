/**
 * @file bounded_minimizer.hpp
 * @brief Bounded scalar minimization (Brent's method).
 *
 * Combines golden-section steps with successive parabolic interpolation on a
 * closed interval. The number of function evaluations is capped, so the cost
 * of a call is bounded regardless of the objective.
 */

#ifndef AUV_SIM_BOUNDED_MINIMIZER_HPP
#define AUV_SIM_BOUNDED_MINIMIZER_HPP

#include <functional>

namespace auv_sim {

/**
 * @brief Result of a bounded minimization.
 */
struct MinimizeResult {
    double x = 0.0;           ///< Abscissa of the minimum found
    double fx = 0.0;          ///< Objective value at x
    int evaluations = 0;      ///< Number of objective evaluations used
    bool converged = false;   ///< False if the evaluation budget ran out
};

/**
 * @brief Minimize a scalar function on [lower, upper].
 *
 * Finds a local minimum; the caller is responsible for bracketing the global
 * one when the objective is multimodal.
 *
 * @param func Objective
 * @param lower Lower bound
 * @param upper Upper bound
 * @param x_tolerance Absolute tolerance on the abscissa
 * @param max_evaluations Evaluation budget
 * @return MinimizeResult
 */
MinimizeResult minimize_bounded(
    const std::function<double(double)>& func,
    double lower,
    double upper,
    double x_tolerance = 1e-6,
    int max_evaluations = 10000
);

}  // namespace auv_sim

#endif  // AUV_SIM_BOUNDED_MINIMIZER_HPP
