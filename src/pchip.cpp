/**
 * @file pchip.cpp
 * @brief Implementation of the monotone cubic interpolant.
 */

#include "pchip.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace auv_sim {

namespace {

double sign(double x) {
    return (x > 0) - (x < 0);
}

/**
 * @brief One-sided three-point end slope with the shape-preserving correction.
 */
double edge_slope(double h0, double h1, double m0, double m1) {
    double d = ((2 * h0 + h1) * m0 - h0 * m1) / (h0 + h1);

    if (sign(d) != sign(m0)) {
        d = 0.0;
    } else if (sign(m0) != sign(m1) && std::abs(d) > std::abs(3 * m0)) {
        d = 3 * m0;
    }
    return d;
}

/**
 * @brief Knot slopes for a single coordinate.
 */
std::vector<double> compute_slopes(const std::vector<double>& h,
                                   const std::vector<double>& m) {
    size_t n = h.size() + 1;
    std::vector<double> d(n, 0.0);

    if (n == 2) {
        // Two points: the interpolant is the chord
        d[0] = m[0];
        d[1] = m[0];
        return d;
    }

    for (size_t k = 1; k + 1 < n; ++k) {
        double m_prev = m[k - 1];
        double m_next = m[k];
        if (sign(m_prev) * sign(m_next) <= 0) {
            d[k] = 0.0;
            continue;
        }
        double w1 = 2 * h[k] + h[k - 1];
        double w2 = h[k] + 2 * h[k - 1];
        d[k] = (w1 + w2) / (w1 / m_prev + w2 / m_next);
    }

    d[0] = edge_slope(h[0], h[1], m[0], m[1]);
    d[n - 1] = edge_slope(h[n - 2], h[n - 3], m[n - 2], m[n - 3]);
    return d;
}

}  // anonymous namespace

PchipInterpolator::PchipInterpolator(const std::vector<double>& knots,
                                     const std::vector<Eigen::Vector2d>& values)
    : knots_(knots), values_(values) {
    if (knots_.size() < 2 || knots_.size() != values_.size()) {
        throw GeometryError("interpolation needs at least two matching knots and points");
    }

    size_t n = knots_.size();
    std::vector<double> h(n - 1);
    for (size_t k = 0; k + 1 < n; ++k) {
        h[k] = knots_[k + 1] - knots_[k];
        if (!(h[k] > 0) || !std::isfinite(h[k])) {
            throw GeometryError("knots not strictly increasing at index " +
                                std::to_string(k + 1));
        }
    }

    slopes_.assign(n, Eigen::Vector2d::Zero());
    for (int dim = 0; dim < 2; ++dim) {
        std::vector<double> m(n - 1);
        for (size_t k = 0; k + 1 < n; ++k) {
            m[k] = (values_[k + 1](dim) - values_[k](dim)) / h[k];
        }
        std::vector<double> d = compute_slopes(h, m);
        for (size_t k = 0; k < n; ++k) {
            slopes_[k](dim) = d[k];
        }
    }
}

size_t PchipInterpolator::piece(double t) const {
    if (knots_.size() < 2) {
        throw GeometryError("evaluation of an unfitted interpolant");
    }
    auto it = std::upper_bound(knots_.begin(), knots_.end(), t);
    if (it == knots_.begin()) {
        return 0;
    }
    size_t idx = static_cast<size_t>(it - knots_.begin()) - 1;
    return std::min(idx, knots_.size() - 2);
}

Eigen::Vector2d PchipInterpolator::operator()(double t) const {
    size_t k = piece(t);
    double h = knots_[k + 1] - knots_[k];
    double x = (t - knots_[k]) / h;

    // Cubic Hermite basis
    double x2 = x * x;
    double x3 = x2 * x;
    double h00 = 2 * x3 - 3 * x2 + 1;
    double h10 = x3 - 2 * x2 + x;
    double h01 = -2 * x3 + 3 * x2;
    double h11 = x3 - x2;

    return h00 * values_[k] + h10 * h * slopes_[k] +
           h01 * values_[k + 1] + h11 * h * slopes_[k + 1];
}

Eigen::Vector2d PchipInterpolator::derivative(double t) const {
    size_t k = piece(t);
    double h = knots_[k + 1] - knots_[k];
    double x = (t - knots_[k]) / h;

    double x2 = x * x;
    double dh00 = (6 * x2 - 6 * x) / h;
    double dh10 = 3 * x2 - 4 * x + 1;
    double dh01 = (-6 * x2 + 6 * x) / h;
    double dh11 = 3 * x2 - 2 * x;

    return dh00 * values_[k] + dh10 * slopes_[k] +
           dh01 * values_[k + 1] + dh11 * slopes_[k + 1];
}

}  // namespace auv_sim
