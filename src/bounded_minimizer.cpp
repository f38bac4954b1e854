/**
 * @file bounded_minimizer.cpp
 * @brief Implementation of Brent's bounded minimization.
 */

#include "bounded_minimizer.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace auv_sim {

namespace {

double step_sign(double x) {
    return x >= 0 ? 1.0 : -1.0;
}

}  // anonymous namespace

MinimizeResult minimize_bounded(
    const std::function<double(double)>& func,
    double lower,
    double upper,
    double x_tolerance,
    int max_evaluations
) {
    const double sqrt_eps = std::sqrt(std::numeric_limits<double>::epsilon());
    const double golden_mean = 0.5 * (3.0 - std::sqrt(5.0));

    MinimizeResult result;

    double a = std::min(lower, upper);
    double b = std::max(lower, upper);

    // xf: best point so far, nfc: second best, fulc: previous value of nfc
    double fulc = a + golden_mean * (b - a);
    double nfc = fulc;
    double xf = fulc;
    double rat = 0.0;
    double e = 0.0;

    double fx = func(xf);
    int num = 1;
    double ffulc = fx;
    double fnfc = fx;

    double xm = 0.5 * (a + b);
    double tol1 = sqrt_eps * std::abs(xf) + x_tolerance / 3.0;
    double tol2 = 2.0 * tol1;

    bool converged = true;
    while (std::abs(xf - xm) > (tol2 - 0.5 * (b - a))) {
        bool golden = true;

        if (std::abs(e) > tol1) {
            // Try a parabolic step through the three best points
            golden = false;
            double r = (xf - nfc) * (fx - ffulc);
            double q = (xf - fulc) * (fx - fnfc);
            double p = (xf - fulc) * q - (xf - nfc) * r;
            q = 2.0 * (q - r);
            if (q > 0.0) {
                p = -p;
            }
            q = std::abs(q);
            r = e;
            e = rat;

            if (std::abs(p) < std::abs(0.5 * q * r) &&
                p > q * (a - xf) && p < q * (b - xf)) {
                rat = p / q;
                double x = xf + rat;
                if ((x - a) < tol2 || (b - x) < tol2) {
                    rat = tol1 * step_sign(xm - xf);
                }
            } else {
                golden = true;
            }
        }

        if (golden) {
            e = (xf >= xm) ? a - xf : b - xf;
            rat = golden_mean * e;
        }

        double x = xf + step_sign(rat) * std::max(std::abs(rat), tol1);
        double fu = func(x);
        num++;

        if (fu <= fx) {
            if (x >= xf) {
                a = xf;
            } else {
                b = xf;
            }
            fulc = nfc;
            ffulc = fnfc;
            nfc = xf;
            fnfc = fx;
            xf = x;
            fx = fu;
        } else {
            if (x < xf) {
                a = x;
            } else {
                b = x;
            }
            if (fu <= fnfc || nfc == xf) {
                fulc = nfc;
                ffulc = fnfc;
                nfc = x;
                fnfc = fu;
            } else if (fu <= ffulc || fulc == xf || fulc == nfc) {
                fulc = x;
                ffulc = fu;
            }
        }

        xm = 0.5 * (a + b);
        tol1 = sqrt_eps * std::abs(xf) + x_tolerance / 3.0;
        tol2 = 2.0 * tol1;

        if (num >= max_evaluations) {
            converged = false;
            break;
        }
    }

    result.x = xf;
    result.fx = fx;
    result.evaluations = num;
    result.converged = converged && std::isfinite(fx);
    return result;
}

}  // namespace auv_sim
