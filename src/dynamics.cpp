/**
 * @file dynamics.cpp
 * @brief Implementation of the AUV maneuvering model.
 */

#include "dynamics.hpp"
#include "geometry.hpp"
#include <algorithm>
#include <cmath>

namespace auv_sim {

namespace hydro {

Eigen::Matrix3d mass_matrix() {
    Eigen::Matrix3d M;
    M << kMass - kXudot, 0, 0,
         0, kMass - kYvdot, kMass * kXg - kYrdot,
         0, kMass * kXg - kNvdot, kIz - kNrdot;
    return M;
}

const Eigen::Matrix3d& mass_matrix_inverse() {
    static const Eigen::Matrix3d M_inv = mass_matrix().inverse();
    return M_inv;
}

Eigen::Matrix<double, 3, 2> actuator_matrix(const Eigen::Vector3d& nu) {
    double u2 = nu(0) * nu(0);

    Eigen::Matrix<double, 3, 2> B;
    B << 1, 0,
         0, kYuudelta * u2,
         0, kNuudelta * u2;
    return B;
}

Eigen::Matrix3d coriolis_matrix(const Eigen::Vector3d& nu) {
    Eigen::Matrix3d M = mass_matrix();
    double u = nu(0);
    double v = nu(1);
    double r = nu(2);

    double c13 = -M(1, 1) * v - M(1, 2) * r;
    double c23 = M(0, 0) * u;

    Eigen::Matrix3d C;
    C << 0, 0, c13,
         0, 0, c23,
         -c13, -c23, 0;
    return C;
}

Eigen::Matrix3d damping_matrix(const Eigen::Vector3d& nu) {
    double u = std::abs(nu(0));
    double v = std::abs(nu(1));
    double r = std::abs(nu(2));

    double d11 = -kXu - kXuu * u - kXuuu * u * u;
    double d22 = -kYv - kYvv * v - kYrv * r;
    double d23 = -kYr - kYvr * v - kYrr * r;
    double d32 = -kNv - kNvv * v - kNrv * r;
    double d33 = -kNr - kNvr * v - kNrr * r;

    Eigen::Matrix3d D;
    D << d11, 0, 0,
         0, d22, d23,
         0, d32, d33;
    return D;
}

Eigen::Matrix3d lift_matrix(const Eigen::Vector3d& nu) {
    double u = nu(0);

    Eigen::Matrix3d L = Eigen::Matrix3d::Zero();
    L(1, 1) = kLiftV * u;
    L(2, 1) = kFinMomentV * u;
    return L;
}

}  // namespace hydro

// =============================================================================
// AUVDynamics
// =============================================================================

AUVDynamics::AUVDynamics(double dt) : dt_(dt) {}

AUVDynamics::StateVector AUVDynamics::continuous_dynamics(
    const StateVector& state,
    const Eigen::Vector2d& input
) const {
    double psi = state(2);
    Eigen::Vector3d nu = state.tail<3>();

    Eigen::Vector3d eta_dot = rotation_z(wrap_to_principal(psi)) * nu;
    Eigen::Vector3d nu_dot = hydro::mass_matrix_inverse() * (
        hydro::actuator_matrix(nu) * input
        - hydro::damping_matrix(nu) * nu
        - hydro::coriolis_matrix(nu) * nu
        - hydro::lift_matrix(nu) * nu
    );

    StateVector deriv;
    deriv << eta_dot, nu_dot;
    return deriv;
}

AUVDynamics::StateVector AUVDynamics::discrete_dynamics(
    const StateVector& state,
    const Eigen::Vector2d& input,
    double dt
) const {
    if (dt < 0) {
        dt = dt_;
    }

    // Forward Euler
    StateVector next = state + continuous_dynamics(state, input) * dt;
    next(2) = wrap_to_principal(next(2));
    return next;
}

VehicleState AUVDynamics::propagate(const VehicleState& state,
                                    const ActuatorCommand& input,
                                    double dt) const {
    return VehicleState::from_array(discrete_dynamics(state.to_array(), input.to_array(), dt));
}

ActuatorCommand AUVDynamics::map_action(const Eigen::Vector2d& action) {
    double propeller = std::clamp(action(0), 0.0, 1.0);
    double rudder = std::clamp(action(1), -1.0, 1.0);

    return ActuatorCommand(
        propeller * (hydro::kThrustMax - hydro::kThrustMin) + hydro::kThrustMin,
        rudder * hydro::kRudderMax
    );
}

// =============================================================================
// AUV2D
// =============================================================================

AUV2D::AUV2D(double t_step, const Eigen::Vector3d& init_pose, double width)
    : dynamics_(t_step),
      state_(init_pose(0), init_pose(1), wrap_to_principal(init_pose(2))),
      width_(width) {
    headings_.push(state_.psi);
    rudders_.push(input_.rudder);
    path_taken_.push_back(state_.position());
}

void AUV2D::step(const Eigen::Vector2d& action) {
    input_ = AUVDynamics::map_action(action);
    state_ = dynamics_.propagate(state_, input_);

    headings_.push(state_.psi);
    rudders_.push(input_.rudder);
    path_taken_.push_back(state_.position());
}

double AUV2D::heading_change() const {
    if (headings_.size() < 2) {
        return heading();
    }
    return wrap_to_principal(headings_.from_back(0) - headings_.from_back(1));
}

double AUV2D::rudder_change() const {
    double sum = 0.0;
    for (size_t i = 0; i < rudders_.size(); ++i) {
        sum += rudders_.from_back(i);
    }
    return sum / rudders_.size();
}

}  // namespace auv_sim
