/**
 * @file dynamics.hpp
 * @brief 3-DOF maneuvering model of the AUV in the horizontal plane.
 *
 * State: eta = [x, y, psi], nu = [u, v, r]
 * Input: tau = [thrust, rudder angle]
 *
 * Continuous dynamics:
 *     eta_dot = Rz(psi) @ nu
 *     M @ nu_dot = B(nu) @ tau - D(nu) @ nu - C(nu) @ nu - L(nu) @ nu
 *
 * Mass, added mass and damping coefficients are based on the CyberShip II
 * model ship (Skjetne et al.); rudder, lift and fin terms are tuned so the
 * hull is directionally stable and turns at up to about 0.2 rad/s.
 */

#ifndef AUV_SIM_DYNAMICS_HPP
#define AUV_SIM_DYNAMICS_HPP

#include "ring_buffer.hpp"
#include "types.hpp"
#include <cmath>
#include <vector>

namespace auv_sim {

namespace hydro {

// Rigid body
constexpr double kMass = 23.8;       ///< [kg]
constexpr double kIz = 1.76;         ///< Yaw inertia [kg m^2]
constexpr double kXg = 0.046;        ///< Longitudinal center of gravity [m]

// Added mass
constexpr double kXudot = -2.0;
constexpr double kYvdot = -10.0;
constexpr double kYrdot = 0.0;
constexpr double kNvdot = 0.0;
constexpr double kNrdot = -1.0;

// Linear and nonlinear damping
constexpr double kXu = -0.7225;
constexpr double kXuu = -1.3274;
constexpr double kXuuu = -5.8664;
constexpr double kYv = -0.8612;
constexpr double kYvv = -36.2823;
constexpr double kYrv = -0.805;
constexpr double kYr = 0.1079;
constexpr double kYvr = -0.845;
constexpr double kYrr = -3.45;
constexpr double kNv = 0.1052;
constexpr double kNvv = 5.0437;
constexpr double kNrv = 0.130;
constexpr double kNr = -1.9;
constexpr double kNvr = 0.080;
constexpr double kNrr = -0.75;

// Rudder forces, proportional to u^2
constexpr double kYuudelta = -0.4;
constexpr double kNuudelta = 2.0;

// Hull and fin lift, proportional to u; kFinMomentV counters the Munk moment
constexpr double kLiftV = 10.0;
constexpr double kFinMomentV = -8.0;

// Actuator limits
constexpr double kThrustMin = 0.0;                     ///< [N]
constexpr double kThrustMax = 14.0;                    ///< [N]
constexpr double kRudderMax = 25.0 * M_PI / 180.0;     ///< [rad]
constexpr double kMaxSpeed = 2.0;                      ///< [m/s]

/// Mass and added-mass matrix
Eigen::Matrix3d mass_matrix();

/// Inverse of mass_matrix(), computed once
const Eigen::Matrix3d& mass_matrix_inverse();

/// Actuator configuration: maps [thrust, rudder] to body forces and moment
Eigen::Matrix<double, 3, 2> actuator_matrix(const Eigen::Vector3d& nu);

/// Coriolis and centripetal matrix including added mass
Eigen::Matrix3d coriolis_matrix(const Eigen::Vector3d& nu);

/// Linear plus quadratic/cubic damping matrix
Eigen::Matrix3d damping_matrix(const Eigen::Vector3d& nu);

/// Speed-dependent lift correction
Eigen::Matrix3d lift_matrix(const Eigen::Vector3d& nu);

}  // namespace hydro

/**
 * @brief Stateless AUV maneuvering model.
 */
class AUVDynamics {
public:
    static constexpr int STATE_DIM = 6;  ///< [x, y, psi, u, v, r]
    static constexpr int INPUT_DIM = 2;  ///< [thrust, rudder]

    using StateVector = Eigen::Matrix<double, STATE_DIM, 1>;

    /**
     * @brief Initialize dynamics model.
     * @param dt Timestep for discrete integration [s]
     */
    explicit AUVDynamics(double dt = 0.1);

    /**
     * @brief Compute continuous-time state derivative.
     * @param state State vector [x, y, psi, u, v, r]
     * @param input Physical input [thrust, rudder]
     * @return State derivative
     */
    StateVector continuous_dynamics(const StateVector& state,
                                    const Eigen::Vector2d& input) const;

    /**
     * @brief Advance the state one step with forward Euler.
     *
     * The heading of the result is wrapped to (-pi, pi].
     *
     * @param state Current state
     * @param input Physical input [thrust, rudder]
     * @param dt Timestep (uses member dt if negative)
     */
    StateVector discrete_dynamics(const StateVector& state,
                                  const Eigen::Vector2d& input,
                                  double dt = -1) const;

    /// Propagate a vehicle state one timestep forward
    VehicleState propagate(const VehicleState& state, const ActuatorCommand& input,
                           double dt = -1) const;

    /**
     * @brief Clamp a normalized action and map it to physical units.
     *
     * propeller_input in [0, 1] maps linearly to [kThrustMin, kThrustMax],
     * rudder_position in [-1, 1] to [-kRudderMax, kRudderMax].
     */
    static ActuatorCommand map_action(const Eigen::Vector2d& action);

private:
    double dt_;  ///< Timestep for discrete integration
};

/**
 * @brief The simulated vehicle: state, integration step and recent history.
 */
class AUV2D {
public:
    static constexpr size_t kRudderHistory = 10;  ///< Samples in rudder_change()

    /**
     * @param t_step Simulation timestep [s]
     * @param init_pose Initial [x, y, psi]; velocities start at zero
     * @param width Hull width [m]
     */
    AUV2D(double t_step, const Eigen::Vector3d& init_pose, double width = 4.0);

    /**
     * @brief Advance the vehicle t_step seconds.
     * @param action [propeller_input, rudder_position], clamped to [0,1] x [-1,1]
     */
    void step(const Eigen::Vector2d& action);

    const VehicleState& state() const { return state_; }

    Eigen::Vector2d position() const { return state_.position(); }
    double heading() const { return state_.psi; }

    /// Wrapped change of heading over the last step, or the heading before any step
    double heading_change() const;

    /// Mean of up to the last kRudderHistory applied rudder angles
    double rudder_change() const;

    /// Surge and sway velocity
    Eigen::Vector2d velocity() const { return Eigen::Vector2d(state_.u, state_.v); }
    double speed() const { return velocity().norm(); }
    double yaw_rate() const { return state_.r; }
    double max_speed() const { return hydro::kMaxSpeed; }

    /// Angle between heading and velocity
    double crab_angle() const { return std::atan2(state_.v, state_.u); }

    /// Direction of travel
    double course() const { return heading() + crab_angle(); }

    /// Distance from the center to the edge of the hull
    double radius() const { return 0.5 * width_; }

    /// Last applied physical command
    const ActuatorCommand& input() const { return input_; }

    /// Positions visited, starting with the initial one
    const std::vector<Eigen::Vector2d>& path_taken() const { return path_taken_; }

private:
    AUVDynamics dynamics_;
    VehicleState state_;
    ActuatorCommand input_;
    double width_;
    RingBuffer<double, 2> headings_;
    RingBuffer<double, kRudderHistory> rudders_;
    std::vector<Eigen::Vector2d> path_taken_;
};

}  // namespace auv_sim

#endif  // AUV_SIM_DYNAMICS_HPP
