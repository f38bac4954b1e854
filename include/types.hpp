/**
 * @file types.hpp
 * @brief Core data structures for the AUV path-following environment.
 *
 * - Vehicle state and actuator commands
 * - Static obstacles
 * - Observation layout and step results
 */

#ifndef AUV_SIM_TYPES_HPP
#define AUV_SIM_TYPES_HPP

#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace auv_sim {

// =============================================================================
// Vehicle
// =============================================================================

/**
 * @brief 3-DOF vehicle state: eta = (x, y, psi), nu = (u, v, r)
 */
struct VehicleState {
    double x;    ///< North/world x position [m]
    double y;    ///< World y position [m]
    double psi;  ///< Heading [rad], kept in (-pi, pi]
    double u;    ///< Surge velocity [m/s]
    double v;    ///< Sway velocity [m/s]
    double r;    ///< Yaw rate [rad/s]

    VehicleState() : x(0), y(0), psi(0), u(0), v(0), r(0) {}
    VehicleState(double x, double y, double psi, double u = 0, double v = 0, double r = 0)
        : x(x), y(y), psi(psi), u(u), v(v), r(r) {}

    /// Convert to Eigen vector [x, y, psi, u, v, r]
    Eigen::Matrix<double, 6, 1> to_array() const {
        Eigen::Matrix<double, 6, 1> arr;
        arr << x, y, psi, u, v, r;
        return arr;
    }

    /// Create from Eigen vector
    static VehicleState from_array(const Eigen::Matrix<double, 6, 1>& arr) {
        return VehicleState(arr(0), arr(1), arr(2), arr(3), arr(4), arr(5));
    }

    Eigen::Vector2d position() const { return Eigen::Vector2d(x, y); }
};

/**
 * @brief Physical actuator command applied to the hull.
 */
struct ActuatorCommand {
    double thrust;  ///< Propeller thrust [N]
    double rudder;  ///< Rudder angle [rad]

    ActuatorCommand() : thrust(0), rudder(0) {}
    ActuatorCommand(double thrust, double rudder) : thrust(thrust), rudder(rudder) {}

    /// Convert to Eigen vector [thrust, rudder]
    Eigen::Vector2d to_array() const {
        return Eigen::Vector2d(thrust, rudder);
    }
};

// =============================================================================
// Obstacles
// =============================================================================

/**
 * @brief Static circular obstacle.
 */
struct Obstacle {
    Eigen::Vector2d position;  ///< Center [m]
    double radius;             ///< Radius [m], positive

    Obstacle() : position(Eigen::Vector2d::Zero()), radius(1.0) {}
    Obstacle(const Eigen::Vector2d& position, double radius)
        : position(position), radius(radius) {}
    Obstacle(double x, double y, double radius)
        : position(x, y), radius(radius) {}
};

// =============================================================================
// Observation and step results
// =============================================================================

constexpr int kNumStates = 6;    ///< Vehicle/path state channels
constexpr int kNumSectors = 8;   ///< Obstacle closeness sectors
constexpr int kObservationSize = kNumStates + kNumSectors;

/**
 * @brief Observation channel indices.
 */
enum ObservationIndex : int {
    kSurge = 0,
    kSway = 1,
    kHeadingError = 2,
    kCrossTrackError = 3,
    kPropellerAction = 4,
    kRudderAction = 5,
    kFirstSector = kNumStates
};

using Observation = Eigen::Matrix<double, kObservationSize, 1>;

/**
 * @brief Why an episode ended.
 */
enum class TerminationReason {
    NONE,             ///< Episode still running
    DIVERGED,         ///< Accumulated reward fell below the floor
    PATH_COMPLETED,   ///< Progress reached the end of the path
    GOAL_REACHED,     ///< Vehicle within the goal radius of the path endpoint
    COLLISION         ///< Hull overlapped an obstacle (opt-in)
};

/// Human-readable name of a termination reason
inline const char* to_string(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::NONE: return "none";
        case TerminationReason::DIVERGED: return "diverged";
        case TerminationReason::PATH_COMPLETED: return "path_completed";
        case TerminationReason::GOAL_REACHED: return "goal_reached";
        case TerminationReason::COLLISION: return "collision";
    }
    return "unknown";
}

/**
 * @brief Result of one environment step.
 */
struct StepResult {
    Observation observation;              ///< Observation after the step
    double reward = 0.0;                  ///< Reward earned by this step
    bool done = false;                    ///< Episode ended on this step
    std::map<std::string, double> info;   ///< Extension point, empty by default

    StepResult() : observation(Observation::Zero()) {}
};

}  // namespace auv_sim

#endif  // AUV_SIM_TYPES_HPP
