/**
 * @file errors.hpp
 * @brief Exception types raised by the simulation core.
 */

#ifndef AUV_SIM_ERRORS_HPP
#define AUV_SIM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace auv_sim {

/**
 * @brief Missing, malformed or out-of-range configuration option.
 *
 * Raised while an environment is being constructed; key() names the option.
 */
class ConfigError : public std::invalid_argument {
public:
    ConfigError(const std::string& key, const std::string& reason)
        : std::invalid_argument("config option '" + key + "': " + reason),
          key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

/**
 * @brief Degenerate path geometry or a closest-point search that did not converge.
 */
class GeometryError : public std::runtime_error {
public:
    explicit GeometryError(const std::string& what)
        : std::runtime_error("geometry degenerate: " + what) {}
};

}  // namespace auv_sim

#endif  // AUV_SIM_ERRORS_HPP
