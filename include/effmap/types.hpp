// filename: types.hpp
// part of Motor Efficiency Map Toolkit
// MIT License

#pragma once

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace effmap {

/// Marker for grid cells outside the valid fill or without an interpolated value.
constexpr double kEmpty = std::numeric_limits<double>::quiet_NaN();

/// Largest gap (rev/min) between sorted speeds that still joins one speed group.
constexpr double kSpeedGroupTolerance = 6.0;

inline bool isEmpty(double value) { return std::isnan(value); }

enum class EfficiencyChannel { Mcu, Motor, System };

inline const char* channelKey(EfficiencyChannel channel) {
    switch (channel) {
        case EfficiencyChannel::Mcu:
            return "Eff_MCU";
        case EfficiencyChannel::Motor:
            return "Eff_Motor";
        case EfficiencyChannel::System:
            return "Eff_SYS";
    }
    return "Eff_MCU";
}

inline const char* channelLabel(EfficiencyChannel channel) {
    switch (channel) {
        case EfficiencyChannel::Mcu:
            return "MCU";
        case EfficiencyChannel::Motor:
            return "Motor";
        case EfficiencyChannel::System:
            return "SYS";
    }
    return "MCU";
}

/**
 * @brief Invalid or malformed configuration value.
 *
 * Raised by the operation that depends on the value; unrelated stages keep running.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Precondition failure that makes a dataset unprocessable
 * (no matched columns, no valid speed range).
 */
class StructuralError : public std::runtime_error {
public:
    explicit StructuralError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace effmap
