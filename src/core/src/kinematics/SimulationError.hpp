/**
 * @file SimulationError.hpp
 * @brief Error values reported by the kinematics and trajectory core
 */

#pragma once

#include "MathTypes.hpp"
#include <cstdint>
#include <string>

namespace planar_arm {
namespace kinematics {

/**
 * Error kinds
 */
enum class ErrorKind : uint8_t {
    NONE = 0,
    INVALID_PARAMETER,          // Non-positive length/speed/time step, negative radius, NaN
    OUT_OF_REACH,               // Point or circle outside the reachable annulus
    DEGENERATE_CONFIGURATION    // L1 == L2 with target at the base
};

/**
 * Error value returned to the immediate caller.
 * point/minReach/maxReach are only meaningful for OUT_OF_REACH and
 * DEGENERATE_CONFIGURATION.
 */
struct SimulationError {
    ErrorKind kind = ErrorKind::NONE;
    std::string message;
    double pointX = 0.0;
    double pointY = 0.0;
    double minReach = 0.0;
    double maxReach = 0.0;

    bool isError() const { return kind != ErrorKind::NONE; }

    static SimulationError invalidParameter(const std::string& message) {
        SimulationError e;
        e.kind = ErrorKind::INVALID_PARAMETER;
        e.message = message;
        return e;
    }

    static SimulationError outOfReach(double x, double y,
                                      double minReach, double maxReach,
                                      const std::string& message) {
        SimulationError e;
        e.kind = ErrorKind::OUT_OF_REACH;
        e.message = message;
        e.pointX = x;
        e.pointY = y;
        e.minReach = minReach;
        e.maxReach = maxReach;
        return e;
    }

    static SimulationError degenerate(double x, double y, const std::string& message) {
        SimulationError e;
        e.kind = ErrorKind::DEGENERATE_CONFIGURATION;
        e.message = message;
        e.pointX = x;
        e.pointY = y;
        return e;
    }
};

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                     return "NONE";
        case ErrorKind::INVALID_PARAMETER:        return "INVALID_PARAMETER";
        case ErrorKind::OUT_OF_REACH:             return "OUT_OF_REACH";
        case ErrorKind::DEGENERATE_CONFIGURATION: return "DEGENERATE_CONFIGURATION";
        default:                                  return "UNKNOWN";
    }
}

} // namespace kinematics
} // namespace planar_arm
