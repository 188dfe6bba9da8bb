/**
 * @file MathTypes.hpp
 * @brief Math types and utilities for planar arm kinematics
 */

#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>

namespace planar_arm {
namespace kinematics {

// ============================================================================
// Type Definitions
// ============================================================================

using Vector2d = Eigen::Vector2d;
using Matrix2d = Eigen::Matrix2d;

// ============================================================================
// Constants
// ============================================================================

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;
constexpr double EPSILON = 1e-10;

// Relative tolerance for reach comparisons, scaled by the outer reach radius
constexpr double REACH_TOLERANCE = 1e-9;

// ============================================================================
// Utility Functions
// ============================================================================

inline double degToRad(double degrees) {
    return degrees * DEG_TO_RAD;
}

inline double radToDeg(double radians) {
    return radians * RAD_TO_DEG;
}

inline bool isNearZero(double value, double tolerance = EPSILON) {
    return std::abs(value) < tolerance;
}

/**
 * Normalize angle to (-PI, PI]
 */
inline double normalizeAngle(double angle) {
    angle = std::fmod(angle, TWO_PI);
    if (angle > PI) angle -= TWO_PI;
    if (angle <= -PI) angle += TWO_PI;
    return angle;
}

/**
 * Shift angle by a multiple of 2*PI so it lies closest to reference
 */
inline double unwrapAngle(double angle, double reference) {
    return angle + TWO_PI * std::round((reference - angle) / TWO_PI);
}

inline double clampUnit(double value) {
    return std::clamp(value, -1.0, 1.0);
}

} // namespace kinematics
} // namespace planar_arm
