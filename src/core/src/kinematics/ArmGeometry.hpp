/**
 * @file ArmGeometry.hpp
 * @brief Link lengths, base position and joint configuration of a two-link planar arm
 */

#pragma once

#include "MathTypes.hpp"
#include <string>

namespace planar_arm {
namespace kinematics {

// ============================================================================
// Arm Geometry
// ============================================================================

/**
 * Geometry of a two-link planar arm
 *
 *   base ──L1──► elbow ──L2──► end effector
 *
 * Value type, no setters. Lengths in mm.
 * Positivity of the link lengths is checked by the consumers
 * (PlanarKinematics::inverse, CircularPathGenerator) so that a bad
 * geometry becomes an INVALID_PARAMETER error rather than an exception.
 */
class ArmGeometry {
public:
    ArmGeometry() = default;

    ArmGeometry(double link1Length, double link2Length,
                double baseX = 0.0, double baseY = 0.0)
        : link1Length_(link1Length), link2Length_(link2Length),
          baseX_(baseX), baseY_(baseY) {}

    double link1Length() const { return link1Length_; }
    double link2Length() const { return link2Length_; }
    double baseX() const { return baseX_; }
    double baseY() const { return baseY_; }

    Vector2d base() const { return Vector2d(baseX_, baseY_); }

    /// Inner radius of the reachable annulus, |L1 - L2|
    double minReach() const { return std::abs(link1Length_ - link2Length_); }

    /// Outer radius of the reachable annulus, L1 + L2
    double maxReach() const { return link1Length_ + link2Length_; }

    /// Absolute tolerance for reach comparisons
    double reachTolerance() const { return REACH_TOLERANCE * maxReach(); }

    /// Both lengths finite and strictly positive, base finite
    bool isValid() const {
        return std::isfinite(link1Length_) && std::isfinite(link2Length_) &&
               std::isfinite(baseX_) && std::isfinite(baseY_) &&
               link1Length_ > 0.0 && link2Length_ > 0.0;
    }

    /// Equal links: the base itself is reachable but theta1 is undetermined there
    bool hasEqualLinks() const {
        return std::abs(link1Length_ - link2Length_) <= reachTolerance();
    }

private:
    double link1Length_ = 1200.0;
    double link2Length_ = 800.0;
    double baseX_ = 0.0;
    double baseY_ = 0.0;
};

// ============================================================================
// Joint Configuration
// ============================================================================

/**
 * Elbow branch of the inverse kinematics solution.
 *
 * DOWN: non-negative arccosine branch, theta2 in [0, PI]
 * UP:   mirrored branch,               theta2 in [-PI, 0]
 */
enum class ElbowConfig { DOWN, UP };

inline std::string toString(ElbowConfig elbow) {
    return elbow == ElbowConfig::DOWN ? "down" : "up";
}

/**
 * Joint angles (rad)
 * theta1: link 1 measured from the +X axis
 * theta2: link 2 measured relative to link 1
 */
struct JointConfiguration {
    double theta1 = 0.0;
    double theta2 = 0.0;

    JointConfiguration() = default;
    JointConfiguration(double t1, double t2) : theta1(t1), theta2(t2) {}
};

/**
 * Positions of the arm's joints, for drawing a pose
 */
struct ArmPose {
    Vector2d base = Vector2d::Zero();
    Vector2d elbow = Vector2d::Zero();
    Vector2d effector = Vector2d::Zero();
};

} // namespace kinematics
} // namespace planar_arm
