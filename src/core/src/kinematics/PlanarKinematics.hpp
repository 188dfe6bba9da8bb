/**
 * @file PlanarKinematics.hpp
 * @brief Closed-form FK/IK for a two-link planar arm
 *
 * All functions are static, stateless and thread-safe.
 * Errors are returned as values (IKResult), nothing throws.
 *
 * Angle convention:
 *   x = bx + L1*cos(theta1) + L2*cos(theta1 + theta2)
 *   y = by + L1*sin(theta1) + L2*sin(theta1 + theta2)
 */

#pragma once

#include "ArmGeometry.hpp"
#include "SimulationError.hpp"

namespace planar_arm {
namespace kinematics {

/**
 * Result of inverse kinematics computation
 */
struct IKResult {
    JointConfiguration joints;
    bool valid = false;
    SimulationError error;
};

/**
 * Inner and outer radius of the reachable annulus
 */
struct ReachBounds {
    double minReach = 0.0;
    double maxReach = 0.0;
};

class PlanarKinematics {
public:
    // ========================================================================
    // Forward Kinematics
    // ========================================================================

    /**
     * End-effector position for the given joint angles.
     * Total over all real angles.
     */
    static Vector2d forward(const ArmGeometry& geometry, double theta1, double theta2);

    static Vector2d forward(const ArmGeometry& geometry, const JointConfiguration& joints) {
        return forward(geometry, joints.theta1, joints.theta2);
    }

    /**
     * Base, elbow and end-effector positions (for drawing the arm)
     */
    static ArmPose jointPositions(const ArmGeometry& geometry, double theta1, double theta2);

    /**
     * End-effector velocity Jacobian d(x,y)/d(theta1,theta2)
     */
    static Matrix2d jacobian(const ArmGeometry& geometry, double theta1, double theta2);

    // ========================================================================
    // Reachability
    // ========================================================================

    static ReachBounds reachBounds(const ArmGeometry& geometry);

    /**
     * Tolerant annulus test: |L1-L2| <= distance(base, p) <= L1+L2
     */
    static bool isReachable(const ArmGeometry& geometry, double x, double y);

    /**
     * Same comparison for a precomputed distance from the base
     */
    static bool isWithinReach(const ArmGeometry& geometry, double distance);

    // ========================================================================
    // Inverse Kinematics
    // ========================================================================

    /**
     * Joint angles that place the end effector at (x, y).
     *
     * theta2 = +acos(c) for ElbowConfig::DOWN, -acos(c) for ElbowConfig::UP,
     * with c from the law of cosines clamped to [-1, 1].
     * theta1 is normalized to (-PI, PI].
     *
     * Fails with INVALID_PARAMETER, OUT_OF_REACH or DEGENERATE_CONFIGURATION.
     */
    static IKResult inverse(const ArmGeometry& geometry, double x, double y,
                            ElbowConfig elbow = ElbowConfig::DOWN);
};

} // namespace kinematics
} // namespace planar_arm
