/**
 * @file PlanarKinematics.cpp
 * @brief Closed-form two-link planar FK/IK
 *
 * IK (law of cosines):
 *   d² = dx² + dy²
 *   cos(theta2) = (d² - L1² - L2²) / (2·L1·L2)
 *   theta1 = atan2(dy, dx) - atan2(L2·sin(theta2), L1 + L2·cos(theta2))
 *
 * The second atan2 is the angle between the base→target line and link 1.
 * Its arguments vanish together only for L1 == L2 at d == 0, which is
 * rejected as DEGENERATE_CONFIGURATION before it is evaluated.
 */

#include "PlanarKinematics.hpp"
#include <cmath>
#include <sstream>

namespace planar_arm {
namespace kinematics {

// ============================================================================
// Forward Kinematics
// ============================================================================

Vector2d PlanarKinematics::forward(const ArmGeometry& geometry, double theta1, double theta2) {
    const double L1 = geometry.link1Length();
    const double L2 = geometry.link2Length();

    return Vector2d(
        geometry.baseX() + L1 * std::cos(theta1) + L2 * std::cos(theta1 + theta2),
        geometry.baseY() + L1 * std::sin(theta1) + L2 * std::sin(theta1 + theta2));
}

ArmPose PlanarKinematics::jointPositions(const ArmGeometry& geometry, double theta1, double theta2) {
    ArmPose pose;
    pose.base = geometry.base();
    pose.elbow = pose.base + geometry.link1Length() * Vector2d(std::cos(theta1), std::sin(theta1));
    pose.effector = pose.elbow +
        geometry.link2Length() * Vector2d(std::cos(theta1 + theta2), std::sin(theta1 + theta2));
    return pose;
}

Matrix2d PlanarKinematics::jacobian(const ArmGeometry& geometry, double theta1, double theta2) {
    const double L1 = geometry.link1Length();
    const double L2 = geometry.link2Length();
    const double s1 = std::sin(theta1);
    const double c1 = std::cos(theta1);
    const double s12 = std::sin(theta1 + theta2);
    const double c12 = std::cos(theta1 + theta2);

    Matrix2d J;
    J << -L1 * s1 - L2 * s12, -L2 * s12,
          L1 * c1 + L2 * c12,  L2 * c12;
    return J;
}

// ============================================================================
// Reachability
// ============================================================================

ReachBounds PlanarKinematics::reachBounds(const ArmGeometry& geometry) {
    ReachBounds bounds;
    bounds.minReach = geometry.minReach();
    bounds.maxReach = geometry.maxReach();
    return bounds;
}

bool PlanarKinematics::isWithinReach(const ArmGeometry& geometry, double distance) {
    const double tol = geometry.reachTolerance();
    return distance >= geometry.minReach() - tol &&
           distance <= geometry.maxReach() + tol;
}

bool PlanarKinematics::isReachable(const ArmGeometry& geometry, double x, double y) {
    if (!geometry.isValid() || !std::isfinite(x) || !std::isfinite(y)) {
        return false;
    }
    const double distance = std::hypot(x - geometry.baseX(), y - geometry.baseY());
    return isWithinReach(geometry, distance);
}

// ============================================================================
// Inverse Kinematics
// ============================================================================

IKResult PlanarKinematics::inverse(const ArmGeometry& geometry, double x, double y,
                                   ElbowConfig elbow) {
    IKResult result;

    if (!geometry.isValid()) {
        std::ostringstream oss;
        oss << "Link lengths must be positive (L1=" << geometry.link1Length()
            << ", L2=" << geometry.link2Length() << ")";
        result.error = SimulationError::invalidParameter(oss.str());
        return result;
    }
    if (!std::isfinite(x) || !std::isfinite(y)) {
        result.error = SimulationError::invalidParameter("Target point is not finite");
        return result;
    }

    const double L1 = geometry.link1Length();
    const double L2 = geometry.link2Length();
    const double dx = x - geometry.baseX();
    const double dy = y - geometry.baseY();
    const double d2 = dx * dx + dy * dy;
    const double distance = std::sqrt(d2);

    if (!isWithinReach(geometry, distance)) {
        std::ostringstream oss;
        oss << "Target point (" << x << ", " << y << ") is out of reach: distance "
            << distance << " not in [" << geometry.minReach() << ", "
            << geometry.maxReach() << "]";
        result.error = SimulationError::outOfReach(
            x, y, geometry.minReach(), geometry.maxReach(), oss.str());
        return result;
    }

    if (geometry.hasEqualLinks() && distance <= geometry.reachTolerance()) {
        std::ostringstream oss;
        oss << "Target point (" << x << ", " << y
            << ") coincides with the base of an arm with equal links; theta1 is undetermined";
        result.error = SimulationError::degenerate(x, y, oss.str());
        return result;
    }

    const double cosTheta2 = clampUnit((d2 - L1 * L1 - L2 * L2) / (2.0 * L1 * L2));
    double theta2 = std::acos(cosTheta2);
    if (elbow == ElbowConfig::UP) {
        theta2 = -theta2;
    }

    const double targetAngle = std::atan2(dy, dx);
    const double offsetAngle = std::atan2(L2 * std::sin(theta2), L1 + L2 * std::cos(theta2));

    result.joints.theta1 = normalizeAngle(targetAngle - offsetAngle);
    result.joints.theta2 = theta2;
    result.valid = true;
    return result;
}

} // namespace kinematics
} // namespace planar_arm
