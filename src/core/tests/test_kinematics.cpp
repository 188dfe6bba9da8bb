/**
 * @file test_kinematics.cpp
 * @brief Unit tests for the two-link planar kinematics engine
 */

#include <gtest/gtest.h>
#include "kinematics/MathTypes.hpp"
#include "kinematics/ArmGeometry.hpp"
#include "kinematics/PlanarKinematics.hpp"
#include <cmath>
#include <limits>

using namespace planar_arm::kinematics;

class KinematicsTest : public ::testing::Test {
protected:
    // L1=100, L2=80: annulus [20, 180]
    ArmGeometry arm_{100.0, 80.0, 0.0, 0.0};

    static constexpr double POS_TOL = 1e-9;    // mm
    static constexpr double ANG_TOL = 1e-9;    // rad

    static double angleDiff(double a, double b) {
        return std::abs(normalizeAngle(a - b));
    }
};

// ============================================================================
// Math Utilities Tests
// ============================================================================

TEST(MathTest, DegToRad) {
    EXPECT_NEAR(degToRad(0.0), 0.0, EPSILON);
    EXPECT_NEAR(degToRad(90.0), PI / 2.0, EPSILON);
    EXPECT_NEAR(degToRad(180.0), PI, EPSILON);
    EXPECT_NEAR(radToDeg(PI / 2.0), 90.0, EPSILON);
}

TEST(MathTest, IsNearZero) {
    EXPECT_TRUE(isNearZero(0.0));
    EXPECT_TRUE(isNearZero(-1e-12));
    EXPECT_FALSE(isNearZero(1e-6));
    EXPECT_TRUE(isNearZero(1e-6, 1e-5));
}

TEST(MathTest, NormalizeAngle) {
    EXPECT_NEAR(normalizeAngle(0.0), 0.0, EPSILON);
    EXPECT_NEAR(normalizeAngle(PI), PI, EPSILON);
    EXPECT_NEAR(normalizeAngle(-PI), PI, EPSILON);      // (-PI, PI]
    EXPECT_NEAR(normalizeAngle(2 * PI), 0.0, EPSILON);
    EXPECT_NEAR(normalizeAngle(-PI / 2 - 4 * PI), -PI / 2, EPSILON);
}

TEST(MathTest, UnwrapAngle) {
    // Crossing the ±PI cut stays continuous
    EXPECT_NEAR(unwrapAngle(-PI + 0.1, PI - 0.1), PI + 0.1, EPSILON);
    EXPECT_NEAR(unwrapAngle(PI - 0.1, -PI + 0.1), -PI - 0.1, EPSILON);
    // Already close: unchanged
    EXPECT_NEAR(unwrapAngle(0.3, 0.2), 0.3, EPSILON);
    // Several turns away
    EXPECT_NEAR(unwrapAngle(0.5, 0.5 + 6 * PI), 0.5 + 6 * PI, 1e-9);
}

// ============================================================================
// Geometry Tests
// ============================================================================

TEST(ArmGeometryTest, ReachAnnulus) {
    ArmGeometry arm(100.0, 80.0, 5.0, -3.0);
    EXPECT_DOUBLE_EQ(arm.minReach(), 20.0);
    EXPECT_DOUBLE_EQ(arm.maxReach(), 180.0);
    EXPECT_DOUBLE_EQ(arm.base().x(), 5.0);
    EXPECT_DOUBLE_EQ(arm.base().y(), -3.0);
    EXPECT_TRUE(arm.isValid());
    EXPECT_FALSE(arm.hasEqualLinks());

    ArmGeometry swapped(80.0, 100.0);
    EXPECT_DOUBLE_EQ(swapped.minReach(), 20.0);
}

TEST(ArmGeometryTest, InvalidLengths) {
    EXPECT_FALSE(ArmGeometry(0.0, 80.0).isValid());
    EXPECT_FALSE(ArmGeometry(100.0, 0.0).isValid());
    EXPECT_FALSE(ArmGeometry(-1.0, 80.0).isValid());
    EXPECT_FALSE(ArmGeometry(std::numeric_limits<double>::quiet_NaN(), 80.0).isValid());
    EXPECT_FALSE(ArmGeometry(100.0, std::numeric_limits<double>::infinity()).isValid());
}

TEST(ArmGeometryTest, EqualLinks) {
    EXPECT_TRUE(ArmGeometry(100.0, 100.0).hasEqualLinks());
    EXPECT_DOUBLE_EQ(ArmGeometry(100.0, 100.0).minReach(), 0.0);
}

// ============================================================================
// Forward Kinematics Tests
// ============================================================================

TEST_F(KinematicsTest, FK_Straight) {
    // Fully extended along X
    Vector2d p = PlanarKinematics::forward(arm_, 0.0, 0.0);
    EXPECT_NEAR(p.x(), 180.0, POS_TOL);
    EXPECT_NEAR(p.y(), 0.0, POS_TOL);
}

TEST_F(KinematicsTest, FK_Folded) {
    // Link 2 folded back onto link 1
    Vector2d p = PlanarKinematics::forward(arm_, 0.0, PI);
    EXPECT_NEAR(p.x(), 20.0, POS_TOL);
    EXPECT_NEAR(p.y(), 0.0, POS_TOL);
}

TEST_F(KinematicsTest, FK_RightAngle) {
    Vector2d p = PlanarKinematics::forward(arm_, PI / 2.0, -PI / 2.0);
    EXPECT_NEAR(p.x(), 80.0, POS_TOL);
    EXPECT_NEAR(p.y(), 100.0, POS_TOL);
}

TEST_F(KinematicsTest, FK_BaseOffset) {
    ArmGeometry shifted(100.0, 80.0, 10.0, -20.0);
    Vector2d p = PlanarKinematics::forward(shifted, 0.0, 0.0);
    EXPECT_NEAR(p.x(), 190.0, POS_TOL);
    EXPECT_NEAR(p.y(), -20.0, POS_TOL);
}

TEST_F(KinematicsTest, FK_TotalOverLargeAngles) {
    // Angles outside (-PI, PI] are valid input
    Vector2d a = PlanarKinematics::forward(arm_, 0.4 + 4 * PI, 1.1 - 2 * PI);
    Vector2d b = PlanarKinematics::forward(arm_, 0.4, 1.1);
    EXPECT_NEAR((a - b).norm(), 0.0, 1e-9);
}

TEST_F(KinematicsTest, JointPositions) {
    ArmPose pose = PlanarKinematics::jointPositions(arm_, 0.7, -1.2);

    EXPECT_NEAR(pose.base.norm(), 0.0, POS_TOL);
    EXPECT_NEAR((pose.elbow - pose.base).norm(), 100.0, POS_TOL);
    EXPECT_NEAR((pose.effector - pose.elbow).norm(), 80.0, POS_TOL);
    EXPECT_NEAR((pose.effector - PlanarKinematics::forward(arm_, 0.7, -1.2)).norm(), 0.0, POS_TOL);
}

TEST_F(KinematicsTest, Jacobian_MatchesFiniteDifference) {
    const double t1 = 0.3, t2 = 1.4, h = 1e-6;
    Matrix2d J = PlanarKinematics::jacobian(arm_, t1, t2);

    Vector2d dq1 = (PlanarKinematics::forward(arm_, t1 + h, t2) -
                    PlanarKinematics::forward(arm_, t1 - h, t2)) / (2 * h);
    Vector2d dq2 = (PlanarKinematics::forward(arm_, t1, t2 + h) -
                    PlanarKinematics::forward(arm_, t1, t2 - h)) / (2 * h);

    EXPECT_NEAR(J(0, 0), dq1.x(), 1e-5);
    EXPECT_NEAR(J(1, 0), dq1.y(), 1e-5);
    EXPECT_NEAR(J(0, 1), dq2.x(), 1e-5);
    EXPECT_NEAR(J(1, 1), dq2.y(), 1e-5);
}

// ============================================================================
// Reachability Tests
// ============================================================================

TEST_F(KinematicsTest, Reachable_InsideBounds) {
    EXPECT_TRUE(PlanarKinematics::isReachable(arm_, 150.0, 0.0));
    EXPECT_TRUE(PlanarKinematics::isReachable(arm_, 0.0, -100.0));
    EXPECT_TRUE(PlanarKinematics::isReachable(arm_, 180.0, 0.0));   // max reach
    EXPECT_TRUE(PlanarKinematics::isReachable(arm_, 20.0, 0.0));    // min reach
}

TEST_F(KinematicsTest, Reachable_OutsideBounds) {
    EXPECT_FALSE(PlanarKinematics::isReachable(arm_, 200.0, 0.0));  // too far
    EXPECT_FALSE(PlanarKinematics::isReachable(arm_, 10.0, 0.0));   // too close
    EXPECT_FALSE(PlanarKinematics::isReachable(arm_, 0.0, 0.0));    // the base itself
}

TEST_F(KinematicsTest, Reachable_BoundaryEpsilon) {
    const double eps = 1e-6;
    // Exactly on the boundary circles, in a direction that does not round exactly
    const double c = std::cos(0.7), s = std::sin(0.7);
    EXPECT_TRUE(PlanarKinematics::isReachable(arm_, 180.0 * c, 180.0 * s));
    EXPECT_TRUE(PlanarKinematics::isReachable(arm_, 20.0 * c, 20.0 * s));

    EXPECT_FALSE(PlanarKinematics::isReachable(arm_, 180.0 + eps, 0.0));
    EXPECT_FALSE(PlanarKinematics::isReachable(arm_, 20.0 - eps, 0.0));
}

TEST_F(KinematicsTest, Reachable_BaseOffset) {
    ArmGeometry shifted(100.0, 80.0, 1000.0, 500.0);
    EXPECT_TRUE(PlanarKinematics::isReachable(shifted, 1150.0, 500.0));
    EXPECT_FALSE(PlanarKinematics::isReachable(shifted, 150.0, 0.0));
}

TEST_F(KinematicsTest, ReachBounds) {
    ReachBounds bounds = PlanarKinematics::reachBounds(arm_);
    EXPECT_DOUBLE_EQ(bounds.minReach, 20.0);
    EXPECT_DOUBLE_EQ(bounds.maxReach, 180.0);
}

// ============================================================================
// Inverse Kinematics Tests
// ============================================================================

TEST_F(KinematicsTest, IK_ReachablePoint) {
    IKResult ik = PlanarKinematics::inverse(arm_, 120.0, 50.0);
    ASSERT_TRUE(ik.valid);
    EXPECT_EQ(ik.error.kind, ErrorKind::NONE);

    Vector2d p = PlanarKinematics::forward(arm_, ik.joints);
    EXPECT_NEAR(p.x(), 120.0, 1e-9);
    EXPECT_NEAR(p.y(), 50.0, 1e-9);
}

TEST_F(KinematicsTest, IK_FullyExtended) {
    IKResult ik = PlanarKinematics::inverse(arm_, 180.0, 0.0);
    ASSERT_TRUE(ik.valid);
    EXPECT_NEAR(ik.joints.theta1, 0.0, ANG_TOL);
    EXPECT_NEAR(ik.joints.theta2, 0.0, ANG_TOL);
}

TEST_F(KinematicsTest, IK_FullyFolded) {
    IKResult ik = PlanarKinematics::inverse(arm_, 20.0, 0.0);
    ASSERT_TRUE(ik.valid);
    EXPECT_NEAR(ik.joints.theta1, 0.0, ANG_TOL);
    EXPECT_NEAR(ik.joints.theta2, PI, ANG_TOL);
}

TEST_F(KinematicsTest, IK_BranchSelection) {
    IKResult down = PlanarKinematics::inverse(arm_, 120.0, 50.0, ElbowConfig::DOWN);
    IKResult up = PlanarKinematics::inverse(arm_, 120.0, 50.0, ElbowConfig::UP);
    ASSERT_TRUE(down.valid);
    ASSERT_TRUE(up.valid);

    EXPECT_GT(down.joints.theta2, 0.0);
    EXPECT_LT(up.joints.theta2, 0.0);
    EXPECT_NEAR(down.joints.theta2, -up.joints.theta2, ANG_TOL);

    // Both reach the same point
    EXPECT_NEAR((PlanarKinematics::forward(arm_, up.joints) -
                 PlanarKinematics::forward(arm_, down.joints)).norm(), 0.0, 1e-9);
}

TEST_F(KinematicsTest, IK_Deterministic) {
    IKResult a = PlanarKinematics::inverse(arm_, -37.5, 91.25);
    IKResult b = PlanarKinematics::inverse(arm_, -37.5, 91.25);
    ASSERT_TRUE(a.valid);
    EXPECT_EQ(a.joints.theta1, b.joints.theta1);
    EXPECT_EQ(a.joints.theta2, b.joints.theta2);
}

TEST_F(KinematicsTest, IK_RoundTrip_ElbowDown) {
    // theta2 away from 0 and PI, where acos loses precision
    for (double t1 = -PI + 0.05; t1 <= PI; t1 += 0.2) {
        for (double t2 = 0.1; t2 <= 3.0; t2 += 0.2) {
            Vector2d p = PlanarKinematics::forward(arm_, t1, t2);
            IKResult ik = PlanarKinematics::inverse(arm_, p.x(), p.y(), ElbowConfig::DOWN);
            ASSERT_TRUE(ik.valid) << "t1=" << t1 << " t2=" << t2;
            EXPECT_LT(angleDiff(ik.joints.theta1, t1), 1e-6) << "t1=" << t1 << " t2=" << t2;
            EXPECT_NEAR(ik.joints.theta2, t2, 1e-6) << "t1=" << t1 << " t2=" << t2;
        }
    }
}

TEST_F(KinematicsTest, IK_RoundTrip_ElbowUp) {
    for (double t1 = -PI + 0.05; t1 <= PI; t1 += 0.2) {
        for (double t2 = -3.0; t2 <= -0.1; t2 += 0.2) {
            Vector2d p = PlanarKinematics::forward(arm_, t1, t2);
            IKResult ik = PlanarKinematics::inverse(arm_, p.x(), p.y(), ElbowConfig::UP);
            ASSERT_TRUE(ik.valid) << "t1=" << t1 << " t2=" << t2;
            EXPECT_LT(angleDiff(ik.joints.theta1, t1), 1e-6) << "t1=" << t1 << " t2=" << t2;
            EXPECT_NEAR(ik.joints.theta2, t2, 1e-6) << "t1=" << t1 << " t2=" << t2;
        }
    }
}

TEST_F(KinematicsTest, IK_Theta1Range) {
    for (double a = -PI; a < PI; a += 0.3) {
        IKResult ik = PlanarKinematics::inverse(arm_, 100.0 * std::cos(a), 100.0 * std::sin(a));
        ASSERT_TRUE(ik.valid);
        EXPECT_GT(ik.joints.theta1, -PI);
        EXPECT_LE(ik.joints.theta1, PI);
    }
}

TEST_F(KinematicsTest, IK_OutOfReach) {
    IKResult far = PlanarKinematics::inverse(arm_, 200.0, 0.0);
    EXPECT_FALSE(far.valid);
    EXPECT_EQ(far.error.kind, ErrorKind::OUT_OF_REACH);
    EXPECT_DOUBLE_EQ(far.error.pointX, 200.0);
    EXPECT_DOUBLE_EQ(far.error.pointY, 0.0);
    EXPECT_DOUBLE_EQ(far.error.minReach, 20.0);
    EXPECT_DOUBLE_EQ(far.error.maxReach, 180.0);
    EXPECT_FALSE(far.error.message.empty());

    IKResult close = PlanarKinematics::inverse(arm_, 10.0, 0.0);
    EXPECT_FALSE(close.valid);
    EXPECT_EQ(close.error.kind, ErrorKind::OUT_OF_REACH);
}

TEST_F(KinematicsTest, IK_BoundaryOvershootIsClamped) {
    // A hair outside the outer radius, within tolerance: no NaN
    IKResult ik = PlanarKinematics::inverse(arm_, 180.0 * (1.0 + 1e-12), 0.0);
    ASSERT_TRUE(ik.valid);
    EXPECT_FALSE(std::isnan(ik.joints.theta1));
    EXPECT_FALSE(std::isnan(ik.joints.theta2));
    EXPECT_NEAR(ik.joints.theta2, 0.0, 1e-5);
}

TEST_F(KinematicsTest, IK_EqualLinksAtBase_Degenerate) {
    ArmGeometry equal(100.0, 100.0, 5.0, 5.0);
    IKResult ik = PlanarKinematics::inverse(equal, 5.0, 5.0);
    EXPECT_FALSE(ik.valid);
    EXPECT_EQ(ik.error.kind, ErrorKind::DEGENERATE_CONFIGURATION);

    // Anywhere else it is an ordinary point
    IKResult ok = PlanarKinematics::inverse(equal, 55.0, 5.0);
    ASSERT_TRUE(ok.valid);
    Vector2d p = PlanarKinematics::forward(equal, ok.joints);
    EXPECT_NEAR(p.x(), 55.0, 1e-9);
    EXPECT_NEAR(p.y(), 5.0, 1e-9);
}

TEST_F(KinematicsTest, IK_InvalidInput) {
    IKResult badArm = PlanarKinematics::inverse(ArmGeometry(0.0, 80.0), 50.0, 0.0);
    EXPECT_FALSE(badArm.valid);
    EXPECT_EQ(badArm.error.kind, ErrorKind::INVALID_PARAMETER);

    IKResult nanTarget = PlanarKinematics::inverse(arm_, std::numeric_limits<double>::quiet_NaN(), 0.0);
    EXPECT_FALSE(nanTarget.valid);
    EXPECT_EQ(nanTarget.error.kind, ErrorKind::INVALID_PARAMETER);
}

TEST(SimulationErrorTest, KindNames) {
    EXPECT_EQ(toString(ErrorKind::NONE), "NONE");
    EXPECT_EQ(toString(ErrorKind::INVALID_PARAMETER), "INVALID_PARAMETER");
    EXPECT_EQ(toString(ErrorKind::OUT_OF_REACH), "OUT_OF_REACH");
    EXPECT_EQ(toString(ErrorKind::DEGENERATE_CONFIGURATION), "DEGENERATE_CONFIGURATION");
    EXPECT_FALSE(SimulationError().isError());
    EXPECT_TRUE(SimulationError::invalidParameter("x").isError());
}
