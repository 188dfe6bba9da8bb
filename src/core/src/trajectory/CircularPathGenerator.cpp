/**
 * @file CircularPathGenerator.cpp
 * @brief Circular path sampling, IK and differentiation
 */

#include "CircularPathGenerator.hpp"
#include "NumericalDifferentiator.hpp"
#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <sstream>

namespace planar_arm {
namespace trajectory {

namespace {

// A closing step shorter than this fraction of dt is merged into the previous step
constexpr double CLOSING_MERGE_FRACTION = 0.5;

bool allFinite(std::initializer_list<double> values) {
    for (double v : values) {
        if (!std::isfinite(v)) return false;
    }
    return true;
}

} // namespace

// ============================================================================
// Validation
// ============================================================================

std::optional<SimulationError> CircularPathGenerator::validateParameters(
    const ArmGeometry& geometry,
    const CircleSpec& circle,
    const SamplingSpec& sampling)
{
    if (!geometry.isValid()) {
        std::ostringstream oss;
        oss << "Link lengths must be positive and finite (L1=" << geometry.link1Length()
            << ", L2=" << geometry.link2Length() << ", base=(" << geometry.baseX()
            << ", " << geometry.baseY() << "))";
        return SimulationError::invalidParameter(oss.str());
    }
    if (!allFinite({circle.centerX, circle.centerY, circle.radius})) {
        return SimulationError::invalidParameter("Circle center and radius must be finite");
    }
    if (circle.radius < 0.0) {
        std::ostringstream oss;
        oss << "Circle radius must not be negative (r=" << circle.radius << ")";
        return SimulationError::invalidParameter(oss.str());
    }
    if (!std::isfinite(sampling.speed) || sampling.speed <= 0.0) {
        std::ostringstream oss;
        oss << "Speed must be positive (v=" << sampling.speed << ")";
        return SimulationError::invalidParameter(oss.str());
    }
    if (!std::isfinite(sampling.timeStep) || sampling.timeStep <= 0.0) {
        std::ostringstream oss;
        oss << "Time step must be positive (dt=" << sampling.timeStep << ")";
        return SimulationError::invalidParameter(oss.str());
    }

    // Regular samples plus the closing sample
    const double expected = std::floor(pathDuration(circle, sampling) / sampling.timeStep) + 2.0;
    if (!std::isfinite(expected) || expected > static_cast<double>(sampling.maxSamples)) {
        std::ostringstream oss;
        oss << "Request needs about " << expected << " samples, limit is "
            << sampling.maxSamples << "; increase the time step";
        return SimulationError::invalidParameter(oss.str());
    }

    return std::nullopt;
}

CircleReach CircularPathGenerator::circleReach(const ArmGeometry& geometry, const CircleSpec& circle) {
    const double dist = (circle.center() - geometry.base()).norm();

    CircleReach reach;
    reach.farthest = dist + circle.radius;
    reach.nearest = std::max(0.0, dist - circle.radius);
    return reach;
}

bool CircularPathGenerator::validateCircle(const ArmGeometry& geometry, const CircleSpec& circle) {
    if (!geometry.isValid() ||
        !allFinite({circle.centerX, circle.centerY, circle.radius}) ||
        circle.radius < 0.0) {
        return false;
    }

    const CircleReach reach = circleReach(geometry, circle);
    const double tol = geometry.reachTolerance();
    return reach.farthest <= geometry.maxReach() + tol &&
           reach.nearest >= geometry.minReach() - tol;
}

SimulationError CircularPathGenerator::reachError(const ArmGeometry& geometry,
                                                  const CircleSpec& circle,
                                                  const CircleReach& reach) {
    // Unit direction base → center; arbitrary when the center is on the base
    Vector2d dir = circle.center() - geometry.base();
    const double dist = dir.norm();
    dir = isNearZero(dist) ? Vector2d(1.0, 0.0) : Vector2d(dir / dist);

    const bool tooFar = reach.farthest > geometry.maxReach() + geometry.reachTolerance();
    const Vector2d point = tooFar ? Vector2d(circle.center() + dir * circle.radius)
                                  : Vector2d(circle.center() - dir * circle.radius);

    std::ostringstream oss;
    if (tooFar) {
        oss << "Circle is out of reach: farthest point (" << point.x() << ", " << point.y()
            << ") is " << reach.farthest << " from the base, max reach is "
            << geometry.maxReach();
    } else {
        oss << "Circle is out of reach: nearest distance " << reach.nearest
            << " from the base is below min reach " << geometry.minReach()
            << " (point (" << point.x() << ", " << point.y() << "))";
    }

    return SimulationError::outOfReach(point.x(), point.y(),
                                       geometry.minReach(), geometry.maxReach(), oss.str());
}

// ============================================================================
// Sampling
// ============================================================================

double CircularPathGenerator::pathDuration(const CircleSpec& circle, const SamplingSpec& sampling) {
    if (circle.radius <= 0.0 || sampling.speed <= 0.0) {
        return 0.0;
    }
    return TWO_PI * circle.radius / sampling.speed;
}

std::vector<double> CircularPathGenerator::sampleTimes(double duration, double timeStep) {
    std::vector<double> times;
    if (duration <= 0.0 || timeStep <= 0.0) {
        times.push_back(0.0);
        return times;
    }

    times.reserve(static_cast<size_t>(duration / timeStep) + 2);
    for (size_t k = 0;; ++k) {
        const double t = static_cast<double>(k) * timeStep;
        if (t > duration) {
            break;
        }
        times.push_back(t);
    }

    // Close the loop on T; a remainder under dt/2 moves the last sample
    if (times.back() < duration) {
        const bool shortRemainder = duration - times.back() < CLOSING_MERGE_FRACTION * timeStep;
        if (shortRemainder && times.size() > 1) {
            times.back() = duration;
        } else {
            times.push_back(duration);
        }
    }
    return times;
}

// ============================================================================
// Generation
// ============================================================================

TrajectoryResult CircularPathGenerator::fail(const SimulationError& error,
                                             logging::ISimulationEventSink& sink) {
    sink.onFailed(error);

    TrajectoryResult result;
    result.success = false;
    result.error = error;
    return result;
}

TrajectoryResult CircularPathGenerator::generate(const ArmGeometry& geometry,
                                                 const CircleSpec& circle,
                                                 const SamplingSpec& sampling) {
    logging::NullEventSink sink;
    return generate(geometry, circle, sampling, sink);
}

TrajectoryResult CircularPathGenerator::generate(const ArmGeometry& geometry,
                                                 const CircleSpec& circle,
                                                 const SamplingSpec& sampling,
                                                 logging::ISimulationEventSink& sink) {
    sink.onRequested(geometry, circle, sampling);

    // ---- Step 1: parameters ----
    if (auto error = validateParameters(geometry, circle, sampling)) {
        return fail(*error, sink);
    }

    // ---- Step 2: closed-form reachability ----
    const bool reachable = validateCircle(geometry, circle);
    sink.onValidated(reachable);
    if (!reachable) {
        return fail(reachError(geometry, circle, circleReach(geometry, circle)), sink);
    }

    // ---- Step 3: path through the singular point of an equal-link arm ----
    const double centerDist = (circle.center() - geometry.base()).norm();
    if (geometry.hasEqualLinks() &&
        std::abs(centerDist - circle.radius) <= geometry.reachTolerance()) {
        std::ostringstream oss;
        oss << "Circle passes through the base of an arm with equal links (L1=L2="
            << geometry.link1Length() << "); theta1 is undetermined there";
        return fail(SimulationError::degenerate(geometry.baseX(), geometry.baseY(), oss.str()), sink);
    }

    // ---- Step 4: sample times ----
    const double duration = pathDuration(circle, sampling);
    const double omega = circle.radius > 0.0 ? sampling.speed / circle.radius : 0.0;
    const std::vector<double> times = sampleTimes(duration, sampling.timeStep);
    const size_t n = times.size();

    // ---- Step 5: IK on the pinned branch ----
    std::vector<double> theta1(n), theta2(n);
    for (size_t k = 0; k < n; ++k) {
        const Vector2d target = circle.pointAt(omega * times[k]);
        const IKResult ik = PlanarKinematics::inverse(geometry, target.x(), target.y(), sampling.elbow);
        if (!ik.valid) {
            return fail(ik.error, sink);
        }

        theta1[k] = k == 0 ? ik.joints.theta1 : unwrapAngle(ik.joints.theta1, theta1[k - 1]);
        theta2[k] = ik.joints.theta2;
    }

    // ---- Step 6: finite differences ----
    const std::vector<double> omega1 = NumericalDifferentiator::differentiate(times, theta1);
    const std::vector<double> omega2 = NumericalDifferentiator::differentiate(times, theta2);
    const std::vector<double> alpha1 = NumericalDifferentiator::differentiate(times, omega1);
    const std::vector<double> alpha2 = NumericalDifferentiator::differentiate(times, omega2);

    // ---- Step 7: assemble ----
    std::vector<TrajectorySample> samples(n);
    for (size_t k = 0; k < n; ++k) {
        TrajectorySample& s = samples[k];
        s.t = times[k];
        s.theta1 = theta1[k];
        s.theta2 = theta2[k];
        s.omega1 = omega1[k];
        s.omega2 = omega2[k];
        s.alpha1 = alpha1[k];
        s.alpha2 = alpha2[k];

        const Vector2d effector = PlanarKinematics::forward(geometry, theta1[k], theta2[k]);
        s.effectorX = effector.x();
        s.effectorY = effector.y();
    }

    TrajectoryResult result;
    result.success = true;
    result.trajectory = Trajectory(std::move(samples));

    sink.onCompleted(result.trajectory.size(), result.trajectory.duration());
    return result;
}

} // namespace trajectory
} // namespace planar_arm
