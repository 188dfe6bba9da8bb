/**
 * @file TrajectoryTypes.hpp
 * @brief Circle, sampling and trajectory types for circular path generation
 */

#pragma once

#include "../kinematics/ArmGeometry.hpp"
#include "../kinematics/SimulationError.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

namespace planar_arm {
namespace trajectory {

using namespace kinematics;

// ============================================================================
// Path and Sampling Parameters
// ============================================================================

/**
 * Circular path of the end effector (mm).
 * radius == 0 is a stationary point and is accepted.
 */
struct CircleSpec {
    double centerX = 0.0;
    double centerY = 1500.0;
    double radius = 200.0;

    CircleSpec() = default;
    CircleSpec(double cx, double cy, double r) : centerX(cx), centerY(cy), radius(r) {}

    Vector2d center() const { return Vector2d(centerX, centerY); }

    /// Point on the circle at the given traversal angle (rad), 0 = +X side
    Vector2d pointAt(double angle) const {
        return Vector2d(centerX + radius * std::cos(angle),
                        centerY + radius * std::sin(angle));
    }
};

/**
 * Time sampling of the path
 */
struct SamplingSpec {
    double speed = 100.0;       // Tangential speed of the end effector (mm/s)
    double timeStep = 0.01;     // Sampling period (s)
    ElbowConfig elbow = ElbowConfig::DOWN;  // Pinned for the whole trajectory
    size_t maxSamples = 10000000;

    SamplingSpec() = default;
    SamplingSpec(double v, double dt, ElbowConfig e = ElbowConfig::DOWN)
        : speed(v), timeStep(dt), elbow(e) {}
};

// ============================================================================
// Trajectory
// ============================================================================

/**
 * One time-stamped record
 */
struct TrajectorySample {
    double t = 0.0;             // s
    double theta1 = 0.0;        // rad
    double theta2 = 0.0;        // rad
    double omega1 = 0.0;        // rad/s
    double omega2 = 0.0;        // rad/s
    double alpha1 = 0.0;        // rad/s²
    double alpha2 = 0.0;        // rad/s²
    double effectorX = 0.0;     // mm, FK of (theta1, theta2)
    double effectorY = 0.0;     // mm
};

/**
 * Parallel series for a plot: time plus one value per joint
 */
struct PlotSeries {
    std::vector<double> time;
    std::vector<double> joint1;
    std::vector<double> joint2;
};

/**
 * Ordered, immutable sequence of samples (insertion order = time order)
 */
class Trajectory {
public:
    Trajectory() = default;
    explicit Trajectory(std::vector<TrajectorySample> samples)
        : samples_(std::move(samples)) {}

    const std::vector<TrajectorySample>& samples() const { return samples_; }
    size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }

    const TrajectorySample& operator[](size_t i) const { return samples_[i]; }
    const TrajectorySample& front() const { return samples_.front(); }
    const TrajectorySample& back() const { return samples_.back(); }

    std::vector<TrajectorySample>::const_iterator begin() const { return samples_.begin(); }
    std::vector<TrajectorySample>::const_iterator end() const { return samples_.end(); }

    /// Time of the last sample (0 for an empty trajectory)
    double duration() const { return samples_.empty() ? 0.0 : samples_.back().t; }

    // Plot series
    PlotSeries angleSeries() const {
        return series(&TrajectorySample::theta1, &TrajectorySample::theta2);
    }
    PlotSeries velocitySeries() const {
        return series(&TrajectorySample::omega1, &TrajectorySample::omega2);
    }
    PlotSeries accelerationSeries() const {
        return series(&TrajectorySample::alpha1, &TrajectorySample::alpha2);
    }

    /**
     * Largest |Δtheta1| or |Δtheta2| between consecutive samples.
     * A branch flip or an unwrapping failure shows up as a step near PI or 2*PI.
     */
    double maxAngleStep() const {
        double step = 0.0;
        for (size_t i = 1; i < samples_.size(); ++i) {
            step = std::max(step, std::abs(samples_[i].theta1 - samples_[i - 1].theta1));
            step = std::max(step, std::abs(samples_[i].theta2 - samples_[i - 1].theta2));
        }
        return step;
    }

private:
    PlotSeries series(double TrajectorySample::*first, double TrajectorySample::*second) const {
        PlotSeries s;
        s.time.reserve(samples_.size());
        s.joint1.reserve(samples_.size());
        s.joint2.reserve(samples_.size());
        for (const auto& sample : samples_) {
            s.time.push_back(sample.t);
            s.joint1.push_back(sample.*first);
            s.joint2.push_back(sample.*second);
        }
        return s;
    }

    std::vector<TrajectorySample> samples_;
};

/**
 * Result of trajectory generation. All-or-nothing:
 * trajectory is empty whenever success is false.
 */
struct TrajectoryResult {
    bool success = false;
    Trajectory trajectory;
    SimulationError error;
};

} // namespace trajectory
} // namespace planar_arm
