/**
 * @file CircularPathGenerator.hpp
 * @brief Constant-speed circular path → joint-space trajectory
 *
 * Pipeline:
 *   1. Parameter validation          (INVALID_PARAMETER)
 *   2. Closed-form circle reach test (OUT_OF_REACH)
 *   3. Singular path test            (DEGENERATE_CONFIGURATION)
 *   4. Sample t_k = k·dt on [0, T], closing on t = T
 *   5. IK per sample on the pinned elbow branch, theta1 unwrapped
 *   6. Finite-difference omega and alpha
 *
 * Generation is all-or-nothing and deterministic.
 */

#pragma once

#include "TrajectoryTypes.hpp"
#include "../kinematics/PlanarKinematics.hpp"
#include "../logging/ISimulationEventSink.hpp"
#include <optional>

namespace planar_arm {
namespace trajectory {

/**
 * Nearest and farthest distance from the arm base to the circle
 */
struct CircleReach {
    double nearest = 0.0;   // max(0, |center - base| - r)
    double farthest = 0.0;  // |center - base| + r
};

class CircularPathGenerator {
public:
    /**
     * Check geometry, circle and sampling parameters.
     * @return INVALID_PARAMETER error, or nullopt if all parameters are usable
     */
    static std::optional<SimulationError> validateParameters(
        const ArmGeometry& geometry,
        const CircleSpec& circle,
        const SamplingSpec& sampling);

    static CircleReach circleReach(const ArmGeometry& geometry, const CircleSpec& circle);

    /**
     * Constant-time check that the whole circle lies in the reachable annulus:
     * farthest <= L1+L2 and nearest >= |L1-L2| (tolerant).
     * A base inside the circle counts as nearest = 0.
     */
    static bool validateCircle(const ArmGeometry& geometry, const CircleSpec& circle);

    /**
     * Time to traverse the full circle once (s); 0 for radius 0
     */
    static double pathDuration(const CircleSpec& circle, const SamplingSpec& sampling);

    /**
     * Sample times on [0, T]: k·dt while k·dt <= T, closed with t = T.
     * If the last regular sample misses T by less than dt/2 it is moved to T;
     * otherwise T is appended. Every step after t = 0 is then in
     * [dt/2, 3dt/2), except when T < dt/2 (samples {0, T}).
     */
    static std::vector<double> sampleTimes(double duration, double timeStep);

    /**
     * Generate the trajectory.
     * Events are reported to sink in the order
     * requested → [validated] → completed | failed.
     */
    static TrajectoryResult generate(const ArmGeometry& geometry,
                                     const CircleSpec& circle,
                                     const SamplingSpec& sampling,
                                     logging::ISimulationEventSink& sink);

    static TrajectoryResult generate(const ArmGeometry& geometry,
                                     const CircleSpec& circle,
                                     const SamplingSpec& sampling);

private:
    static SimulationError reachError(const ArmGeometry& geometry,
                                      const CircleSpec& circle,
                                      const CircleReach& reach);

    static TrajectoryResult fail(const SimulationError& error,
                                 logging::ISimulationEventSink& sink);
};

} // namespace trajectory
} // namespace planar_arm
