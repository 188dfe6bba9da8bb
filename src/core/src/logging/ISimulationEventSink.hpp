/**
 * @file ISimulationEventSink.hpp
 * @brief Structured event sink for simulation requests
 *
 * The core reports through a sink passed in by reference; it never
 * touches the process-wide Logger.
 */

#pragma once

#include "../trajectory/TrajectoryTypes.hpp"
#include <cstddef>

namespace planar_arm {
namespace logging {

/**
 * Receives simulation lifecycle events.
 * Implementations must not throw; the result of a run never depends
 * on event delivery.
 */
class ISimulationEventSink {
public:
    virtual ~ISimulationEventSink() = default;

    /// A request was received with these parameters
    virtual void onRequested(const kinematics::ArmGeometry& geometry,
                             const trajectory::CircleSpec& circle,
                             const trajectory::SamplingSpec& sampling) = 0;

    /// Closed-form circle reachability verdict
    virtual void onValidated(bool reachable) = 0;

    /// Trajectory generated
    virtual void onCompleted(size_t sampleCount, double duration) = 0;

    /// Request failed; no trajectory was produced
    virtual void onFailed(const kinematics::SimulationError& error) = 0;
};

/**
 * Sink that drops every event
 */
class NullEventSink : public ISimulationEventSink {
public:
    void onRequested(const kinematics::ArmGeometry&,
                     const trajectory::CircleSpec&,
                     const trajectory::SamplingSpec&) override {}
    void onValidated(bool) override {}
    void onCompleted(size_t, double) override {}
    void onFailed(const kinematics::SimulationError&) override {}
};

} // namespace logging
} // namespace planar_arm
