/**
 * @file SimulationRequest.hpp
 * @brief One simulation request driven through the trajectory generator
 */

#pragma once

#include "SimulationStates.hpp"
#include "../trajectory/CircularPathGenerator.hpp"
#include "../logging/ISimulationEventSink.hpp"
#include <utility>
#include <vector>

namespace planar_arm {
namespace state {

/**
 * State transition rule
 */
struct TransitionRule {
    SimulationState fromState;
    SimulationEvent event;
    SimulationState toState;
};

/**
 * Runs a single request: IDLE → VALIDATING → (REJECTED | SAMPLING → COMPLETE).
 *
 * run() computes once; later calls return the stored outcome.
 * A request with corrected parameters is a new SimulationRequest.
 *
 * Usage:
 *   SimulationRequest request(geometry, circle, sampling, sink);
 *   auto result = request.run();
 *   if (result.success) {
 *       // hand result.trajectory to renderer / plotter
 *   }
 */
class SimulationRequest {
public:
    SimulationRequest(const kinematics::ArmGeometry& geometry,
                      const trajectory::CircleSpec& circle,
                      const trajectory::SamplingSpec& sampling,
                      logging::ISimulationEventSink& sink);

    SimulationRequest(const kinematics::ArmGeometry& geometry,
                      const trajectory::CircleSpec& circle,
                      const trajectory::SamplingSpec& sampling);

    // Holds a pointer to its own null sink
    SimulationRequest(const SimulationRequest&) = delete;
    SimulationRequest& operator=(const SimulationRequest&) = delete;

    /**
     * Cheap pre-flight reachability check; does not change state
     */
    bool precheck() const;

    /**
     * Run the request (once) and return a copy of the outcome
     */
    trajectory::TrajectoryResult run();

    SimulationState state() const { return m_state; }
    bool isTerminal() const { return state::isTerminal(m_state); }
    const trajectory::TrajectoryResult& result() const { return m_result; }

    void setStateChangeCallback(StateChangeCallback callback) {
        m_stateChangeCallback = std::move(callback);
    }

    bool canProcess(SimulationEvent event) const;

private:
    class StateTrackingSink;

    void initTransitionTable();
    bool processEvent(SimulationEvent event);

    kinematics::ArmGeometry m_geometry;
    trajectory::CircleSpec m_circle;
    trajectory::SamplingSpec m_sampling;

    logging::NullEventSink m_nullSink;
    logging::ISimulationEventSink* m_sink;

    SimulationState m_state = SimulationState::IDLE;
    trajectory::TrajectoryResult m_result;
    std::vector<TransitionRule> m_transitions;
    StateChangeCallback m_stateChangeCallback;
};

} // namespace state
} // namespace planar_arm
