/**
 * @file SimulationRequest.cpp
 * @brief Simulation request state machine
 *
 * The generator's event stream drives the transitions: a sink adapter
 * turns requested/validated/completed/failed into state events and
 * forwards every event to the caller's sink.
 */

#include "SimulationRequest.hpp"
#include <utility>

namespace planar_arm {
namespace state {

using namespace trajectory;
using namespace kinematics;

// ============================================================================
// Sink adapter
// ============================================================================

class SimulationRequest::StateTrackingSink : public logging::ISimulationEventSink {
public:
    StateTrackingSink(SimulationRequest& request, logging::ISimulationEventSink& downstream)
        : request_(request), downstream_(downstream) {}

    void onRequested(const ArmGeometry& geometry,
                     const CircleSpec& circle,
                     const SamplingSpec& sampling) override {
        request_.processEvent(SimulationEvent::START);
        downstream_.onRequested(geometry, circle, sampling);
    }

    void onValidated(bool reachable) override {
        request_.processEvent(reachable ? SimulationEvent::VALIDATION_PASSED
                                        : SimulationEvent::VALIDATION_FAILED);
        downstream_.onValidated(reachable);
    }

    void onCompleted(size_t sampleCount, double duration) override {
        request_.processEvent(SimulationEvent::SAMPLING_DONE);
        downstream_.onCompleted(sampleCount, duration);
    }

    void onFailed(const SimulationError& error) override {
        // Parameter errors arrive while still VALIDATING
        if (request_.state() == SimulationState::SAMPLING) {
            request_.processEvent(SimulationEvent::SAMPLING_FAILED);
        } else if (request_.state() == SimulationState::VALIDATING) {
            request_.processEvent(SimulationEvent::VALIDATION_FAILED);
        }
        downstream_.onFailed(error);
    }

private:
    SimulationRequest& request_;
    logging::ISimulationEventSink& downstream_;
};

// ============================================================================
// SimulationRequest
// ============================================================================

SimulationRequest::SimulationRequest(const ArmGeometry& geometry,
                                     const CircleSpec& circle,
                                     const SamplingSpec& sampling,
                                     logging::ISimulationEventSink& sink)
    : m_geometry(geometry)
    , m_circle(circle)
    , m_sampling(sampling)
    , m_sink(&sink)
{
    initTransitionTable();
}

SimulationRequest::SimulationRequest(const ArmGeometry& geometry,
                                     const CircleSpec& circle,
                                     const SamplingSpec& sampling)
    : m_geometry(geometry)
    , m_circle(circle)
    , m_sampling(sampling)
    , m_sink(&m_nullSink)
{
    initTransitionTable();
}

void SimulationRequest::initTransitionTable() {
    m_transitions = {
        {SimulationState::IDLE,       SimulationEvent::START,             SimulationState::VALIDATING},
        {SimulationState::VALIDATING, SimulationEvent::VALIDATION_PASSED, SimulationState::SAMPLING},
        {SimulationState::VALIDATING, SimulationEvent::VALIDATION_FAILED, SimulationState::REJECTED},
        {SimulationState::SAMPLING,   SimulationEvent::SAMPLING_DONE,     SimulationState::COMPLETE},
        {SimulationState::SAMPLING,   SimulationEvent::SAMPLING_FAILED,   SimulationState::REJECTED},
    };
}

bool SimulationRequest::canProcess(SimulationEvent event) const {
    for (const auto& rule : m_transitions) {
        if (rule.fromState == m_state && rule.event == event) {
            return true;
        }
    }
    return false;
}

bool SimulationRequest::processEvent(SimulationEvent event) {
    for (const auto& rule : m_transitions) {
        if (rule.fromState == m_state && rule.event == event) {
            SimulationState oldState = m_state;
            m_state = rule.toState;
            if (m_stateChangeCallback) {
                m_stateChangeCallback(oldState, m_state);
            }
            return true;
        }
    }
    return false;
}

bool SimulationRequest::precheck() const {
    return CircularPathGenerator::validateCircle(m_geometry, m_circle);
}

TrajectoryResult SimulationRequest::run() {
    if (m_state != SimulationState::IDLE) {
        return m_result;
    }

    StateTrackingSink tracker(*this, *m_sink);
    m_result = CircularPathGenerator::generate(m_geometry, m_circle, m_sampling, tracker);
    return m_result;
}

} // namespace state
} // namespace planar_arm
