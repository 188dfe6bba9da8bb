/**
 * @file SimulationStates.hpp
 * @brief Per-request simulation states and events
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace planar_arm {
namespace state {

/**
 * Lifecycle of one simulation request
 *
 *   IDLE → VALIDATING → REJECTED
 *                     → SAMPLING → COMPLETE
 *                                → REJECTED   (IK failure mid-path)
 *
 * REJECTED and COMPLETE are terminal; there are no retries.
 */
enum class SimulationState : uint8_t {
    IDLE = 0,
    VALIDATING,
    REJECTED,
    SAMPLING,
    COMPLETE
};

enum class SimulationEvent : uint8_t {
    START = 0,
    VALIDATION_PASSED,
    VALIDATION_FAILED,
    SAMPLING_DONE,
    SAMPLING_FAILED
};

using StateChangeCallback = std::function<void(SimulationState oldState, SimulationState newState)>;

inline bool isTerminal(SimulationState state) {
    return state == SimulationState::REJECTED || state == SimulationState::COMPLETE;
}

inline std::string toString(SimulationState state) {
    switch (state) {
        case SimulationState::IDLE:       return "IDLE";
        case SimulationState::VALIDATING: return "VALIDATING";
        case SimulationState::REJECTED:   return "REJECTED";
        case SimulationState::SAMPLING:   return "SAMPLING";
        case SimulationState::COMPLETE:   return "COMPLETE";
        default:                          return "UNKNOWN";
    }
}

inline std::string toString(SimulationEvent event) {
    switch (event) {
        case SimulationEvent::START:             return "START";
        case SimulationEvent::VALIDATION_PASSED: return "VALIDATION_PASSED";
        case SimulationEvent::VALIDATION_FAILED: return "VALIDATION_FAILED";
        case SimulationEvent::SAMPLING_DONE:     return "SAMPLING_DONE";
        case SimulationEvent::SAMPLING_FAILED:   return "SAMPLING_FAILED";
        default:                                 return "UNKNOWN";
    }
}

} // namespace state
} // namespace planar_arm
