/**
 * @file SpdlogEventSink.hpp
 * @brief ISimulationEventSink that writes events through an spdlog logger
 */

#pragma once

#include "ISimulationEventSink.hpp"
#include <spdlog/spdlog.h>
#include <memory>

namespace planar_arm {
namespace logging {

/**
 * Formats simulation events as log lines.
 * Failures are logged at warn, everything else at info.
 * spdlog errors are swallowed here so that a broken log file cannot
 * change the outcome of a simulation.
 */
class SpdlogEventSink : public ISimulationEventSink {
public:
    explicit SpdlogEventSink(std::shared_ptr<spdlog::logger> logger);

    void onRequested(const kinematics::ArmGeometry& geometry,
                     const trajectory::CircleSpec& circle,
                     const trajectory::SamplingSpec& sampling) override;
    void onValidated(bool reachable) override;
    void onCompleted(size_t sampleCount, double duration) override;
    void onFailed(const kinematics::SimulationError& error) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace logging
} // namespace planar_arm
