/**
 * @file SpdlogEventSink.cpp
 * @brief spdlog-backed simulation event sink
 */

#include "SpdlogEventSink.hpp"
#include <iostream>
#include <utility>

namespace planar_arm {
namespace logging {

SpdlogEventSink::SpdlogEventSink(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

void SpdlogEventSink::onRequested(const kinematics::ArmGeometry& geometry,
                                  const trajectory::CircleSpec& circle,
                                  const trajectory::SamplingSpec& sampling) {
    if (!logger_) return;
    try {
        logger_->info("Simulation requested: L1={}, L2={}, base=({}, {}), center=({}, {}), "
                      "r={}, v={}, dt={}, elbow={}",
                      geometry.link1Length(), geometry.link2Length(),
                      geometry.baseX(), geometry.baseY(),
                      circle.centerX, circle.centerY, circle.radius,
                      sampling.speed, sampling.timeStep,
                      kinematics::toString(sampling.elbow));
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Event sink error: " << ex.what() << std::endl;
    }
}

void SpdlogEventSink::onValidated(bool reachable) {
    if (!logger_) return;
    try {
        logger_->info("Circle validation: {}", reachable ? "reachable" : "out of reach");
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Event sink error: " << ex.what() << std::endl;
    }
}

void SpdlogEventSink::onCompleted(size_t sampleCount, double duration) {
    if (!logger_) return;
    try {
        logger_->info("Simulation completed: {} samples over {:.4f}s", sampleCount, duration);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Event sink error: " << ex.what() << std::endl;
    }
}

void SpdlogEventSink::onFailed(const kinematics::SimulationError& error) {
    if (!logger_) return;
    try {
        if (error.kind == kinematics::ErrorKind::OUT_OF_REACH) {
            logger_->warn("Simulation failed [{}]: {} (point=({:.3f}, {:.3f}), reach=[{}, {}])",
                          kinematics::toString(error.kind), error.message,
                          error.pointX, error.pointY, error.minReach, error.maxReach);
        } else {
            logger_->warn("Simulation failed [{}]: {}",
                          kinematics::toString(error.kind), error.message);
        }
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Event sink error: " << ex.what() << std::endl;
    }
}

} // namespace logging
} // namespace planar_arm
