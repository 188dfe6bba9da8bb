/**
 * @file main.cpp
 * @brief Planar arm simulator - Entry Point
 *
 * Usage: planar_arm_sim [config.yaml]
 *
 * Exit codes:
 *   0  trajectory generated and written
 *   1  configuration could not be loaded
 *   2  request rejected (invalid parameters, out of reach, degenerate)
 *   3  trajectory could not be written
 */

#include <string>

#include "logging/Logger.hpp"
#include "logging/SpdlogEventSink.hpp"
#include "config/ConfigManager.hpp"
#include "state/SimulationRequest.hpp"
#include "io/TrajectoryExporter.hpp"

using namespace planar_arm;
using namespace planar_arm::config;

int main(int argc, char* argv[]) {
    std::string config_path = "config/simulation.yaml";
    if (argc > 1) {
        config_path = argv[1];
    }

    // Basic setup, reconfigured after loading config
    Logger::init("logs/planar_arm.log", "info", 10 * 1024 * 1024, 5, true, false);

    LOG_INFO("========================================");
    LOG_INFO("Planar Arm Simulator v1.0.0");
    LOG_INFO("========================================");

    ConfigManager manager;
    if (!manager.loadFromFile(config_path)) {
        LOG_ERROR("Failed to load configuration from: {}", config_path);
        return 1;
    }
    const SimulationConfig& cfg = manager.config();

    // Reconfigure logger based on loaded config
    Logger::shutdown();
    Logger::init(cfg.logging.file,
                 cfg.logging.level,
                 static_cast<size_t>(cfg.logging.max_size_mb) * 1024 * 1024,
                 static_cast<size_t>(cfg.logging.max_files),
                 cfg.logging.console_enabled,
                 cfg.logging.file_enabled);
    LOG_DEBUG("Configuration: {}", manager.toJson());

    logging::SpdlogEventSink sink(Logger::get());
    state::SimulationRequest request(cfg.arm, cfg.circle, cfg.sampling, sink);

    if (!request.precheck()) {
        LOG_WARN("Circle ({}, {}) r={} is not fully inside the reachable annulus [{}, {}]",
                 cfg.circle.centerX, cfg.circle.centerY, cfg.circle.radius,
                 cfg.arm.minReach(), cfg.arm.maxReach());
    }

    const trajectory::TrajectoryResult result = request.run();
    LOG_INFO("Request finished in state {}", state::toString(request.state()));
    if (!result.success) {
        LOG_ERROR("Simulation rejected: {}", result.error.message);
        return 2;
    }

    bool written = true;
    if (!cfg.output.json.empty()) {
        written = io::TrajectoryExporter::writeJson(cfg.output.json, result.trajectory, cfg.arm) && written;
    }
    if (!cfg.output.csv.empty()) {
        written = io::TrajectoryExporter::writeCsv(cfg.output.csv, result.trajectory) && written;
    }
    if (!written) {
        LOG_ERROR("Failed to write trajectory output");
        return 3;
    }

    LOG_INFO("Planar Arm Simulator finished");
    return 0;
}
