/**
 * @file SimulationConfig.hpp
 * @brief Simulation configuration data structures
 */

#pragma once

#include "../kinematics/ArmGeometry.hpp"
#include "../trajectory/TrajectoryTypes.hpp"
#include <string>

namespace planar_arm {
namespace config {

/**
 * Logging configuration
 */
struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/planar_arm.log";
    int max_size_mb = 10;
    int max_files = 5;
    bool console_enabled = true;
    bool file_enabled = true;
};

/**
 * Trajectory output files; empty path disables that output
 */
struct OutputConfig {
    std::string json = "output/trajectory.json";
    std::string csv = "output/trajectory.csv";
};

/**
 * Complete simulation configuration.
 * Defaults reproduce the simulator's stock input form.
 */
struct SimulationConfig {
    std::string version = "1.0.0";
    kinematics::ArmGeometry arm{1200.0, 800.0, 0.0, 0.0};
    trajectory::CircleSpec circle{0.0, 1500.0, 200.0};
    trajectory::SamplingSpec sampling{100.0, 0.01};
    LoggingConfig logging;
    OutputConfig output;
};

} // namespace config
} // namespace planar_arm
