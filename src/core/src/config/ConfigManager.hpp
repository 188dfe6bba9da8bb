/**
 * @file ConfigManager.hpp
 * @brief Configuration manager - loads and provides access to the simulation configuration
 */

#pragma once

#include <string>
#include "SimulationConfig.hpp"

namespace planar_arm {
namespace config {

/**
 * Configuration Manager
 *
 * Loads a simulation request and logging settings from YAML.
 * Missing keys keep their defaults. Values are not range-checked here;
 * CircularPathGenerator::validateParameters is the single place that
 * rejects non-positive lengths, speeds and time steps.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    /**
     * Load configuration from YAML file
     * @param filepath Path to simulation.yaml
     * @return true if loaded successfully
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * Load configuration from YAML text
     * @return true if parsed successfully
     */
    bool loadFromString(const std::string& yaml);

    /**
     * Save configuration to YAML file
     * @param filepath Path to save
     * @return true if saved successfully
     */
    bool saveToFile(const std::string& filepath) const;

    /**
     * Get simulation configuration (const reference)
     */
    const SimulationConfig& config() const { return m_config; }

    /**
     * Check if a configuration was loaded
     */
    bool isLoaded() const { return m_loaded; }

    /**
     * Get configuration as JSON
     */
    std::string toJson() const;

    /**
     * Parse elbow branch name ("down" / "up")
     * @return false for unknown names
     */
    static bool parseElbow(const std::string& name, kinematics::ElbowConfig& elbow);

private:
    SimulationConfig m_config;
    bool m_loaded = false;
};

} // namespace config
} // namespace planar_arm
