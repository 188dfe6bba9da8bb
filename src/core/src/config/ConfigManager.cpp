/**
 * @file ConfigManager.cpp
 * @brief Configuration manager implementation
 */

#include "ConfigManager.hpp"
#include "../logging/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <filesystem>

namespace planar_arm {
namespace config {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

/**
 * Fill cfg from the 'simulation' section; keys that are absent keep cfg's values
 */
bool parseSimulation(const YAML::Node& root, SimulationConfig& cfg) {
    YAML::Node sim = root["simulation"];
    if (!sim) {
        LOG_ERROR("Missing 'simulation' section in config");
        return false;
    }

    cfg.version = sim["version"].as<std::string>(cfg.version);

    // Arm geometry
    if (sim["arm"]) {
        auto arm = sim["arm"];
        double l1 = arm["link1_length"].as<double>(cfg.arm.link1Length());
        double l2 = arm["link2_length"].as<double>(cfg.arm.link2Length());
        double bx = cfg.arm.baseX();
        double by = cfg.arm.baseY();
        if (arm["base"]) {
            bx = arm["base"]["x"].as<double>(bx);
            by = arm["base"]["y"].as<double>(by);
        }
        cfg.arm = kinematics::ArmGeometry(l1, l2, bx, by);
    }

    // Circle
    if (sim["circle"]) {
        auto circle = sim["circle"];
        if (circle["center"]) {
            cfg.circle.centerX = circle["center"]["x"].as<double>(cfg.circle.centerX);
            cfg.circle.centerY = circle["center"]["y"].as<double>(cfg.circle.centerY);
        }
        cfg.circle.radius = circle["radius"].as<double>(cfg.circle.radius);
    }

    // Sampling
    if (sim["sampling"]) {
        auto sampling = sim["sampling"];
        cfg.sampling.speed = sampling["speed"].as<double>(cfg.sampling.speed);
        cfg.sampling.timeStep = sampling["time_step"].as<double>(cfg.sampling.timeStep);
        cfg.sampling.maxSamples = sampling["max_samples"].as<size_t>(cfg.sampling.maxSamples);
        if (sampling["elbow"]) {
            std::string name = sampling["elbow"].as<std::string>();
            if (!ConfigManager::parseElbow(name, cfg.sampling.elbow)) {
                LOG_ERROR("Invalid elbow configuration '{}', expected 'down' or 'up'", name);
                return false;
            }
        }
    }

    // Logging settings
    if (sim["logging"]) {
        auto logging = sim["logging"];
        cfg.logging.level = logging["level"].as<std::string>(cfg.logging.level);
        cfg.logging.file = logging["file"].as<std::string>(cfg.logging.file);
        cfg.logging.max_size_mb = logging["max_size_mb"].as<int>(cfg.logging.max_size_mb);
        cfg.logging.max_files = logging["max_files"].as<int>(cfg.logging.max_files);
        cfg.logging.console_enabled = logging["console_enabled"].as<bool>(cfg.logging.console_enabled);
        cfg.logging.file_enabled = logging["file_enabled"].as<bool>(cfg.logging.file_enabled);
    }

    // Output files
    if (sim["output"]) {
        auto output = sim["output"];
        cfg.output.json = output["json"].as<std::string>(cfg.output.json);
        cfg.output.csv = output["csv"].as<std::string>(cfg.output.csv);
    }

    return true;
}

} // namespace

bool ConfigManager::parseElbow(const std::string& name, kinematics::ElbowConfig& elbow) {
    if (name == "down") {
        elbow = kinematics::ElbowConfig::DOWN;
        return true;
    }
    if (name == "up") {
        elbow = kinematics::ElbowConfig::UP;
        return true;
    }
    return false;
}

bool ConfigManager::loadFromFile(const std::string& filepath) {
    try {
        if (!fs::exists(filepath)) {
            LOG_ERROR("Simulation config file not found: {}", filepath);
            return false;
        }

        LOG_INFO("Loading simulation config from: {}", filepath);

        YAML::Node root = YAML::LoadFile(filepath);
        SimulationConfig cfg;
        if (!parseSimulation(root, cfg)) {
            return false;
        }

        m_config = cfg;
        m_loaded = true;
        LOG_INFO("Simulation config loaded: version {}", m_config.version);
        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in simulation config: {}", e.what());
        return false;
    } catch (const std::exception& e) {
        LOG_ERROR("Error loading simulation config: {}", e.what());
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& yaml) {
    try {
        YAML::Node root = YAML::Load(yaml);
        SimulationConfig cfg;
        if (!parseSimulation(root, cfg)) {
            return false;
        }

        m_config = cfg;
        m_loaded = true;
        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in simulation config: {}", e.what());
        return false;
    }
}

bool ConfigManager::saveToFile(const std::string& filepath) const {
    try {
        YAML::Emitter out;
        out << YAML::BeginMap;
        out << YAML::Key << "simulation" << YAML::Value << YAML::BeginMap;

        out << YAML::Key << "version" << YAML::Value << m_config.version;

        // Arm
        out << YAML::Key << "arm" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "link1_length" << YAML::Value << m_config.arm.link1Length();
        out << YAML::Key << "link2_length" << YAML::Value << m_config.arm.link2Length();
        out << YAML::Key << "base" << YAML::Value << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "x" << YAML::Value << m_config.arm.baseX();
        out << YAML::Key << "y" << YAML::Value << m_config.arm.baseY();
        out << YAML::EndMap;
        out << YAML::EndMap;

        // Circle
        out << YAML::Key << "circle" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "center" << YAML::Value << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "x" << YAML::Value << m_config.circle.centerX;
        out << YAML::Key << "y" << YAML::Value << m_config.circle.centerY;
        out << YAML::EndMap;
        out << YAML::Key << "radius" << YAML::Value << m_config.circle.radius;
        out << YAML::EndMap;

        // Sampling
        out << YAML::Key << "sampling" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "speed" << YAML::Value << m_config.sampling.speed;
        out << YAML::Key << "time_step" << YAML::Value << m_config.sampling.timeStep;
        out << YAML::Key << "elbow" << YAML::Value << kinematics::toString(m_config.sampling.elbow);
        out << YAML::Key << "max_samples" << YAML::Value << m_config.sampling.maxSamples;
        out << YAML::EndMap;

        // Logging
        out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << m_config.logging.level;
        out << YAML::Key << "file" << YAML::Value << m_config.logging.file;
        out << YAML::Key << "max_size_mb" << YAML::Value << m_config.logging.max_size_mb;
        out << YAML::Key << "max_files" << YAML::Value << m_config.logging.max_files;
        out << YAML::Key << "console_enabled" << YAML::Value << m_config.logging.console_enabled;
        out << YAML::Key << "file_enabled" << YAML::Value << m_config.logging.file_enabled;
        out << YAML::EndMap;

        // Output
        out << YAML::Key << "output" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "json" << YAML::Value << m_config.output.json;
        out << YAML::Key << "csv" << YAML::Value << m_config.output.csv;
        out << YAML::EndMap;

        out << YAML::EndMap;  // simulation
        out << YAML::EndMap;  // root

        fs::path path(filepath);
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }

        std::ofstream fout(filepath);
        if (!fout) {
            LOG_ERROR("Cannot open {} for writing", filepath);
            return false;
        }
        fout << out.c_str();
        fout.close();

        LOG_INFO("Simulation config saved to: {}", filepath);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Error saving simulation config: {}", e.what());
        return false;
    }
}

std::string ConfigManager::toJson() const {
    json j;
    j["version"] = m_config.version;

    j["arm"] = {
        {"link1_length", m_config.arm.link1Length()},
        {"link2_length", m_config.arm.link2Length()},
        {"base", {{"x", m_config.arm.baseX()}, {"y", m_config.arm.baseY()}}},
        {"min_reach", m_config.arm.minReach()},
        {"max_reach", m_config.arm.maxReach()}
    };

    j["circle"] = {
        {"center", {{"x", m_config.circle.centerX}, {"y", m_config.circle.centerY}}},
        {"radius", m_config.circle.radius}
    };

    j["sampling"] = {
        {"speed", m_config.sampling.speed},
        {"time_step", m_config.sampling.timeStep},
        {"elbow", kinematics::toString(m_config.sampling.elbow)},
        {"max_samples", m_config.sampling.maxSamples}
    };

    j["logging"] = {
        {"level", m_config.logging.level},
        {"file", m_config.logging.file},
        {"max_size_mb", m_config.logging.max_size_mb},
        {"max_files", m_config.logging.max_files},
        {"console_enabled", m_config.logging.console_enabled},
        {"file_enabled", m_config.logging.file_enabled}
    };

    j["output"] = {
        {"json", m_config.output.json},
        {"csv", m_config.output.csv}
    };

    return j.dump(2);
}

} // namespace config
} // namespace planar_arm
