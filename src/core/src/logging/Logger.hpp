/**
 * @file Logger.hpp
 * @brief Logging framework wrapper using spdlog
 *
 * Application-level logger (CLI, config loading). The kinematics and
 * trajectory core never log; they report through ISimulationEventSink.
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

namespace planar_arm {

class Logger {
public:
    /**
     * Initialize the logging system
     * @param log_file Path to log file
     * @param level Log level (trace, debug, info, warn, error)
     * @param max_size Maximum file size in bytes (default 10MB)
     * @param max_files Maximum number of rotated files
     * @param console_enabled Log to colored stdout
     * @param file_enabled Log to rotating file
     */
    static void init(const std::string& log_file = "logs/planar_arm.log",
                     const std::string& level = "info",
                     size_t max_size = 10 * 1024 * 1024,
                     size_t max_files = 5,
                     bool console_enabled = true,
                     bool file_enabled = true);

    /**
     * Get the logger instance
     */
    static std::shared_ptr<spdlog::logger> get();

    /**
     * Drop the current logger so the next init() applies new settings
     */
    static void shutdown();

    /**
     * Parse level name, unknown names map to info
     */
    static spdlog::level::level_enum parseLevel(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> s_logger;
    static bool s_initialized;
};

} // namespace planar_arm

// Convenience macros
#define LOG_TRACE(...) ::planar_arm::Logger::get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::planar_arm::Logger::get()->debug(__VA_ARGS__)
#define LOG_INFO(...)  ::planar_arm::Logger::get()->info(__VA_ARGS__)
#define LOG_WARN(...)  ::planar_arm::Logger::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::planar_arm::Logger::get()->error(__VA_ARGS__)
