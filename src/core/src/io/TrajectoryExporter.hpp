/**
 * @file TrajectoryExporter.hpp
 * @brief Trajectory output for plotting and animation consumers
 */

#pragma once

#include "../trajectory/TrajectoryTypes.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace planar_arm {
namespace io {

/**
 * Writes a trajectory as parallel series.
 *
 * JSON keys: time, theta1, theta2, omega1, omega2, alpha1, alpha2,
 *            end_effector_x, end_effector_y, elbow_x, elbow_y,
 *            sample_count, duration, arm
 * CSV columns: t,theta1,theta2,omega1,omega2,alpha1,alpha2,x,y
 */
class TrajectoryExporter {
public:
    static nlohmann::json toJson(const trajectory::Trajectory& trajectory,
                                 const kinematics::ArmGeometry& geometry);

    static std::string toCsv(const trajectory::Trajectory& trajectory);

    /**
     * Write JSON file (parent directories are created)
     * @return true if written successfully
     */
    static bool writeJson(const std::string& filepath,
                          const trajectory::Trajectory& trajectory,
                          const kinematics::ArmGeometry& geometry);

    /**
     * Write CSV file (parent directories are created)
     * @return true if written successfully
     */
    static bool writeCsv(const std::string& filepath,
                         const trajectory::Trajectory& trajectory);
};

} // namespace io
} // namespace planar_arm
