/**
 * @file TrajectoryExporter.cpp
 * @brief JSON / CSV trajectory export
 */

#include "TrajectoryExporter.hpp"
#include "../kinematics/PlanarKinematics.hpp"
#include "../logging/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace planar_arm {
namespace io {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

bool prepareParent(const std::string& filepath) {
    fs::path path(filepath);
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Cannot create directory {}: {}", path.parent_path().string(), ec.message());
            return false;
        }
    }
    return true;
}

} // namespace

json TrajectoryExporter::toJson(const trajectory::Trajectory& trajectory,
                                const kinematics::ArmGeometry& geometry) {
    const size_t n = trajectory.size();
    std::vector<double> time, theta1, theta2, omega1, omega2, alpha1, alpha2;
    std::vector<double> effX, effY, elbowX, elbowY;
    for (auto* v : {&time, &theta1, &theta2, &omega1, &omega2, &alpha1, &alpha2,
                    &effX, &effY, &elbowX, &elbowY}) {
        v->reserve(n);
    }

    for (const auto& s : trajectory) {
        time.push_back(s.t);
        theta1.push_back(s.theta1);
        theta2.push_back(s.theta2);
        omega1.push_back(s.omega1);
        omega2.push_back(s.omega2);
        alpha1.push_back(s.alpha1);
        alpha2.push_back(s.alpha2);
        effX.push_back(s.effectorX);
        effY.push_back(s.effectorY);

        const auto pose = kinematics::PlanarKinematics::jointPositions(geometry, s.theta1, s.theta2);
        elbowX.push_back(pose.elbow.x());
        elbowY.push_back(pose.elbow.y());
    }

    json j;
    j["arm"] = {
        {"link1_length", geometry.link1Length()},
        {"link2_length", geometry.link2Length()},
        {"base", {{"x", geometry.baseX()}, {"y", geometry.baseY()}}}
    };
    j["sample_count"] = n;
    j["duration"] = trajectory.duration();
    j["time"] = time;
    j["theta1"] = theta1;
    j["theta2"] = theta2;
    j["omega1"] = omega1;
    j["omega2"] = omega2;
    j["alpha1"] = alpha1;
    j["alpha2"] = alpha2;
    j["end_effector_x"] = effX;
    j["end_effector_y"] = effY;
    j["elbow_x"] = elbowX;
    j["elbow_y"] = elbowY;
    return j;
}

std::string TrajectoryExporter::toCsv(const trajectory::Trajectory& trajectory) {
    std::ostringstream oss;
    oss << "t,theta1,theta2,omega1,omega2,alpha1,alpha2,x,y\n";
    oss << std::setprecision(12);
    for (const auto& s : trajectory) {
        oss << s.t << ',' << s.theta1 << ',' << s.theta2 << ','
            << s.omega1 << ',' << s.omega2 << ','
            << s.alpha1 << ',' << s.alpha2 << ','
            << s.effectorX << ',' << s.effectorY << '\n';
    }
    return oss.str();
}

bool TrajectoryExporter::writeJson(const std::string& filepath,
                                   const trajectory::Trajectory& trajectory,
                                   const kinematics::ArmGeometry& geometry) {
    try {
        if (!prepareParent(filepath)) {
            return false;
        }

        std::ofstream fout(filepath);
        if (!fout) {
            LOG_ERROR("Cannot open {} for writing", filepath);
            return false;
        }
        fout << toJson(trajectory, geometry).dump(2);
        fout.close();

        LOG_INFO("Trajectory JSON written to: {} ({} samples)", filepath, trajectory.size());
        return true;

    } catch (const json::exception& e) {
        LOG_ERROR("JSON error writing trajectory: {}", e.what());
        return false;
    } catch (const std::exception& e) {
        LOG_ERROR("Error writing trajectory JSON: {}", e.what());
        return false;
    }
}

bool TrajectoryExporter::writeCsv(const std::string& filepath,
                                  const trajectory::Trajectory& trajectory) {
    try {
        if (!prepareParent(filepath)) {
            return false;
        }

        std::ofstream fout(filepath);
        if (!fout) {
            LOG_ERROR("Cannot open {} for writing", filepath);
            return false;
        }
        fout << toCsv(trajectory);
        fout.close();

        LOG_INFO("Trajectory CSV written to: {} ({} samples)", filepath, trajectory.size());
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Error writing trajectory CSV: {}", e.what());
        return false;
    }
}

} // namespace io
} // namespace planar_arm
