#pragma once
/**
 * @file core.hpp
 * @brief Main include file for the planar arm simulator core
 */

#include "../../src/kinematics/PlanarKinematics.hpp"
#include "../../src/trajectory/CircularPathGenerator.hpp"
#include "../../src/logging/ISimulationEventSink.hpp"
#include "../../src/state/SimulationRequest.hpp"
