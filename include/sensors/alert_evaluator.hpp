#pragma once

#include <vector>

#include "model/alert.hpp"
#include "model/reading.hpp"
#include "model/sensor.hpp"

namespace factory_sim::sensors {

inline constexpr double kRangeWarningMargin = 0.05;
inline constexpr double kRapidChangePerSecond = 1.0;
inline constexpr double kMechanicalAnomalyFactor = 3.0;

// Pure rule set over one reading. `state` is the sensor state before the tick that
// produced `reading`; it is only read.
std::vector<model::Alert> evaluate_alerts(const model::Reading& reading, const model::SensorProfile& profile,
                                          const model::SensorState& state);

}  // namespace factory_sim::sensors
