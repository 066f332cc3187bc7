#pragma once

#include <cstdint>
#include <random>

#include "model/reading.hpp"
#include "model/sensor.hpp"

namespace factory_sim::sensors {

// Tunables of the synthetic signal model. Probabilities are per tick.
struct SignalModelParams {
  double process_period_s{300.0};
  double pump_period_s{120.0};
  double pressure_drop_probability{0.10};
  double pressure_drop_fraction{0.10};
  double rotation_period_s{10.0};
  double vibration_spike_probability{0.02};
  double vibration_spike_min{2.0};
  double vibration_spike_max{5.0};
  double base_defect_rate{0.02};
  double quality_cycle_s{3600.0};
  double parts_per_inspection{100.0};
  double drift_rate_per_hour{1e-5};
  double calibration_error_fraction{0.01};
};

void validate_signal_params(const SignalModelParams& params);

// Produces readings for one sensor. All randomness comes from the generator's own
// seeded engine, so equal seeds and equal timestamp sequences give equal readings.
class SignalGenerator {
 public:
  explicit SignalGenerator(std::uint64_t seed, SignalModelParams params = {});

  [[nodiscard]] model::SensorState initial_state(const model::SensorProfile& profile,
                                                 std::uint64_t last_calibration_ms);

  // Advances `state` by one tick and returns the reading with its alerts attached.
  model::Reading tick(model::SensorState& state, const model::SensorProfile& profile, std::uint64_t now_ms);

  [[nodiscard]] const SignalModelParams& params() const noexcept;

 private:
  double base_pattern(const model::SensorProfile& profile, const model::SensorState& state, double t_s);
  double environment_coupling(const model::SensorProfile& profile, double t_s) const;
  double calibration_error(const model::SensorProfile& profile, const model::SensorState& state,
                           std::uint64_t now_ms) const;
  double vision_defects(double t_s, model::Reading& reading);
  bool chance(double probability);

  std::mt19937_64 rng_;
  SignalModelParams params_;
};

}  // namespace factory_sim::sensors
