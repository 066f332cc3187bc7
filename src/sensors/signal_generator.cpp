#include "sensors/signal_generator.hpp"

#include <cmath>
#include <string>

#include "core/errors.hpp"
#include "core/math.hpp"
#include "core/timestamp.hpp"
#include "sensors/alert_evaluator.hpp"

namespace factory_sim::sensors {

namespace {

constexpr double kDaySeconds = 86400.0;
constexpr double kAmbientCycleSeconds = 3600.0;

double wave(const double t_s, const double period_s) {
  return std::sin((2.0 * core::kPi * t_s) / period_s);
}

void require_positive(const double value, const char* name) {
  if (!(value > 0.0)) {
    throw core::ConfigurationError(std::string(name) + " must be greater than 0");
  }
}

void require_probability(const double value, const char* name) {
  if (!(value >= 0.0 && value <= 1.0)) {
    throw core::ConfigurationError(std::string(name) + " must be within [0, 1]");
  }
}

}  // namespace

void validate_signal_params(const SignalModelParams& params) {
  require_positive(params.process_period_s, "process_period_s");
  require_positive(params.pump_period_s, "pump_period_s");
  require_positive(params.rotation_period_s, "rotation_period_s");
  require_positive(params.quality_cycle_s, "quality_cycle_s");
  require_positive(params.parts_per_inspection, "parts_per_inspection");
  require_probability(params.pressure_drop_probability, "pressure_drop_probability");
  require_probability(params.pressure_drop_fraction, "pressure_drop_fraction");
  require_probability(params.vibration_spike_probability, "vibration_spike_probability");
  require_probability(params.base_defect_rate, "base_defect_rate");
  if (params.vibration_spike_min < 1.0 || params.vibration_spike_max < params.vibration_spike_min) {
    throw core::ConfigurationError("vibration spike factors must satisfy 1 <= min <= max");
  }
  if (params.drift_rate_per_hour < 0.0 || params.calibration_error_fraction < 0.0) {
    throw core::ConfigurationError("drift and calibration error rates must be non-negative");
  }
}

SignalGenerator::SignalGenerator(const std::uint64_t seed, SignalModelParams params)
    : rng_(seed), params_(params) {
  validate_signal_params(params_);
}

model::SensorState SignalGenerator::initial_state(const model::SensorProfile& profile,
                                                  const std::uint64_t last_calibration_ms) {
  std::uniform_real_distribution<double> wear(0.8, 1.2);

  model::SensorState state{};
  state.base_value = profile.nominal_baseline();
  state.last_calibration_ms = last_calibration_ms;
  state.wear_factor = wear(rng_);
  return state;
}

model::Reading SignalGenerator::tick(model::SensorState& state, const model::SensorProfile& profile,
                                     const std::uint64_t now_ms) {
  const double t_s = core::ms_to_seconds(now_ms);
  const double elapsed_s = (state.last_tick_ms.has_value() && now_ms > *state.last_tick_ms)
                               ? core::ms_to_seconds(now_ms - *state.last_tick_ms)
                               : profile.update_period_s;
  const double operating_hours = state.operating_hours + (elapsed_s / 3600.0);

  model::Reading reading{};
  reading.sensor_id = profile.id;
  reading.controller_id = profile.controller_id;
  reading.kind = profile.kind;
  reading.unit = model::unit_for(profile.kind);
  reading.timestamp_ms = now_ms;

  double base = 0.0;
  double drift = 0.0;
  double value = 0.0;
  if (profile.kind == model::quantity_kind::VISION_DEFECT_COUNT) {
    value = vision_defects(t_s, reading);
    base = value;
  } else {
    std::normal_distribution<double> noise(0.0, profile.accuracy > 0.0 ? profile.accuracy : 1e-12);
    const double noise_value = noise(rng_);
    base = base_pattern(profile, state, t_s);
    drift = params_.drift_rate_per_hour * profile.range() * operating_hours;
    value = base + drift + noise_value + environment_coupling(profile, t_s) +
            calibration_error(profile, state, now_ms);
  }

  reading.value = core::clamp_to(value, profile.min, profile.max);
  reading.alerts = evaluate_alerts(reading, profile, state);

  state.base_value = base;
  state.drift_accumulator = drift;
  state.operating_hours = operating_hours;
  state.previous_value = reading.value;
  state.last_tick_ms = now_ms;
  return reading;
}

const SignalModelParams& SignalGenerator::params() const noexcept { return params_; }

double SignalGenerator::base_pattern(const model::SensorProfile& profile, const model::SensorState& state,
                                     const double t_s) {
  const double range = profile.range();
  const double center = profile.nominal_baseline();

  switch (profile.kind) {
    case model::quantity_kind::TEMPERATURE:
      return center + (0.10 * range * wave(t_s, kDaySeconds)) + (0.20 * range * wave(t_s, params_.process_period_s));

    case model::quantity_kind::PRESSURE: {
      double pressure = center + (0.05 * range * wave(t_s, params_.pump_period_s));
      if (chance(params_.pressure_drop_probability)) {
        pressure -= params_.pressure_drop_fraction * pressure;
      }
      return pressure;
    }

    case model::quantity_kind::VIBRATION: {
      const double baseline = profile.nominal_baseline() * state.wear_factor;
      double vibration = baseline + (0.30 * baseline * wave(t_s, params_.rotation_period_s));
      if (chance(params_.vibration_spike_probability)) {
        std::uniform_real_distribution<double> factor(params_.vibration_spike_min, params_.vibration_spike_max);
        vibration *= factor(rng_);
      }
      return vibration;
    }

    case model::quantity_kind::FLOW:
      return center + (0.05 * range * wave(t_s, 600.0));

    case model::quantity_kind::HUMIDITY:
      return center + (0.15 * range * wave(t_s, kDaySeconds));

    case model::quantity_kind::VISION_DEFECT_COUNT:
      break;
  }
  return center;
}

double SignalGenerator::environment_coupling(const model::SensorProfile& profile, const double t_s) const {
  const double ambient = wave(t_s, kAmbientCycleSeconds);
  switch (profile.kind) {
    case model::quantity_kind::TEMPERATURE:
      return 0.02 * profile.range() * ambient;
    case model::quantity_kind::HUMIDITY:
      return -0.03 * profile.range() * ambient;
    case model::quantity_kind::PRESSURE:
      return 0.01 * profile.range() * ambient;
    case model::quantity_kind::VIBRATION:
    case model::quantity_kind::FLOW:
    case model::quantity_kind::VISION_DEFECT_COUNT:
      break;
  }
  return 0.0;
}

double SignalGenerator::calibration_error(const model::SensorProfile& profile, const model::SensorState& state,
                                          const std::uint64_t now_ms) const {
  if (now_ms <= state.last_calibration_ms) {
    return 0.0;
  }
  const std::uint64_t since = now_ms - state.last_calibration_ms;
  if (since <= profile.calibration_interval_ms) {
    return 0.0;
  }

  const double overdue = static_cast<double>(since - profile.calibration_interval_ms) /
                         static_cast<double>(profile.calibration_interval_ms);
  return params_.calibration_error_fraction * profile.range() * core::clamp01(overdue);
}

double SignalGenerator::vision_defects(const double t_s, model::Reading& reading) {
  const double rate = params_.base_defect_rate * (1.0 + (0.5 * wave(t_s, params_.quality_cycle_s))) *
                      params_.parts_per_inspection;

  double defects = 0.0;
  if (rate > 0.0) {
    std::poisson_distribution<int> poisson(rate);
    defects = static_cast<double>(poisson(rng_));
  }

  std::uniform_real_distribution<double> confidence(0.85, 0.99);
  std::uniform_real_distribution<double> image_quality(0.80, 1.00);
  reading.aux["confidence"] = confidence(rng_);
  reading.aux["image_quality"] = image_quality(rng_);
  reading.aux["inspected"] = params_.parts_per_inspection;
  return defects;
}

bool SignalGenerator::chance(const double probability) {
  std::bernoulli_distribution draw(probability);
  return draw(rng_);
}

}  // namespace factory_sim::sensors
