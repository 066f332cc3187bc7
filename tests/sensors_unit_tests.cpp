#include <cmath>
#include <cstdint>
#include <iostream>
#include <vector>

#include "core/errors.hpp"
#include "core/sampler.hpp"
#include "model/alert.hpp"
#include "model/reading.hpp"
#include "model/sensor.hpp"
#include "sensors/alert_evaluator.hpp"
#include "sensors/signal_generator.hpp"

using factory_sim::core::ConfigurationError;
using factory_sim::core::Sampler;
using factory_sim::core::ticks_for_period;
using factory_sim::model::Alert;
using factory_sim::model::alert_kind;
using factory_sim::model::kMillisPerDay;
using factory_sim::model::quantity_kind;
using factory_sim::model::Reading;
using factory_sim::model::SensorProfile;
using factory_sim::model::SensorState;
using factory_sim::sensors::evaluate_alerts;
using factory_sim::sensors::SignalGenerator;
using factory_sim::sensors::SignalModelParams;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool almost_equal(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

bool has_alert(const std::vector<Alert>& alerts, alert_kind kind) {
  for (const auto& alert : alerts) {
    if (alert.kind == kind) {
      return true;
    }
  }
  return false;
}

SensorProfile make_profile(const char* id, quantity_kind kind, double min, double max, double period_s) {
  SensorProfile profile{};
  profile.id = id;
  profile.kind = kind;
  profile.min = min;
  profile.max = max;
  profile.accuracy = 0.5;
  profile.update_period_s = period_s;
  profile.controller_id = "plc_01";
  return profile;
}

Reading make_reading(const SensorProfile& profile, double value, std::uint64_t timestamp_ms) {
  Reading reading{};
  reading.sensor_id = profile.id;
  reading.controller_id = profile.controller_id;
  reading.kind = profile.kind;
  reading.value = value;
  reading.unit = factory_sim::model::unit_for(profile.kind);
  reading.timestamp_ms = timestamp_ms;
  return reading;
}

int test_sampler_should_sample_every() {
  Sampler sampler;

  if (!sampler.should_sample_every(1) || !sampler.should_sample_every(50)) {
    return fail("test_sampler_should_sample_every", "tick 0 should be due for every divisor");
  }
  if (sampler.should_sample_every(0)) {
    return fail("test_sampler_should_sample_every", "every 0 must never sample");
  }

  sampler.advance();
  if (sampler.should_sample_every(50)) {
    return fail("test_sampler_should_sample_every", "tick 1 should not sample every 50");
  }

  if (ticks_for_period(5.0, 100) != 50 || ticks_for_period(0.01, 100) != 1 || ticks_for_period(-1.0, 100) != 1) {
    return fail("test_sampler_should_sample_every", "period to divisor conversion mismatch");
  }

  return 0;
}

int test_readings_stay_within_range() {
  const std::vector<SensorProfile> profiles = {
      make_profile("temp", quantity_kind::TEMPERATURE, 60.0, 80.0, 1.0),
      make_profile("pressure", quantity_kind::PRESSURE, 0.0, 10.0, 1.0),
      make_profile("vibration", quantity_kind::VIBRATION, 0.0, 10.0, 1.0),
      make_profile("flow", quantity_kind::FLOW, 0.0, 200.0, 1.0),
      make_profile("humidity", quantity_kind::HUMIDITY, 20.0, 80.0, 1.0),
      make_profile("vision", quantity_kind::VISION_DEFECT_COUNT, 0.0, 100.0, 1.0),
  };

  SignalModelParams params{};
  params.vibration_spike_probability = 0.5;
  params.calibration_error_fraction = 5.0;

  for (const auto& profile : profiles) {
    SignalGenerator generator(7, params);
    SensorState state = generator.initial_state(profile, 0);
    for (std::uint64_t i = 0; i < 2000; ++i) {
      const Reading reading = generator.tick(state, profile, 400ULL * kMillisPerDay + (i * 1000ULL));
      if (reading.value < profile.min || reading.value > profile.max) {
        return fail("test_readings_stay_within_range", profile.id.c_str());
      }
    }
  }

  return 0;
}

int test_equal_seeds_give_equal_readings() {
  const SensorProfile profile = make_profile("vib_01", quantity_kind::VIBRATION, 0.0, 10.0, 1.0);

  SignalGenerator first(1234);
  SignalGenerator second(1234);
  SensorState first_state = first.initial_state(profile, 0);
  SensorState second_state = second.initial_state(profile, 0);

  for (std::uint64_t t = 0; t < 300; ++t) {
    const Reading a = first.tick(first_state, profile, t * 1000ULL);
    const Reading b = second.tick(second_state, profile, t * 1000ULL);
    if (!(a == b)) {
      return fail("test_equal_seeds_give_equal_readings", "equal seeds diverged");
    }
  }

  SignalGenerator other(4321);
  SensorState other_state = other.initial_state(profile, 0);
  SensorState replay_state = SignalGenerator(1234).initial_state(profile, 0);
  if (almost_equal(other_state.wear_factor, replay_state.wear_factor)) {
    return fail("test_equal_seeds_give_equal_readings", "different seeds should draw different wear");
  }

  return 0;
}

int test_temperature_calibration_alert() {
  const SensorProfile profile = make_profile("temp_01", quantity_kind::TEMPERATURE, 60.0, 80.0, 300.0);
  const std::uint64_t now_ms = 200ULL * kMillisPerDay;

  SignalGenerator stale(99);
  SensorState stale_state = stale.initial_state(profile, 0);
  const Reading overdue = stale.tick(stale_state, profile, now_ms);
  if (overdue.value < 60.0 || overdue.value > 80.0) {
    return fail("test_temperature_calibration_alert", "reading left [60, 80]");
  }
  if (!has_alert(overdue.alerts, alert_kind::CALIBRATION_DUE)) {
    return fail("test_temperature_calibration_alert", "calibration alert expected after 200 days");
  }

  SignalGenerator fresh(99);
  SensorState fresh_state = fresh.initial_state(profile, now_ms - (10ULL * kMillisPerDay));
  const Reading recent = fresh.tick(fresh_state, profile, now_ms);
  if (has_alert(recent.alerts, alert_kind::CALIBRATION_DUE)) {
    return fail("test_temperature_calibration_alert", "no calibration alert expected after 10 days");
  }

  if (!fresh_state.previous_value.has_value() || fresh_state.last_tick_ms != now_ms) {
    return fail("test_temperature_calibration_alert", "tick should record previous value and time");
  }

  return 0;
}

int test_range_alerts() {
  const SensorProfile profile = make_profile("press_01", quantity_kind::PRESSURE, 0.0, 10.0, 1.0);
  const SensorState state{};

  const auto pinned = evaluate_alerts(make_reading(profile, 0.0, 1000), profile, state);
  if (!has_alert(pinned, alert_kind::RANGE_WARNING) || !has_alert(pinned, alert_kind::RANGE_CRITICAL)) {
    return fail("test_range_alerts", "value at min should warn and be critical");
  }

  const auto near_top = evaluate_alerts(make_reading(profile, 9.7, 1000), profile, state);
  if (!has_alert(near_top, alert_kind::RANGE_WARNING) || has_alert(near_top, alert_kind::RANGE_CRITICAL)) {
    return fail("test_range_alerts", "value inside the top 5% should only warn");
  }

  const auto nominal = evaluate_alerts(make_reading(profile, 5.0, 1000), profile, state);
  if (!nominal.empty()) {
    return fail("test_range_alerts", "mid-range value should raise nothing");
  }

  for (const auto& alert : pinned) {
    if (alert.sensor_id != "press_01" || alert.timestamp_ms != 1000 || alert.message.empty()) {
      return fail("test_range_alerts", "alert should carry sensor, time and message");
    }
  }

  return 0;
}

int test_rapid_change_and_mechanical_anomaly() {
  const SensorProfile temperature = make_profile("temp_02", quantity_kind::TEMPERATURE, 0.0, 100.0, 1.0);

  SensorState state{};
  const auto first = evaluate_alerts(make_reading(temperature, 50.0, 10'000), temperature, state);
  if (has_alert(first, alert_kind::RAPID_CHANGE)) {
    return fail("test_rapid_change_and_mechanical_anomaly", "no rate without a previous value");
  }

  state.previous_value = 50.0;
  state.last_tick_ms = 9'000;
  const auto jump = evaluate_alerts(make_reading(temperature, 52.5, 10'000), temperature, state);
  if (!has_alert(jump, alert_kind::RAPID_CHANGE)) {
    return fail("test_rapid_change_and_mechanical_anomaly", "2.5 C/s should be a rapid change");
  }

  state.last_tick_ms = 5'000;
  const auto slow = evaluate_alerts(make_reading(temperature, 52.5, 10'000), temperature, state);
  if (has_alert(slow, alert_kind::RAPID_CHANGE)) {
    return fail("test_rapid_change_and_mechanical_anomaly", "0.5 C/s should not alert");
  }

  const SensorProfile vibration = make_profile("vib_02", quantity_kind::VIBRATION, 0.0, 10.0, 1.0);
  if (!almost_equal(vibration.nominal_baseline(), 1.0)) {
    return fail("test_rapid_change_and_mechanical_anomaly", "vibration nominal should default to 10% of range");
  }

  const auto anomaly = evaluate_alerts(make_reading(vibration, 3.5, 1000), vibration, SensorState{});
  if (!has_alert(anomaly, alert_kind::MECHANICAL_ANOMALY)) {
    return fail("test_rapid_change_and_mechanical_anomaly", "3.5 mm/s should exceed three times nominal");
  }

  const auto calm = evaluate_alerts(make_reading(vibration, 2.0, 1000), vibration, SensorState{});
  if (has_alert(calm, alert_kind::MECHANICAL_ANOMALY)) {
    return fail("test_rapid_change_and_mechanical_anomaly", "2.0 mm/s is below the anomaly limit");
  }

  return 0;
}

int test_alert_evaluation_is_pure() {
  const SensorProfile profile = make_profile("temp_03", quantity_kind::TEMPERATURE, 0.0, 100.0, 1.0);
  SensorState state{};
  state.previous_value = 10.0;
  state.last_tick_ms = 1'000;
  state.operating_hours = 3.0;
  const Reading reading = make_reading(profile, 99.0, 2'000);

  const auto first = evaluate_alerts(reading, profile, state);
  const auto second = evaluate_alerts(reading, profile, state);
  if (first != second) {
    return fail("test_alert_evaluation_is_pure", "same inputs produced different alerts");
  }
  if (state.previous_value != 10.0 || state.last_tick_ms != 1'000ULL || !almost_equal(state.operating_hours, 3.0)) {
    return fail("test_alert_evaluation_is_pure", "evaluation must not touch sensor state");
  }

  return 0;
}

int test_vision_reading_aux_fields() {
  const SensorProfile profile = make_profile("vision_01", quantity_kind::VISION_DEFECT_COUNT, 0.0, 100.0, 5.0);
  SignalGenerator generator(5);
  SensorState state = generator.initial_state(profile, 0);

  const Reading reading = generator.tick(state, profile, 5000);
  if (reading.value != std::floor(reading.value) || reading.value < 0.0) {
    return fail("test_vision_reading_aux_fields", "defect count must be a non-negative integer");
  }
  const auto confidence = reading.aux.find("confidence");
  const auto quality = reading.aux.find("image_quality");
  if (confidence == reading.aux.end() || quality == reading.aux.end()) {
    return fail("test_vision_reading_aux_fields", "vision reading should carry confidence and image quality");
  }
  if (confidence->second < 0.85 || confidence->second > 0.99 || quality->second < 0.80 || quality->second > 1.0) {
    return fail("test_vision_reading_aux_fields", "aux values out of range");
  }
  if (reading.unit != "count") {
    return fail("test_vision_reading_aux_fields", "vision unit should be count");
  }

  return 0;
}

int test_profile_and_params_validation() {
  bool threw = false;
  try {
    factory_sim::model::validate_profile(make_profile("bad", quantity_kind::FLOW, 10.0, 10.0, 1.0));
  } catch (const ConfigurationError&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_profile_and_params_validation", "min == max should be rejected");
  }

  threw = false;
  try {
    factory_sim::model::validate_profile(make_profile("bad", quantity_kind::FLOW, 0.0, 10.0, 0.0));
  } catch (const ConfigurationError&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_profile_and_params_validation", "zero update period should be rejected");
  }

  threw = false;
  SignalModelParams params{};
  params.pressure_drop_probability = 1.5;
  try {
    SignalGenerator generator(1, params);
  } catch (const ConfigurationError&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_profile_and_params_validation", "probability above 1 should be rejected");
  }

  if (factory_sim::model::parse_quantity_kind("vision") != quantity_kind::VISION_DEFECT_COUNT ||
      factory_sim::model::parse_quantity_kind("torque").has_value()) {
    return fail("test_profile_and_params_validation", "quantity kind parsing mismatch");
  }

  return 0;
}

int test_zero_defect_count_is_not_critical() {
  const SensorProfile profile = make_profile("vision_02", quantity_kind::VISION_DEFECT_COUNT, 0.0, 100.0, 5.0);

  const auto clean = evaluate_alerts(make_reading(profile, 0.0, 5000), profile, SensorState{});
  if (has_alert(clean, alert_kind::RANGE_CRITICAL)) {
    return fail("test_zero_defect_count_is_not_critical", "zero defects must not be critical");
  }

  const auto saturated = evaluate_alerts(make_reading(profile, 100.0, 5000), profile, SensorState{});
  if (!has_alert(saturated, alert_kind::RANGE_CRITICAL)) {
    return fail("test_zero_defect_count_is_not_critical", "count pinned at max is still critical");
  }

  SignalGenerator generator(42);
  SensorState state = generator.initial_state(profile, 0);
  for (std::uint64_t i = 1; i <= 200; ++i) {
    const Reading reading = generator.tick(state, profile, i * 5000);
    if (reading.value <= profile.min && has_alert(reading.alerts, alert_kind::RANGE_CRITICAL)) {
      return fail("test_zero_defect_count_is_not_critical", "generated clean inspection raised a critical alert");
    }
  }

  return 0;
}

int test_nominal_sets_operating_point() {
  SensorProfile cold_room = make_profile("cold_01", quantity_kind::TEMPERATURE, -40.0, 0.0, 1.0);
  cold_room.nominal = -25.0;
  factory_sim::model::validate_profile(cold_room);
  if (!almost_equal(cold_room.nominal_baseline(), -25.0)) {
    return fail("test_nominal_sets_operating_point", "negative nominal should be honored");
  }

  SignalGenerator generator(7);
  SensorState state = generator.initial_state(cold_room, 0);
  double sum = 0.0;
  const int samples = 300;
  for (int i = 0; i < samples; ++i) {
    sum += generator.tick(state, cold_room, static_cast<std::uint64_t>(i) * 1000).value;
  }
  const double mean = sum / samples;
  if (mean < -30.0 || mean > -20.0) {
    return fail("test_nominal_sets_operating_point", "temperature should center on its nominal");
  }

  const SensorProfile pump = make_profile("press_09", quantity_kind::PRESSURE, 0.0, 10.0, 1.0);
  if (!almost_equal(pump.nominal_baseline(), 6.0)) {
    return fail("test_nominal_sets_operating_point", "pressure should default to 60% of range");
  }

  cold_room.nominal = 5.0;
  bool threw = false;
  try {
    factory_sim::model::validate_profile(cold_room);
  } catch (const ConfigurationError&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_nominal_sets_operating_point", "nominal outside the range should be rejected");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_sampler_should_sample_every(); rc != 0) return rc;
  if (int rc = test_readings_stay_within_range(); rc != 0) return rc;
  if (int rc = test_equal_seeds_give_equal_readings(); rc != 0) return rc;
  if (int rc = test_temperature_calibration_alert(); rc != 0) return rc;
  if (int rc = test_range_alerts(); rc != 0) return rc;
  if (int rc = test_rapid_change_and_mechanical_anomaly(); rc != 0) return rc;
  if (int rc = test_alert_evaluation_is_pure(); rc != 0) return rc;
  if (int rc = test_vision_reading_aux_fields(); rc != 0) return rc;
  if (int rc = test_profile_and_params_validation(); rc != 0) return rc;
  if (int rc = test_zero_defect_count_is_not_critical(); rc != 0) return rc;
  if (int rc = test_nominal_sets_operating_point(); rc != 0) return rc;

  std::cout << "[PASS] sensors unit tests\n";
  return 0;
}
