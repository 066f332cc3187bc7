#include "sensors/alert_evaluator.hpp"

#include <cmath>
#include <cstdio>
#include <string>
#include <utility>

#include "core/timestamp.hpp"

namespace factory_sim::sensors {

namespace {

std::string format_message(const char* format, const double a, const double b, const char* unit) {
  char buffer[160];
  std::snprintf(buffer, sizeof(buffer), format, a, unit, b, unit);
  return buffer;
}

model::Alert make_alert(const model::alert_kind kind, const model::severity level, std::string message,
                        const model::Reading& reading) {
  model::Alert alert{};
  alert.kind = kind;
  alert.level = level;
  alert.message = std::move(message);
  alert.sensor_id = reading.sensor_id;
  alert.timestamp_ms = reading.timestamp_ms;
  return alert;
}

}  // namespace

std::vector<model::Alert> evaluate_alerts(const model::Reading& reading, const model::SensorProfile& profile,
                                          const model::SensorState& state) {
  std::vector<model::Alert> alerts;
  const double margin = kRangeWarningMargin * profile.range();
  const char* unit = reading.unit.c_str();

  if (reading.value <= profile.min + margin) {
    alerts.push_back(make_alert(model::alert_kind::RANGE_WARNING, model::severity::WARNING,
                                format_message("low: %.2f %s near lower limit %.2f %s", reading.value, profile.min, unit),
                                reading));
  }
  if (reading.value >= profile.max - margin) {
    alerts.push_back(make_alert(model::alert_kind::RANGE_WARNING, model::severity::WARNING,
                                format_message("high: %.2f %s near upper limit %.2f %s", reading.value, profile.max, unit),
                                reading));
  }
  // A count at its lower bound is a clean result, not a saturated sensor.
  const bool counts = profile.kind == model::quantity_kind::VISION_DEFECT_COUNT;
  const bool pinned_low = reading.value <= profile.min && !counts;
  if (pinned_low || reading.value >= profile.max) {
    alerts.push_back(make_alert(model::alert_kind::RANGE_CRITICAL, model::severity::CRITICAL,
                                format_message("%.2f %s pinned at range limit %.2f %s", reading.value,
                                               pinned_low ? profile.min : profile.max, unit),
                                reading));
  }

  if (reading.timestamp_ms > state.last_calibration_ms &&
      reading.timestamp_ms - state.last_calibration_ms > profile.calibration_interval_ms) {
    const double days = static_cast<double>(reading.timestamp_ms - state.last_calibration_ms) /
                        static_cast<double>(model::kMillisPerDay);
    char buffer[96];
    std::snprintf(buffer, sizeof(buffer), "calibration overdue: last calibrated %.0f days ago", days);
    alerts.push_back(make_alert(model::alert_kind::CALIBRATION_DUE, model::severity::INFO, buffer, reading));
  }

  if (profile.kind == model::quantity_kind::VIBRATION) {
    const double limit = kMechanicalAnomalyFactor * profile.nominal_baseline();
    if (reading.value > limit) {
      alerts.push_back(make_alert(model::alert_kind::MECHANICAL_ANOMALY, model::severity::CRITICAL,
                                  format_message("vibration %.2f %s exceeds anomaly limit %.2f %s", reading.value,
                                                 limit, unit),
                                  reading));
    }
  }

  if (profile.kind == model::quantity_kind::TEMPERATURE && state.previous_value.has_value()) {
    double tick_seconds = profile.update_period_s;
    if (state.last_tick_ms.has_value() && reading.timestamp_ms > *state.last_tick_ms) {
      tick_seconds = core::ms_to_seconds(reading.timestamp_ms - *state.last_tick_ms);
    }
    const double rate = std::fabs(reading.value - *state.previous_value) / tick_seconds;
    if (rate > kRapidChangePerSecond) {
      char buffer[96];
      std::snprintf(buffer, sizeof(buffer), "temperature changing at %.2f C/s", rate);
      alerts.push_back(make_alert(model::alert_kind::RAPID_CHANGE, model::severity::WARNING, buffer, reading));
    }
  }

  return alerts;
}

}  // namespace factory_sim::sensors
