#include "model/sensor.hpp"

#include <cmath>

#include "core/errors.hpp"

namespace factory_sim::model {

double SensorProfile::nominal_baseline() const noexcept {
  if (nominal.has_value()) {
    return *nominal;
  }
  switch (kind) {
    case quantity_kind::PRESSURE:
      return min + (0.60 * range());
    case quantity_kind::VIBRATION:
      return min + (0.10 * range());
    default:
      return min + (0.5 * range());
  }
}

const char* to_string(const quantity_kind kind) noexcept {
  switch (kind) {
    case quantity_kind::TEMPERATURE:
      return "temperature";
    case quantity_kind::PRESSURE:
      return "pressure";
    case quantity_kind::VIBRATION:
      return "vibration";
    case quantity_kind::FLOW:
      return "flow";
    case quantity_kind::HUMIDITY:
      return "humidity";
    case quantity_kind::VISION_DEFECT_COUNT:
      return "vision_defect_count";
  }
  return "unknown";
}

std::optional<quantity_kind> parse_quantity_kind(const std::string& text) {
  if (text == "temperature") {
    return quantity_kind::TEMPERATURE;
  }
  if (text == "pressure") {
    return quantity_kind::PRESSURE;
  }
  if (text == "vibration") {
    return quantity_kind::VIBRATION;
  }
  if (text == "flow") {
    return quantity_kind::FLOW;
  }
  if (text == "humidity") {
    return quantity_kind::HUMIDITY;
  }
  if (text == "vision_defect_count" || text == "vision") {
    return quantity_kind::VISION_DEFECT_COUNT;
  }
  return std::nullopt;
}

const char* unit_for(const quantity_kind kind) noexcept {
  switch (kind) {
    case quantity_kind::TEMPERATURE:
      return "C";
    case quantity_kind::PRESSURE:
      return "bar";
    case quantity_kind::VIBRATION:
      return "mm/s";
    case quantity_kind::FLOW:
      return "l/min";
    case quantity_kind::HUMIDITY:
      return "%RH";
    case quantity_kind::VISION_DEFECT_COUNT:
      return "count";
  }
  return "";
}

void validate_profile(const SensorProfile& profile) {
  if (profile.id.empty()) {
    throw core::ConfigurationError("sensor id must not be empty");
  }
  if (!std::isfinite(profile.min) || !std::isfinite(profile.max) || profile.min >= profile.max) {
    throw core::ConfigurationError("sensor " + profile.id + ": min must be less than max");
  }
  if (!(profile.update_period_s > 0.0)) {
    throw core::ConfigurationError("sensor " + profile.id + ": update period must be greater than 0");
  }
  if (profile.accuracy < 0.0) {
    throw core::ConfigurationError("sensor " + profile.id + ": accuracy must be non-negative");
  }
  if (profile.nominal.has_value() &&
      (!std::isfinite(*profile.nominal) || *profile.nominal < profile.min || *profile.nominal > profile.max)) {
    throw core::ConfigurationError("sensor " + profile.id + ": nominal must be within [min, max]");
  }
  if (profile.kind == quantity_kind::VIBRATION && !(profile.nominal_baseline() > 0.0)) {
    throw core::ConfigurationError("sensor " + profile.id + ": vibration nominal must be greater than 0");
  }
  if (profile.calibration_interval_ms == 0) {
    throw core::ConfigurationError("sensor " + profile.id + ": calibration interval must be greater than 0");
  }
}

}  // namespace factory_sim::model
