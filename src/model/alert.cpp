#include "model/alert.hpp"

namespace factory_sim::model {

const char* to_string(const alert_kind kind) noexcept {
  switch (kind) {
    case alert_kind::RANGE_WARNING:
      return "range_warning";
    case alert_kind::RANGE_CRITICAL:
      return "range_critical";
    case alert_kind::CALIBRATION_DUE:
      return "calibration_due";
    case alert_kind::RAPID_CHANGE:
      return "rapid_change";
    case alert_kind::MECHANICAL_ANOMALY:
      return "mechanical_anomaly";
  }
  return "unknown";
}

const char* to_string(const severity level) noexcept {
  switch (level) {
    case severity::INFO:
      return "info";
    case severity::WARNING:
      return "warning";
    case severity::CRITICAL:
      return "critical";
  }
  return "unknown";
}

std::optional<alert_kind> parse_alert_kind(const std::string& text) {
  for (const auto kind : {alert_kind::RANGE_WARNING, alert_kind::RANGE_CRITICAL, alert_kind::CALIBRATION_DUE,
                          alert_kind::RAPID_CHANGE, alert_kind::MECHANICAL_ANOMALY}) {
    if (text == to_string(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

std::optional<severity> parse_severity(const std::string& text) {
  for (const auto level : {severity::INFO, severity::WARNING, severity::CRITICAL}) {
    if (text == to_string(level)) {
      return level;
    }
  }
  return std::nullopt;
}

}  // namespace factory_sim::model
