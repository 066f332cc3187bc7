#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace factory_sim::model {

enum class alert_kind : std::uint8_t {
  RANGE_WARNING = 0,
  RANGE_CRITICAL = 1,
  CALIBRATION_DUE = 2,
  RAPID_CHANGE = 3,
  MECHANICAL_ANOMALY = 4,
};

enum class severity : std::uint8_t {
  INFO = 0,
  WARNING = 1,
  CRITICAL = 2,
};

struct Alert {
  alert_kind kind{alert_kind::RANGE_WARNING};
  std::string message{};
  model::severity level{severity::INFO};
  std::string sensor_id{};
  std::uint64_t timestamp_ms{0};

  bool operator==(const Alert& other) const = default;
};

const char* to_string(alert_kind kind) noexcept;
const char* to_string(severity level) noexcept;
std::optional<alert_kind> parse_alert_kind(const std::string& text);
std::optional<severity> parse_severity(const std::string& text);

}  // namespace factory_sim::model
