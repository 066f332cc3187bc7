#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace factory_sim::model {

enum class quantity_kind : std::uint8_t {
  TEMPERATURE = 0,
  PRESSURE = 1,
  VIBRATION = 2,
  FLOW = 3,
  HUMIDITY = 4,
  VISION_DEFECT_COUNT = 5,
};

inline constexpr std::uint64_t kMillisPerDay = 24ULL * 60ULL * 60ULL * 1000ULL;

// Static description of one sensor, built from configuration at startup.
struct SensorProfile {
  std::string id{};
  quantity_kind kind{quantity_kind::TEMPERATURE};
  double min{0.0};
  double max{100.0};
  double accuracy{0.5};
  double update_period_s{5.0};
  // Operating point the signal model centers on; unset uses the kind's default.
  std::optional<double> nominal{};
  std::string controller_id{};
  std::string manufacturer{};
  std::string model{};
  std::uint64_t calibration_interval_ms{180ULL * kMillisPerDay};

  [[nodiscard]] double range() const noexcept { return max - min; }
  [[nodiscard]] double nominal_baseline() const noexcept;
};

// Mutable per-sensor state. Owned by exactly one sensor entity.
struct SensorState {
  double base_value{0.0};
  double drift_accumulator{0.0};
  double operating_hours{0.0};
  std::uint64_t last_calibration_ms{0};
  std::optional<double> previous_value{};
  std::optional<std::uint64_t> last_tick_ms{};
  double wear_factor{1.0};
};

const char* to_string(quantity_kind kind) noexcept;
std::optional<quantity_kind> parse_quantity_kind(const std::string& text);
const char* unit_for(quantity_kind kind) noexcept;

// Throws core::ConfigurationError when the profile cannot drive a generator.
void validate_profile(const SensorProfile& profile);

}  // namespace factory_sim::model
