#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "model/block.hpp"

namespace factory_sim::model {

enum class connection_status : std::uint8_t {
  ISOLATED = 0,
  CONNECTED = 1,
};

// Aggregate published by a controller on every publish tick.
struct ControllerTelemetry {
  std::string controller_id{};
  std::string stage{};
  std::optional<double> avg_temperature{};
  std::optional<double> max_pressure{};
  bool vibration_alarm{false};
  double health{100.0};
  double defect_count{0.0};
  std::uint32_t active_alerts{0};
  std::size_t children{0};
  std::uint64_t hello_sent{0};
  std::uint64_t hello_received{0};
  std::uint64_t acks_received{0};
  std::uint64_t commands_processed{0};
  std::uint64_t process_events{0};
  connection_status status{connection_status::ISOLATED};
  bool cooling_active{false};
  bool relief_valve_open{false};
  // Effective speed after upstream slowdowns.
  double line_speed{1.0};
  double line_speed_setpoint{1.0};
  std::uint64_t sorted_blocks{0};
  std::optional<double> sorting_efficiency{};
  std::uint64_t timestamp_ms{0};
};

// Periodic sorting report sent to the supervisory node.
struct SortingSummary {
  std::string process_id{};
  std::string controller_id{};
  SortingStats stats{};
  double elapsed_s{0.0};
  std::uint64_t timestamp_ms{0};
};

const char* to_string(connection_status status) noexcept;

// Share of `color` in all processed blocks, in percent. Zero before the first block.
double color_percentage(const SortingStats& stats, block_color color) noexcept;

}  // namespace factory_sim::model
