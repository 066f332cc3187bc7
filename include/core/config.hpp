#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "controllers/controller_aggregator.hpp"
#include "model/sensor.hpp"
#include "sensors/signal_generator.hpp"
#include "sorting/sorting_process.hpp"
#include "supervisor/supervisor.hpp"

namespace factory_sim::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  bool enabled{false};
};

struct SimulationConfig {
  std::uint64_t seed{42};
  std::chrono::milliseconds tick_interval{100};
  bool realtime{true};
  std::string topic_prefix{"factory"};
  bool stdout_debug{false};
  // 0 runs until a shutdown is requested.
  double duration_s{0.0};
  // Virtual clock origin; 0 starts from the wall clock.
  std::uint64_t start_time_ms{0};
  RedisConfig redis{};
  sensors::SignalModelParams signal{};
  std::vector<model::SensorProfile> sensors{};
  // Days since the last calibration, per sensor (same order as `sensors`).
  std::vector<double> calibration_age_days{};
  std::vector<controllers::ControllerSettings> controllers{};
  std::optional<sorting::SortingSettings> sorting{};
  supervisor::SupervisorSettings supervisor{};
};

// Parses the indentation-based config file. Throws ConfigurationError on an unreadable
// file, an unknown or malformed value, or an inconsistent topology.
SimulationConfig load_simulation_config(const std::string& path);

SimulationConfig parse_simulation_config(const std::string& text);

// Cross-checks ids and references between sensors, controllers, sorting and supervisor.
void validate_simulation_config(const SimulationConfig& config);

}  // namespace factory_sim::core
