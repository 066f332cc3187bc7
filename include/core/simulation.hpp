#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <exception>
#include <string>
#include <utility>
#include <vector>

#include "channel/telemetry_channel.hpp"
#include "controllers/controller_aggregator.hpp"
#include "core/config.hpp"
#include "core/sampler.hpp"
#include "model/sensor.hpp"
#include "sensors/signal_generator.hpp"
#include "sorting/sorting_process.hpp"
#include "supervisor/supervisor.hpp"

namespace factory_sim::core {

struct SimulationStats {
  std::size_t ticks_executed{0};
  std::uint64_t readings_published{0};
  std::uint64_t alerts_published{0};
  std::uint64_t publish_failures{0};
  std::uint64_t messages_dispatched{0};
  std::uint64_t entity_failures{0};
};

// Owns every entity of the plant and drives them from one cooperative loop.
class Simulation {
 public:
  // Uses a Redis channel when redis.address is set, otherwise an in-process one.
  explicit Simulation(SimulationConfig config);
  Simulation(SimulationConfig config, std::unique_ptr<channel::TelemetryChannel> channel);
  ~Simulation();

  Simulation(const Simulation&) = delete;
  Simulation& operator=(const Simulation&) = delete;

  // 0 runs until shutdown() is called from a handler.
  SimulationStats run_for_ticks(std::size_t total_ticks);

  // Stops the sorting line, drains pending messages and closes the channel.
  void shutdown();

  // Ticks covered by duration_s; 0 when the run is unbounded.
  [[nodiscard]] std::size_t ticks_for_duration() const noexcept;

  [[nodiscard]] std::uint64_t now_ms() const noexcept;
  [[nodiscard]] const SimulationStats& totals() const noexcept;
  [[nodiscard]] bool is_shut_down() const noexcept;

  [[nodiscard]] const controllers::ControllerAggregator* controller(const std::string& id) const;
  [[nodiscard]] const sorting::SortingProcess* sorting_process() const noexcept;
  [[nodiscard]] const supervisor::Supervisor& supervisor() const noexcept;
  [[nodiscard]] channel::TelemetryChannel& channel() noexcept;

 private:
  struct SensorEntity {
    SensorEntity(model::SensorProfile sensor_profile, std::uint64_t seed, const sensors::SignalModelParams& params,
                 std::uint64_t divisor)
        : profile(std::move(sensor_profile)), generator(seed, params), every_ticks(divisor) {}

    model::SensorProfile profile;
    sensors::SignalGenerator generator;
    model::SensorState state{};
    std::uint64_t every_ticks{1};
  };

  void build_entities();
  void run_sensors(SimulationStats& stats);
  void run_controllers(SimulationStats& stats);
  void dispatch(SimulationStats& stats);
  void publish(const std::string& topic, const channel::Payload& payload, SimulationStats& stats);
  void entity_failed(const std::string& entity, const std::exception& ex, SimulationStats& stats);
  void accumulate(const SimulationStats& stats);

  SimulationConfig config_;
  std::unique_ptr<channel::TelemetryChannel> channel_{};
  std::chrono::milliseconds tick_interval_{};
  std::chrono::steady_clock::time_point next_wakeup_{};
  bool first_tick_{true};
  Sampler sampler_{};
  std::uint64_t start_ms_{0};
  std::uint64_t now_ms_{0};

  std::vector<SensorEntity> sensors_{};
  std::vector<std::unique_ptr<controllers::ControllerAggregator>> controllers_{};
  std::unique_ptr<sorting::SortingProcess> sorting_{};
  std::unique_ptr<supervisor::Supervisor> supervisor_{};

  SimulationStats totals_{};
  bool channel_was_ok_{true};
  bool shut_down_{false};
};

}  // namespace factory_sim::core
