#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "channel/telemetry_channel.hpp"
#include "controllers/peer_link.hpp"
#include "model/peer_message.hpp"
#include "model/reading.hpp"
#include "model/telemetry.hpp"

namespace factory_sim::controllers {

struct ControllerSettings {
  std::string id{};
  std::string stage{};
  double publish_period_s{5.0};
  double heartbeat_period_s{5.0};
  std::vector<std::string> peers{};
  double hot_threshold{75.0};
  double high_pressure_threshold{8.0};
  double vibration_threshold{2.5};
  double temperature_setpoint{70.0};
  double pressure_setpoint{7.5};
  double line_speed{1.0};
};

void validate_controller_settings(const ControllerSettings& settings);

struct AggregatedMetrics {
  std::optional<double> avg_temperature{};
  std::optional<double> max_pressure{};
  bool vibration_alarm{false};
  double defect_count{0.0};
  std::uint32_t active_alerts{0};
  double health{100.0};
};

// 100 minus fixed penalties, floored at 0. Throws core::SimulationInvariantViolation
// if the result ever leaves [0, 100].
double compute_health(const AggregatedMetrics& metrics, const ControllerSettings& settings);

struct ControllerState {
  std::unordered_map<std::string, model::Reading> children{};
  AggregatedMetrics metrics{};
  std::uint64_t hello_sent{0};
  std::uint64_t hello_received{0};
  std::uint64_t acks_received{0};
  std::uint64_t commands_processed{0};
  std::uint64_t process_events{0};
  std::uint64_t decode_errors{0};
  model::connection_status status{model::connection_status::ISOLATED};
  std::map<std::string, double> process_parameters{};
  std::set<std::string> upstream_alarms{};
  bool cooling_active{false};
  bool relief_valve_open{false};
  double effective_line_speed{1.0};
  std::uint64_t sorted_blocks{0};
  std::uint64_t sorting_jams{0};
  std::optional<double> sorting_efficiency{};
};

// One PLC node: aggregates its child sensors, talks to peers and publishes its state.
// Not thread-safe; the channel serializes every inbound call.
class ControllerAggregator {
 public:
  ControllerAggregator(ControllerSettings settings, channel::TelemetryChannel& channel, std::string topic_prefix);

  // Subscribes to the child sensor topics, the sorting line reports and this node's
  // peer inbox.
  bool attach();

  void on_child_reading(const model::Reading& reading);
  void on_peer_message(const model::PeerMessage& message);
  void on_sorting_report(const channel::Payload& payload);

  // Publishes telemetry and sends heartbeats whenever their periods have elapsed.
  void tick(std::uint64_t now_ms);

  void publish_telemetry(std::uint64_t now_ms);
  void send_heartbeats(std::uint64_t now_ms);
  bool send_command(const std::string& destination, const std::map<std::string, double>& setpoints,
                    std::uint64_t now_ms);

  [[nodiscard]] const ControllerState& state() const noexcept;
  [[nodiscard]] const ControllerSettings& settings() const noexcept;
  [[nodiscard]] model::ControllerTelemetry snapshot(std::uint64_t now_ms) const;

 private:
  void recompute();
  void apply_control_logic();
  void handle_heartbeat(const model::PeerMessage& message);
  void handle_command(const model::PeerMessage& message);
  void handle_process_event(const model::PeerMessage& message);
  void mark_connected(const std::string& peer);
  void announce_alarm_edge(bool active);
  bool send(const model::PeerMessage& message);
  std::uint64_t reply_time(const model::PeerMessage& message) const noexcept;

  ControllerSettings settings_;
  channel::TelemetryChannel& channel_;
  std::string topic_prefix_;
  std::string tag_;
  PeerLink link_;
  ControllerState state_{};
  std::uint64_t now_ms_{0};
  std::optional<std::uint64_t> next_publish_ms_{};
  std::optional<std::uint64_t> next_heartbeat_ms_{};
  bool channel_was_ok_{true};
};

}  // namespace factory_sim::controllers
