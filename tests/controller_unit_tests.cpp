#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "channel/codec.hpp"
#include "channel/in_memory_channel.hpp"
#include "channel/topics.hpp"
#include "controllers/controller_aggregator.hpp"
#include "controllers/peer_link.hpp"
#include "model/peer_message.hpp"
#include "model/reading.hpp"
#include "model/telemetry.hpp"
#include "supervisor/supervisor.hpp"

using factory_sim::channel::InMemoryChannel;
using factory_sim::channel::Payload;
using factory_sim::controllers::AggregatedMetrics;
using factory_sim::controllers::compute_health;
using factory_sim::controllers::ControllerAggregator;
using factory_sim::controllers::ControllerSettings;
using factory_sim::controllers::PeerLink;
using factory_sim::model::connection_status;
using factory_sim::model::ControllerTelemetry;
using factory_sim::model::PeerMessage;
using factory_sim::model::peer_message_kind;
using factory_sim::model::quantity_kind;
using factory_sim::model::Reading;
using factory_sim::model::SortingSummary;
using factory_sim::supervisor::Supervisor;
using factory_sim::supervisor::SupervisorSettings;

namespace {

constexpr const char* kPrefix = "factory";

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool almost_equal(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

ControllerSettings make_settings(const std::string& id, std::vector<std::string> peers = {}) {
  ControllerSettings settings{};
  settings.id = id;
  settings.stage = id;
  settings.peers = std::move(peers);
  return settings;
}

Reading make_reading(const std::string& sensor, const std::string& controller, quantity_kind kind, double value,
                     std::uint64_t timestamp_ms) {
  Reading reading{};
  reading.sensor_id = sensor;
  reading.controller_id = controller;
  reading.kind = kind;
  reading.value = value;
  reading.unit = factory_sim::model::unit_for(kind);
  reading.timestamp_ms = timestamp_ms;
  return reading;
}

// Records every peer message addressed to `node`.
void capture_inbox(InMemoryChannel& channel, const std::string& node, std::vector<PeerMessage>& inbox) {
  channel.subscribe(factory_sim::channel::peer_topic(kPrefix, node),
                    [&inbox](const std::string&, const Payload& payload) {
                      inbox.push_back(factory_sim::channel::decode_peer_message(payload));
                    });
}

int test_peer_link_sequences() {
  PeerLink a("plc_a");
  PeerLink b("plc_b");

  const PeerMessage first = a.make_heartbeat("plc_b", 1000);
  const PeerMessage second = a.make_heartbeat("plc_b", 2000);
  if (first.sequence != 1 || second.sequence != 2 || a.last_heartbeat_sequence() != 2) {
    return fail("test_peer_link_sequences", "heartbeat sequences should count from 1");
  }
  if (first.kind != peer_message_kind::HEARTBEAT || first.source != "plc_a" || first.destination != "plc_b") {
    return fail("test_peer_link_sequences", "heartbeat addressing mismatch");
  }

  const auto outcome = b.on_heartbeat(second, 2100);
  if (!outcome.first_seen || outcome.ack.kind != peer_message_kind::ACK || outcome.ack.sequence != 2 ||
      outcome.ack.destination != "plc_a" || outcome.ack.source != "plc_b") {
    return fail("test_peer_link_sequences", "ack should echo the heartbeat sequence back to its sender");
  }

  const auto replay = b.on_heartbeat(second, 2200);
  if (replay.first_seen || replay.ack.sequence != 2) {
    return fail("test_peer_link_sequences", "replayed heartbeat should be acked but not counted");
  }

  const PeerMessage command = a.make_command("plc_b", {{"line_speed", 0.75}}, 3000);
  const PeerMessage response = b.make_response(command, 1, "ok", 3100);
  if (command.payload.at("line_speed") != "0.75" || response.sequence != command.sequence ||
      response.payload.at("applied") != "1" || response.destination != "plc_a") {
    return fail("test_peer_link_sequences", "command/response correlation mismatch");
  }

  return 0;
}

int test_vibration_alarm_lowers_health() {
  InMemoryChannel channel;
  ControllerAggregator controller(make_settings("plc_01"), channel, kPrefix);

  controller.on_child_reading(make_reading("vib_01", "plc_01", quantity_kind::VIBRATION, 3.0, 1000));

  const auto& metrics = controller.state().metrics;
  if (!metrics.vibration_alarm) {
    return fail("test_vibration_alarm_lowers_health", "3.0 mm/s should raise the vibration alarm");
  }
  if (metrics.health > 80.0) {
    return fail("test_vibration_alarm_lowers_health", "health should drop to 80 or below");
  }
  if (!almost_equal(controller.state().effective_line_speed, 0.5)) {
    return fail("test_vibration_alarm_lowers_health", "line speed should be halved during a vibration alarm");
  }

  controller.on_child_reading(make_reading("temp_01", "plc_01", quantity_kind::TEMPERATURE, 80.0, 1100));
  controller.on_child_reading(make_reading("temp_02", "plc_01", quantity_kind::TEMPERATURE, 60.0, 1100));
  controller.on_child_reading(make_reading("press_01", "plc_01", quantity_kind::PRESSURE, 7.9, 1100));
  if (!controller.state().metrics.avg_temperature.has_value() ||
      !almost_equal(*controller.state().metrics.avg_temperature, 70.0) ||
      !almost_equal(*controller.state().metrics.max_pressure, 7.9)) {
    return fail("test_vibration_alarm_lowers_health", "aggregates should be the mean temperature and max pressure");
  }
  if (!controller.state().relief_valve_open || controller.state().cooling_active) {
    return fail("test_vibration_alarm_lowers_health", "relief valve should open above the pressure setpoint only");
  }

  return 0;
}

int test_health_score_stays_in_range() {
  const ControllerSettings settings = make_settings("plc_01");

  AggregatedMetrics worst{};
  worst.avg_temperature = 90.0;
  worst.max_pressure = 9.5;
  worst.vibration_alarm = true;
  if (!almost_equal(compute_health(worst, settings), 55.0)) {
    return fail("test_health_score_stays_in_range", "all penalties should give 55");
  }

  for (int mask = 0; mask < 8; ++mask) {
    AggregatedMetrics metrics{};
    metrics.avg_temperature = (mask & 1) != 0 ? 100.0 : 20.0;
    metrics.max_pressure = (mask & 2) != 0 ? 10.0 : 1.0;
    metrics.vibration_alarm = (mask & 4) != 0;
    const double health = compute_health(metrics, settings);
    if (health < 0.0 || health > 100.0) {
      return fail("test_health_score_stays_in_range", "health left [0, 100]");
    }
  }

  if (!almost_equal(compute_health(AggregatedMetrics{}, settings), 100.0)) {
    return fail("test_health_score_stays_in_range", "no readings should mean full health");
  }

  return 0;
}

int test_heartbeat_ack_is_idempotent() {
  InMemoryChannel channel;
  ControllerAggregator node_b(make_settings("plc_b"), channel, kPrefix);
  if (!node_b.attach()) {
    return fail("test_heartbeat_ack_is_idempotent", "attach failed");
  }

  std::vector<PeerMessage> inbox;
  capture_inbox(channel, "plc_a", inbox);

  PeerLink link_a("plc_a");
  PeerMessage heartbeat = link_a.make_heartbeat("plc_b", 5000);
  heartbeat.sequence = 7;

  channel.publish(factory_sim::channel::peer_topic(kPrefix, "plc_b"), factory_sim::channel::encode_peer_message(heartbeat));
  channel.dispatch_pending();

  if (inbox.size() != 1 || inbox.front().kind != peer_message_kind::ACK || inbox.front().sequence != 7) {
    return fail("test_heartbeat_ack_is_idempotent", "expected exactly one ack with sequence 7");
  }
  if (node_b.state().status != connection_status::CONNECTED || node_b.state().hello_received != 1) {
    return fail("test_heartbeat_ack_is_idempotent", "first heartbeat should connect and count once");
  }

  channel.publish(factory_sim::channel::peer_topic(kPrefix, "plc_b"), factory_sim::channel::encode_peer_message(heartbeat));
  channel.dispatch_pending();

  if (inbox.size() != 2 || inbox.back().sequence != 7) {
    return fail("test_heartbeat_ack_is_idempotent", "replayed heartbeat should still be acked");
  }
  if (node_b.state().hello_received != 1) {
    return fail("test_heartbeat_ack_is_idempotent", "replayed heartbeat must not be counted twice");
  }

  PeerMessage misrouted = heartbeat;
  misrouted.destination = "plc_c";
  misrouted.sequence = 8;
  node_b.on_peer_message(misrouted);
  if (node_b.state().hello_received != 1) {
    return fail("test_heartbeat_ack_is_idempotent", "messages for another node should be ignored");
  }

  return 0;
}

int test_command_applies_known_setpoints() {
  InMemoryChannel channel;
  ControllerAggregator node_b(make_settings("plc_b"), channel, kPrefix);
  node_b.attach();

  std::vector<PeerMessage> inbox;
  capture_inbox(channel, "supervisor", inbox);

  PeerLink supervisor("supervisor");
  const PeerMessage command = supervisor.make_command("plc_b", {{"line_speed", 0.6}, {"bogus", 1.0}}, 1000);
  channel.publish(factory_sim::channel::peer_topic(kPrefix, "plc_b"), factory_sim::channel::encode_peer_message(command));
  channel.dispatch_pending();

  if (node_b.state().commands_processed != 1) {
    return fail("test_command_applies_known_setpoints", "command should be counted");
  }
  if (!almost_equal(node_b.state().process_parameters.at("line_speed"), 0.6) ||
      !almost_equal(node_b.state().effective_line_speed, 0.6)) {
    return fail("test_command_applies_known_setpoints", "line speed setpoint should be applied");
  }
  if (node_b.state().process_parameters.count("bogus") != 0) {
    return fail("test_command_applies_known_setpoints", "unknown setpoints must be ignored");
  }
  if (inbox.size() != 1 || inbox.front().kind != peer_message_kind::RESPONSE ||
      inbox.front().sequence != command.sequence || inbox.front().payload.at("applied") != "1" ||
      inbox.front().payload.at("status") != "ok") {
    return fail("test_command_applies_known_setpoints", "expected one ok response applying one setpoint");
  }
  const auto& echoed = inbox.front().payload;
  if (echoed.count("echo.line_speed") != 1 || echoed.at("echo.line_speed") != "0.6" ||
      echoed.count("echo.bogus") != 1) {
    return fail("test_command_applies_known_setpoints", "response should echo the command's setpoints");
  }

  return 0;
}

int test_process_event_slows_peer() {
  InMemoryChannel channel;
  ControllerAggregator node_a(make_settings("plc_a", {"plc_b"}), channel, kPrefix);
  ControllerAggregator node_b(make_settings("plc_b", {"plc_a"}), channel, kPrefix);
  node_a.attach();
  node_b.attach();

  node_a.on_child_reading(make_reading("vib_a", "plc_a", quantity_kind::VIBRATION, 4.0, 1000));
  channel.dispatch_pending();

  if (node_b.state().upstream_alarms.count("plc_a") != 1 || node_b.state().process_events != 1) {
    return fail("test_process_event_slows_peer", "peer should record the upstream alarm");
  }
  if (!almost_equal(node_b.state().effective_line_speed, 0.8)) {
    return fail("test_process_event_slows_peer", "upstream alarm should reduce line speed to 80%");
  }

  node_a.on_child_reading(make_reading("vib_a", "plc_a", quantity_kind::VIBRATION, 1.0, 2000));
  channel.dispatch_pending();

  if (!node_b.state().upstream_alarms.empty() || !almost_equal(node_b.state().effective_line_speed, 1.0)) {
    return fail("test_process_event_slows_peer", "cleared alarm should restore line speed");
  }

  return 0;
}

int test_tick_publishes_on_schedule() {
  InMemoryChannel channel;
  ControllerAggregator node_a(make_settings("plc_a", {"plc_b"}), channel, kPrefix);
  ControllerAggregator node_b(make_settings("plc_b"), channel, kPrefix);
  node_a.attach();
  node_b.attach();

  std::vector<ControllerTelemetry> telemetry;
  channel.subscribe(factory_sim::channel::controller_telemetry_pattern(kPrefix),
                    [&telemetry](const std::string&, const Payload& payload) {
                      telemetry.push_back(factory_sim::channel::decode_controller_telemetry(payload));
                    });

  node_a.tick(0);
  channel.dispatch_pending();

  if (telemetry.size() != 1 || telemetry.front().controller_id != "plc_a") {
    return fail("test_tick_publishes_on_schedule", "first tick should publish telemetry");
  }
  if (node_a.state().hello_sent != 1 || node_b.state().hello_received != 1) {
    return fail("test_tick_publishes_on_schedule", "first tick should send one heartbeat");
  }
  if (node_a.state().acks_received != 1 || node_a.state().status != connection_status::CONNECTED) {
    return fail("test_tick_publishes_on_schedule", "ack should settle within the same dispatch");
  }

  node_a.tick(1000);
  channel.dispatch_pending();
  if (telemetry.size() != 1 || node_a.state().hello_sent != 1) {
    return fail("test_tick_publishes_on_schedule", "nothing is due one second later");
  }

  node_a.tick(5000);
  channel.dispatch_pending();
  if (telemetry.size() != 2 || node_a.state().hello_sent != 2) {
    return fail("test_tick_publishes_on_schedule", "publish and heartbeat are due after five seconds");
  }
  if (telemetry.back().status != connection_status::CONNECTED || telemetry.back().acks_received != 1 ||
      telemetry.back().timestamp_ms != 5000) {
    return fail("test_tick_publishes_on_schedule", "telemetry should carry link counters");
  }

  return 0;
}

int test_malformed_messages_are_dropped() {
  InMemoryChannel channel;
  ControllerAggregator node(make_settings("plc_a"), channel, kPrefix);
  node.attach();

  Payload garbage{};
  garbage.add("sensor", "vib_x");
  garbage.add("value", "not-a-number");
  channel.publish(factory_sim::channel::sensor_topic(kPrefix, "plc_a", "vib_x"), garbage);
  channel.publish(factory_sim::channel::peer_topic(kPrefix, "plc_a"), garbage);
  channel.dispatch_pending();

  if (!node.state().children.empty() || node.state().decode_errors != 2) {
    return fail("test_malformed_messages_are_dropped", "bad payloads should be counted and not applied");
  }
  if (!almost_equal(node.state().metrics.health, 100.0)) {
    return fail("test_malformed_messages_are_dropped", "state must be untouched");
  }

  return 0;
}

int test_sorting_reports_reach_controller() {
  InMemoryChannel channel;
  ControllerAggregator node(make_settings("color_sort"), channel, kPrefix);
  node.attach();

  Payload report{};
  report.add("total", static_cast<std::uint64_t>(10));
  report.add("efficiency", 0.9);
  report.add("jams", static_cast<std::uint64_t>(1));
  channel.publish(factory_sim::channel::controller_sorting_topic(kPrefix, "color_sort"), report);

  Payload jam{};
  jam.add("event", "jam");
  jam.add("jams", static_cast<std::uint64_t>(2));
  channel.publish(factory_sim::channel::controller_sorting_topic(kPrefix, "color_sort"), jam);
  channel.dispatch_pending();

  if (node.state().sorted_blocks != 10 || node.state().sorting_jams != 2) {
    return fail("test_sorting_reports_reach_controller", "sorting counters not applied");
  }
  const ControllerTelemetry snapshot = node.snapshot(1000);
  if (!snapshot.sorting_efficiency.has_value() || !almost_equal(*snapshot.sorting_efficiency, 0.9)) {
    return fail("test_sorting_reports_reach_controller", "telemetry should expose sorting efficiency");
  }

  return 0;
}

int test_supervisor_lowers_line_speed() {
  InMemoryChannel channel;
  ControllerAggregator sorter_plc(make_settings("color_sort"), channel, kPrefix);
  sorter_plc.attach();

  Supervisor supervisor(SupervisorSettings{}, channel, kPrefix);
  if (!supervisor.attach()) {
    return fail("test_supervisor_lowers_line_speed", "attach failed");
  }

  sorter_plc.publish_telemetry(500);
  channel.dispatch_pending();
  if (supervisor.controllers().count("color_sort") != 1) {
    return fail("test_supervisor_lowers_line_speed", "supervisor should keep controller telemetry");
  }

  SortingSummary summary{};
  summary.process_id = "sorter";
  summary.controller_id = "color_sort";
  summary.stats.total_processed = 10;
  summary.stats.efficiency = 0.8;
  summary.timestamp_ms = 1000;

  channel.publish(factory_sim::channel::supervisor_sorting_topic(kPrefix, "supervisor"),
                  factory_sim::channel::encode_sorting_summary(summary));
  channel.dispatch_pending();

  if (supervisor.commands_sent() != 1 || supervisor.responses_received() != 1) {
    return fail("test_supervisor_lowers_line_speed", "low efficiency should trigger one acknowledged command");
  }
  if (!almost_equal(sorter_plc.state().process_parameters.at("line_speed"), 0.9)) {
    return fail("test_supervisor_lowers_line_speed", "line speed should drop by 10%");
  }
  if (!supervisor.last_sorting_summary().has_value() ||
      supervisor.last_sorting_summary()->stats.total_processed != 10) {
    return fail("test_supervisor_lowers_line_speed", "summary should be retained");
  }

  summary.stats.efficiency = 0.95;
  supervisor.on_sorting_summary(summary);
  channel.dispatch_pending();
  if (supervisor.commands_sent() != 1) {
    return fail("test_supervisor_lowers_line_speed", "healthy efficiency must not send commands");
  }

  summary.stats.efficiency = 0.5;
  for (int i = 0; i < 40; ++i) {
    supervisor.on_sorting_summary(summary);
    channel.dispatch_pending();
  }
  if (!almost_equal(sorter_plc.state().process_parameters.at("line_speed"), 0.2)) {
    return fail("test_supervisor_lowers_line_speed", "line speed should settle at its floor");
  }

  return 0;
}

int test_supervisor_starts_from_configured_line_speed() {
  InMemoryChannel channel;
  ControllerSettings settings = make_settings("color_sort");
  settings.line_speed = 0.5;
  ControllerAggregator sorter_plc(settings, channel, kPrefix);
  sorter_plc.attach();

  Supervisor supervisor(SupervisorSettings{}, channel, kPrefix);
  supervisor.attach();

  sorter_plc.publish_telemetry(500);
  channel.dispatch_pending();
  if (!almost_equal(supervisor.controllers().at("color_sort").line_speed_setpoint, 0.5)) {
    return fail("test_supervisor_starts_from_configured_line_speed", "telemetry should carry the configured setpoint");
  }

  SortingSummary summary{};
  summary.process_id = "sorter";
  summary.controller_id = "color_sort";
  summary.stats.total_processed = 10;
  summary.stats.efficiency = 0.7;
  summary.timestamp_ms = 1000;
  supervisor.on_sorting_summary(summary);
  channel.dispatch_pending();

  if (supervisor.commands_sent() != 1 || !almost_equal(sorter_plc.state().process_parameters.at("line_speed"), 0.45)) {
    return fail("test_supervisor_starts_from_configured_line_speed", "command should lower 0.5 to 0.45");
  }

  summary.timestamp_ms = 2000;
  supervisor.on_sorting_summary(summary);
  channel.dispatch_pending();
  if (supervisor.commands_sent() != 2 || !almost_equal(sorter_plc.state().process_parameters.at("line_speed"), 0.405)) {
    return fail("test_supervisor_starts_from_configured_line_speed", "stale telemetry must not raise the speed");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_peer_link_sequences(); rc != 0) return rc;
  if (int rc = test_vibration_alarm_lowers_health(); rc != 0) return rc;
  if (int rc = test_health_score_stays_in_range(); rc != 0) return rc;
  if (int rc = test_heartbeat_ack_is_idempotent(); rc != 0) return rc;
  if (int rc = test_command_applies_known_setpoints(); rc != 0) return rc;
  if (int rc = test_process_event_slows_peer(); rc != 0) return rc;
  if (int rc = test_tick_publishes_on_schedule(); rc != 0) return rc;
  if (int rc = test_malformed_messages_are_dropped(); rc != 0) return rc;
  if (int rc = test_sorting_reports_reach_controller(); rc != 0) return rc;
  if (int rc = test_supervisor_lowers_line_speed(); rc != 0) return rc;
  if (int rc = test_supervisor_starts_from_configured_line_speed(); rc != 0) return rc;

  std::cout << "[PASS] controller unit tests\n";
  return 0;
}
