#include "channel/codec.hpp"

#include <string>

#include "core/errors.hpp"

namespace factory_sim::channel {

namespace {

constexpr const char* kAuxPrefix = "aux.";
constexpr const char* kPayloadPrefix = "p.";

std::string alert_key(const std::size_t index, const char* field) {
  return "alert." + std::to_string(index) + "." + field;
}

template <typename T, typename Parser>
T require_enum(const FieldReader& fields, const std::string& key, Parser parse) {
  const std::string& text = fields.require(key);
  const auto parsed = parse(text);
  if (!parsed.has_value()) {
    throw core::DecodeError("field " + key + " has unknown value " + text);
  }
  return *parsed;
}

}  // namespace

Payload encode_reading(const model::Reading& reading) {
  Payload payload{};
  payload.add("sensor", reading.sensor_id);
  payload.add("controller", reading.controller_id);
  payload.add("kind", model::to_string(reading.kind));
  payload.add("value", reading.value);
  payload.add("unit", reading.unit);
  payload.add("ts", reading.timestamp_ms);
  for (const auto& [key, value] : reading.aux) {
    payload.add(kAuxPrefix + key, value);
  }
  payload.add("alerts", static_cast<std::uint64_t>(reading.alerts.size()));
  for (std::size_t i = 0; i < reading.alerts.size(); ++i) {
    const model::Alert& alert = reading.alerts[i];
    payload.add(alert_key(i, "kind"), model::to_string(alert.kind));
    payload.add(alert_key(i, "severity"), model::to_string(alert.level));
    payload.add(alert_key(i, "message"), alert.message);
  }
  return payload;
}

model::Reading decode_reading(const Payload& payload) {
  const FieldReader fields(payload);

  model::Reading reading{};
  reading.sensor_id = fields.require("sensor");
  reading.controller_id = fields.get("controller").value_or("");
  reading.kind = require_enum<model::quantity_kind>(fields, "kind", model::parse_quantity_kind);
  reading.value = fields.require_double("value");
  reading.unit = fields.get("unit").value_or(model::unit_for(reading.kind));
  reading.timestamp_ms = fields.require_u64("ts");

  for (const auto& [key, value] : fields.with_prefix(kAuxPrefix)) {
    reading.aux[key] = fields.require_double(kAuxPrefix + key);
  }

  const std::uint64_t alert_count = fields.get_u64("alerts").value_or(0);
  for (std::uint64_t i = 0; i < alert_count; ++i) {
    model::Alert alert{};
    alert.kind = require_enum<model::alert_kind>(fields, alert_key(i, "kind"), model::parse_alert_kind);
    alert.level = require_enum<model::severity>(fields, alert_key(i, "severity"), model::parse_severity);
    alert.message = fields.get(alert_key(i, "message")).value_or("");
    alert.sensor_id = reading.sensor_id;
    alert.timestamp_ms = reading.timestamp_ms;
    reading.alerts.push_back(std::move(alert));
  }
  return reading;
}

Payload encode_alert(const model::Alert& alert) {
  Payload payload{};
  payload.add("sensor", alert.sensor_id);
  payload.add("kind", model::to_string(alert.kind));
  payload.add("severity", model::to_string(alert.level));
  payload.add("message", alert.message);
  payload.add("ts", alert.timestamp_ms);
  return payload;
}

Payload encode_peer_message(const model::PeerMessage& message) {
  Payload payload{};
  payload.add("src", message.source);
  payload.add("dst", message.destination);
  payload.add("kind", model::to_string(message.kind));
  payload.add("seq", message.sequence);
  payload.add("ts", message.timestamp_ms);
  for (const auto& [key, value] : message.payload) {
    payload.add(kPayloadPrefix + key, value);
  }
  return payload;
}

model::PeerMessage decode_peer_message(const Payload& payload) {
  const FieldReader fields(payload);

  model::PeerMessage message{};
  message.source = fields.require("src");
  message.destination = fields.require("dst");
  message.kind = require_enum<model::peer_message_kind>(fields, "kind", model::parse_peer_message_kind);
  message.sequence = fields.require_u64("seq");
  message.timestamp_ms = fields.get_u64("ts").value_or(0);
  for (auto& [key, value] : fields.with_prefix(kPayloadPrefix)) {
    message.payload[key] = value;
  }

  if (message.source.empty() || message.destination.empty()) {
    throw core::DecodeError("peer message without source or destination");
  }
  return message;
}

Payload encode_controller_telemetry(const model::ControllerTelemetry& telemetry) {
  Payload payload{};
  payload.add("controller", telemetry.controller_id);
  payload.add("stage", telemetry.stage);
  if (telemetry.avg_temperature.has_value()) {
    payload.add("avg_temperature", *telemetry.avg_temperature);
  }
  if (telemetry.max_pressure.has_value()) {
    payload.add("max_pressure", *telemetry.max_pressure);
  }
  payload.add("vibration_alarm", telemetry.vibration_alarm);
  payload.add("health", telemetry.health);
  payload.add("defect_count", telemetry.defect_count);
  payload.add("active_alerts", static_cast<std::uint64_t>(telemetry.active_alerts));
  payload.add("children", static_cast<std::uint64_t>(telemetry.children));
  payload.add("hello_sent", telemetry.hello_sent);
  payload.add("hello_received", telemetry.hello_received);
  payload.add("acks_received", telemetry.acks_received);
  payload.add("commands_processed", telemetry.commands_processed);
  payload.add("process_events", telemetry.process_events);
  payload.add("status", model::to_string(telemetry.status));
  payload.add("cooling_active", telemetry.cooling_active);
  payload.add("relief_valve_open", telemetry.relief_valve_open);
  payload.add("line_speed", telemetry.line_speed);
  payload.add("line_speed_setpoint", telemetry.line_speed_setpoint);
  if (telemetry.sorting_efficiency.has_value()) {
    payload.add("sorted_blocks", telemetry.sorted_blocks);
    payload.add("sorting_efficiency", *telemetry.sorting_efficiency);
  }
  payload.add("ts", telemetry.timestamp_ms);
  return payload;
}

model::ControllerTelemetry decode_controller_telemetry(const Payload& payload) {
  const FieldReader fields(payload);

  model::ControllerTelemetry telemetry{};
  telemetry.controller_id = fields.require("controller");
  telemetry.stage = fields.get("stage").value_or("");
  telemetry.avg_temperature = fields.get_double("avg_temperature");
  telemetry.max_pressure = fields.get_double("max_pressure");
  telemetry.vibration_alarm = fields.require_bool("vibration_alarm");
  telemetry.health = fields.require_double("health");
  telemetry.defect_count = fields.get_double("defect_count").value_or(0.0);
  telemetry.active_alerts = static_cast<std::uint32_t>(fields.get_u64("active_alerts").value_or(0));
  telemetry.children = static_cast<std::size_t>(fields.get_u64("children").value_or(0));
  telemetry.hello_sent = fields.get_u64("hello_sent").value_or(0);
  telemetry.hello_received = fields.get_u64("hello_received").value_or(0);
  telemetry.acks_received = fields.get_u64("acks_received").value_or(0);
  telemetry.commands_processed = fields.get_u64("commands_processed").value_or(0);
  telemetry.process_events = fields.get_u64("process_events").value_or(0);
  telemetry.status = fields.get("status").value_or("") == "connected" ? model::connection_status::CONNECTED
                                                                       : model::connection_status::ISOLATED;
  telemetry.cooling_active = fields.has("cooling_active") && fields.require_bool("cooling_active");
  telemetry.relief_valve_open = fields.has("relief_valve_open") && fields.require_bool("relief_valve_open");
  telemetry.line_speed = fields.get_double("line_speed").value_or(1.0);
  telemetry.line_speed_setpoint = fields.get_double("line_speed_setpoint").value_or(telemetry.line_speed);
  telemetry.sorted_blocks = fields.get_u64("sorted_blocks").value_or(0);
  telemetry.sorting_efficiency = fields.get_double("sorting_efficiency");
  telemetry.timestamp_ms = fields.require_u64("ts");
  return telemetry;
}

Payload encode_sorting_summary(const model::SortingSummary& summary) {
  const model::SortingStats& stats = summary.stats;

  Payload payload{};
  payload.add("process", summary.process_id);
  payload.add("controller", summary.controller_id);
  payload.add("total", stats.total_processed);
  payload.add("red", stats.red);
  payload.add("blue", stats.blue);
  payload.add("green", stats.green);
  payload.add("yellow", stats.yellow);
  payload.add("unknown", stats.unknown);
  payload.add("jams", stats.jams);
  payload.add("pct_red", model::color_percentage(stats, model::block_color::RED));
  payload.add("pct_blue", model::color_percentage(stats, model::block_color::BLUE));
  payload.add("pct_green", model::color_percentage(stats, model::block_color::GREEN));
  payload.add("pct_yellow", model::color_percentage(stats, model::block_color::YELLOW));
  payload.add("pct_unknown", model::color_percentage(stats, model::block_color::UNKNOWN));
  payload.add("efficiency", stats.efficiency);
  payload.add("throughput_per_hour", stats.throughput_per_hour);
  payload.add("elapsed_s", summary.elapsed_s);
  payload.add("ts", summary.timestamp_ms);
  return payload;
}

model::SortingSummary decode_sorting_summary(const Payload& payload) {
  const FieldReader fields(payload);

  model::SortingSummary summary{};
  summary.process_id = fields.require("process");
  summary.controller_id = fields.get("controller").value_or("");
  summary.stats.total_processed = fields.require_u64("total");
  summary.stats.red = fields.get_u64("red").value_or(0);
  summary.stats.blue = fields.get_u64("blue").value_or(0);
  summary.stats.green = fields.get_u64("green").value_or(0);
  summary.stats.yellow = fields.get_u64("yellow").value_or(0);
  summary.stats.unknown = fields.get_u64("unknown").value_or(0);
  summary.stats.jams = fields.get_u64("jams").value_or(0);
  summary.stats.efficiency = fields.require_double("efficiency");
  summary.stats.throughput_per_hour = fields.get_double("throughput_per_hour").value_or(0.0);
  summary.elapsed_s = fields.get_double("elapsed_s").value_or(0.0);
  summary.timestamp_ms = fields.require_u64("ts");
  return summary;
}

}  // namespace factory_sim::channel
