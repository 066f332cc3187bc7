#include "controllers/controller_aggregator.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <utility>

#include "channel/codec.hpp"
#include "channel/topics.hpp"
#include "core/errors.hpp"

namespace factory_sim::controllers {

namespace {

constexpr const char* kTemperatureSetpoint = "temperature_setpoint";
constexpr const char* kPressureSetpoint = "pressure_setpoint";
constexpr const char* kLineSpeed = "line_speed";
constexpr const char* kVibrationAlarmEvent = "vibration_alarm";

std::uint64_t period_ms(const double period_s) {
  return static_cast<std::uint64_t>(std::llround(period_s * 1000.0));
}

std::optional<double> parse_setpoint(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  errno = 0;
  const double value = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0' || errno == ERANGE || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

void validate_controller_settings(const ControllerSettings& settings) {
  if (settings.id.empty()) {
    throw core::ConfigurationError("controller id must not be empty");
  }
  if (!(settings.publish_period_s > 0.0) || !(settings.heartbeat_period_s > 0.0)) {
    throw core::ConfigurationError("controller " + settings.id + ": periods must be greater than 0");
  }
  if (!(settings.vibration_threshold > 0.0)) {
    throw core::ConfigurationError("controller " + settings.id + ": vibration_threshold must be greater than 0");
  }
  if (settings.line_speed < 0.0) {
    throw core::ConfigurationError("controller " + settings.id + ": line_speed must be non-negative");
  }
  for (const auto& peer : settings.peers) {
    if (peer.empty() || peer == settings.id) {
      throw core::ConfigurationError("controller " + settings.id + ": invalid peer '" + peer + "'");
    }
  }
}

double compute_health(const AggregatedMetrics& metrics, const ControllerSettings& settings) {
  double health = 100.0;
  if (metrics.avg_temperature.has_value() && *metrics.avg_temperature > settings.hot_threshold) {
    health -= 10.0;
  }
  if (metrics.max_pressure.has_value() && *metrics.max_pressure > settings.high_pressure_threshold) {
    health -= 15.0;
  }
  if (metrics.vibration_alarm) {
    health -= 20.0;
  }
  health = std::max(0.0, health);

  if (!(health >= 0.0 && health <= 100.0)) {
    throw core::SimulationInvariantViolation("health score outside [0, 100]: " + std::to_string(health));
  }
  return health;
}

ControllerAggregator::ControllerAggregator(ControllerSettings settings, channel::TelemetryChannel& channel,
                                           std::string topic_prefix)
    : settings_(std::move(settings)),
      channel_(channel),
      topic_prefix_(std::move(topic_prefix)),
      tag_("[controller " + settings_.id + "] "),
      link_(settings_.id) {
  validate_controller_settings(settings_);
  state_.process_parameters[kTemperatureSetpoint] = settings_.temperature_setpoint;
  state_.process_parameters[kPressureSetpoint] = settings_.pressure_setpoint;
  state_.process_parameters[kLineSpeed] = settings_.line_speed;
  recompute();
}

bool ControllerAggregator::attach() {
  const bool sensors_ok = channel_.subscribe(
      channel::controller_sensors_pattern(topic_prefix_, settings_.id),
      [this](const std::string& topic, const channel::Payload& payload) {
        model::Reading reading{};
        try {
          reading = channel::decode_reading(payload);
        } catch (const core::DecodeError& ex) {
          ++state_.decode_errors;
          std::cerr << tag_ << "dropped reading on " << topic << ": " << ex.what() << '\n';
          return;
        }
        on_child_reading(reading);
      });

  const bool peers_ok = channel_.subscribe(
      channel::peer_topic(topic_prefix_, settings_.id),
      [this](const std::string& topic, const channel::Payload& payload) {
        model::PeerMessage message{};
        try {
          message = channel::decode_peer_message(payload);
        } catch (const core::DecodeError& ex) {
          ++state_.decode_errors;
          std::cerr << tag_ << "dropped peer message on " << topic << ": " << ex.what() << '\n';
          return;
        }
        on_peer_message(message);
      });

  const bool sorting_ok = channel_.subscribe(
      channel::controller_sorting_topic(topic_prefix_, settings_.id),
      [this](const std::string& topic, const channel::Payload& payload) {
        try {
          on_sorting_report(payload);
        } catch (const core::DecodeError& ex) {
          ++state_.decode_errors;
          std::cerr << tag_ << "dropped sorting report on " << topic << ": " << ex.what() << '\n';
        }
      });

  return sensors_ok && peers_ok && sorting_ok;
}

void ControllerAggregator::on_child_reading(const model::Reading& reading) {
  now_ms_ = std::max(now_ms_, reading.timestamp_ms);
  state_.children[reading.sensor_id] = reading;
  recompute();
}

void ControllerAggregator::on_peer_message(const model::PeerMessage& message) {
  if (message.destination != settings_.id) {
    return;
  }

  switch (message.kind) {
    case model::peer_message_kind::HEARTBEAT:
      handle_heartbeat(message);
      break;

    case model::peer_message_kind::ACK:
      ++state_.acks_received;
      mark_connected(message.source);
      break;

    case model::peer_message_kind::COMMAND:
      handle_command(message);
      break;

    case model::peer_message_kind::PROCESS_EVENT:
      handle_process_event(message);
      break;

    case model::peer_message_kind::RESPONSE: {
      const auto status = message.payload.find("status");
      std::cerr << tag_ << "response from " << message.source << " to command " << message.sequence << ": "
                << (status != message.payload.end() ? status->second : "unknown") << '\n';
      break;
    }
  }

  recompute();
}

void ControllerAggregator::on_sorting_report(const channel::Payload& payload) {
  const channel::FieldReader fields(payload);

  const auto event = fields.get("event");
  if (event.has_value()) {
    state_.sorting_jams = fields.get_u64("jams").value_or(state_.sorting_jams);
    std::cerr << tag_ << "sorting line reported " << *event << '\n';
    return;
  }

  const std::uint64_t total = fields.require_u64("total");
  const double efficiency = fields.require_double("efficiency");
  state_.sorted_blocks = total;
  state_.sorting_efficiency = efficiency;
  state_.sorting_jams = fields.get_u64("jams").value_or(state_.sorting_jams);
}

void ControllerAggregator::tick(const std::uint64_t now_ms) {
  now_ms_ = std::max(now_ms_, now_ms);

  if (!next_publish_ms_.has_value() || now_ms >= *next_publish_ms_) {
    publish_telemetry(now_ms);
    next_publish_ms_ = now_ms + period_ms(settings_.publish_period_s);
  }

  if (!next_heartbeat_ms_.has_value() || now_ms >= *next_heartbeat_ms_) {
    send_heartbeats(now_ms);
    next_heartbeat_ms_ = now_ms + period_ms(settings_.heartbeat_period_s);
  }
}

void ControllerAggregator::publish_telemetry(const std::uint64_t now_ms) {
  const bool ok = channel_.publish(channel::controller_telemetry_topic(topic_prefix_, settings_.id),
                                   channel::encode_controller_telemetry(snapshot(now_ms)));
  if (!ok && channel_was_ok_) {
    std::cerr << tag_ << "telemetry publish failed\n";
    channel_was_ok_ = false;
  } else if (ok && !channel_was_ok_) {
    std::cerr << tag_ << "telemetry publish recovered\n";
    channel_was_ok_ = true;
  }
}

void ControllerAggregator::send_heartbeats(const std::uint64_t now_ms) {
  for (const auto& peer : settings_.peers) {
    ++state_.hello_sent;
    send(link_.make_heartbeat(peer, now_ms));
  }
}

bool ControllerAggregator::send_command(const std::string& destination,
                                        const std::map<std::string, double>& setpoints, const std::uint64_t now_ms) {
  return send(link_.make_command(destination, setpoints, now_ms));
}

const ControllerState& ControllerAggregator::state() const noexcept { return state_; }

const ControllerSettings& ControllerAggregator::settings() const noexcept { return settings_; }

model::ControllerTelemetry ControllerAggregator::snapshot(const std::uint64_t now_ms) const {
  model::ControllerTelemetry telemetry{};
  telemetry.controller_id = settings_.id;
  telemetry.stage = settings_.stage;
  telemetry.avg_temperature = state_.metrics.avg_temperature;
  telemetry.max_pressure = state_.metrics.max_pressure;
  telemetry.vibration_alarm = state_.metrics.vibration_alarm;
  telemetry.health = state_.metrics.health;
  telemetry.defect_count = state_.metrics.defect_count;
  telemetry.active_alerts = state_.metrics.active_alerts;
  telemetry.children = state_.children.size();
  telemetry.hello_sent = state_.hello_sent;
  telemetry.hello_received = state_.hello_received;
  telemetry.acks_received = state_.acks_received;
  telemetry.commands_processed = state_.commands_processed;
  telemetry.process_events = state_.process_events;
  telemetry.status = state_.status;
  telemetry.cooling_active = state_.cooling_active;
  telemetry.relief_valve_open = state_.relief_valve_open;
  telemetry.line_speed = state_.effective_line_speed;
  const auto setpoint = state_.process_parameters.find(kLineSpeed);
  telemetry.line_speed_setpoint = setpoint != state_.process_parameters.end() ? setpoint->second : settings_.line_speed;
  telemetry.sorted_blocks = state_.sorted_blocks;
  telemetry.sorting_efficiency = state_.sorting_efficiency;
  telemetry.timestamp_ms = now_ms;
  return telemetry;
}

void ControllerAggregator::recompute() {
  double temperature_sum = 0.0;
  std::size_t temperature_count = 0;
  AggregatedMetrics metrics{};

  for (const auto& [sensor_id, reading] : state_.children) {
    switch (reading.kind) {
      case model::quantity_kind::TEMPERATURE:
        temperature_sum += reading.value;
        ++temperature_count;
        break;
      case model::quantity_kind::PRESSURE:
        metrics.max_pressure = metrics.max_pressure.has_value() ? std::max(*metrics.max_pressure, reading.value)
                                                                : reading.value;
        break;
      case model::quantity_kind::VIBRATION:
        metrics.vibration_alarm = metrics.vibration_alarm || reading.value > settings_.vibration_threshold;
        break;
      case model::quantity_kind::VISION_DEFECT_COUNT:
        metrics.defect_count += reading.value;
        break;
      case model::quantity_kind::FLOW:
      case model::quantity_kind::HUMIDITY:
        break;
    }
    metrics.active_alerts += static_cast<std::uint32_t>(reading.alerts.size());
  }

  if (temperature_count > 0) {
    metrics.avg_temperature = temperature_sum / static_cast<double>(temperature_count);
  }
  metrics.health = compute_health(metrics, settings_);

  const bool alarm_was_raised = state_.metrics.vibration_alarm;
  state_.metrics = metrics;
  apply_control_logic();

  if (metrics.vibration_alarm != alarm_was_raised) {
    announce_alarm_edge(metrics.vibration_alarm);
  }
}

void ControllerAggregator::apply_control_logic() {
  const AggregatedMetrics& metrics = state_.metrics;
  const auto& parameters = state_.process_parameters;

  state_.cooling_active =
      metrics.avg_temperature.has_value() && *metrics.avg_temperature > parameters.at(kTemperatureSetpoint);
  state_.relief_valve_open =
      metrics.max_pressure.has_value() && *metrics.max_pressure > parameters.at(kPressureSetpoint);

  double speed = parameters.at(kLineSpeed);
  if (metrics.vibration_alarm) {
    speed *= 0.5;
  }
  if (!state_.upstream_alarms.empty()) {
    speed *= 0.8;
  }
  state_.effective_line_speed = speed;
}

void ControllerAggregator::handle_heartbeat(const model::PeerMessage& message) {
  const HeartbeatOutcome outcome = link_.on_heartbeat(message, reply_time(message));
  if (outcome.first_seen) {
    ++state_.hello_received;
  }
  mark_connected(message.source);
  send(outcome.ack);
}

void ControllerAggregator::handle_command(const model::PeerMessage& message) {
  ++state_.commands_processed;

  std::size_t applied = 0;
  for (const auto& [key, text] : message.payload) {
    auto parameter = state_.process_parameters.find(key);
    if (parameter == state_.process_parameters.end()) {
      continue;
    }
    const auto value = parse_setpoint(text);
    if (!value.has_value()) {
      std::cerr << tag_ << "ignoring setpoint " << key << "='" << text << "' from " << message.source << '\n';
      continue;
    }
    parameter->second = *value;
    ++applied;
  }

  std::cerr << tag_ << "command " << message.sequence << " from " << message.source << " applied " << applied
            << " setpoint(s)\n";
  send(link_.make_response(message, applied, "ok", reply_time(message)));
}

void ControllerAggregator::handle_process_event(const model::PeerMessage& message) {
  ++state_.process_events;

  const auto event = message.payload.find("event");
  if (event == message.payload.end() || event->second != kVibrationAlarmEvent) {
    return;
  }
  const auto active = message.payload.find("active");
  if (active != message.payload.end() && active->second == "1") {
    state_.upstream_alarms.insert(message.source);
  } else {
    state_.upstream_alarms.erase(message.source);
  }
}

void ControllerAggregator::mark_connected(const std::string& peer) {
  if (state_.status == model::connection_status::CONNECTED) {
    return;
  }
  state_.status = model::connection_status::CONNECTED;
  std::cerr << tag_ << "connected (first contact from " << peer << ")\n";
}

void ControllerAggregator::announce_alarm_edge(const bool active) {
  std::cerr << tag_ << "vibration alarm " << (active ? "raised" : "cleared") << '\n';
  for (const auto& peer : settings_.peers) {
    send(link_.make_process_event(peer, kVibrationAlarmEvent, active, now_ms_));
  }
}

bool ControllerAggregator::send(const model::PeerMessage& message) {
  const bool ok = channel_.publish(channel::peer_topic(topic_prefix_, message.destination),
                                   channel::encode_peer_message(message));
  if (!ok) {
    std::cerr << tag_ << "failed to send " << model::to_string(message.kind) << " to " << message.destination << '\n';
  }
  return ok;
}

std::uint64_t ControllerAggregator::reply_time(const model::PeerMessage& message) const noexcept {
  return std::max(now_ms_, message.timestamp_ms);
}

}  // namespace factory_sim::controllers
