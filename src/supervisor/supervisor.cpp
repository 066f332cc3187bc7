#include "supervisor/supervisor.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "channel/codec.hpp"
#include "channel/topics.hpp"
#include "core/errors.hpp"

namespace factory_sim::supervisor {

void validate_supervisor_settings(const SupervisorSettings& settings) {
  if (settings.id.empty()) {
    throw core::ConfigurationError("supervisor id must not be empty");
  }
  if (settings.min_efficiency < 0.0 || settings.min_efficiency > 1.0) {
    throw core::ConfigurationError("supervisor.min_efficiency must be within [0, 1]");
  }
  if (!(settings.line_speed_step > 0.0 && settings.line_speed_step <= 1.0)) {
    throw core::ConfigurationError("supervisor.line_speed_step must be within (0, 1]");
  }
  if (settings.min_line_speed < 0.0) {
    throw core::ConfigurationError("supervisor.min_line_speed must be non-negative");
  }
}

Supervisor::Supervisor(SupervisorSettings settings, channel::TelemetryChannel& channel, std::string topic_prefix)
    : settings_(std::move(settings)), channel_(channel), topic_prefix_(std::move(topic_prefix)), link_(settings_.id) {
  validate_supervisor_settings(settings_);
}

bool Supervisor::attach() {
  const bool telemetry_ok = channel_.subscribe(
      channel::controller_telemetry_pattern(topic_prefix_),
      [this](const std::string& topic, const channel::Payload& payload) {
        try {
          on_controller_telemetry(channel::decode_controller_telemetry(payload));
        } catch (const core::DecodeError& ex) {
          std::cerr << "[supervisor] dropped telemetry on " << topic << ": " << ex.what() << '\n';
        }
      });

  const bool sorting_ok = channel_.subscribe(
      channel::supervisor_sorting_topic(topic_prefix_, settings_.id),
      [this](const std::string& topic, const channel::Payload& payload) {
        try {
          on_sorting_summary(channel::decode_sorting_summary(payload));
        } catch (const core::DecodeError& ex) {
          std::cerr << "[supervisor] dropped sorting summary on " << topic << ": " << ex.what() << '\n';
        }
      });

  const bool inbox_ok = channel_.subscribe(
      channel::peer_topic(topic_prefix_, settings_.id),
      [this](const std::string& topic, const channel::Payload& payload) {
        try {
          const model::PeerMessage message = channel::decode_peer_message(payload);
          if (message.kind == model::peer_message_kind::RESPONSE) {
            ++responses_received_;
          }
        } catch (const core::DecodeError& ex) {
          std::cerr << "[supervisor] dropped peer message on " << topic << ": " << ex.what() << '\n';
        }
      });

  return telemetry_ok && sorting_ok && inbox_ok;
}

void Supervisor::on_controller_telemetry(const model::ControllerTelemetry& telemetry) {
  controllers_[telemetry.controller_id] = telemetry;
  if (settings_.stdout_debug) {
    stdout_sink_.publish(telemetry);
  }
}

void Supervisor::on_sorting_summary(const model::SortingSummary& summary) {
  last_summary_ = summary;
  if (settings_.stdout_debug) {
    stdout_sink_.publish(summary);
  }

  if (summary.controller_id.empty() || summary.stats.efficiency >= settings_.min_efficiency) {
    return;
  }

  const double current = current_line_speed(summary.controller_id);
  const double next = std::max(settings_.min_line_speed, current * settings_.line_speed_step);
  if (next >= current) {
    return;
  }

  const model::PeerMessage command =
      link_.make_command(summary.controller_id, {{"line_speed", next}}, summary.timestamp_ms);
  if (channel_.publish(channel::peer_topic(topic_prefix_, summary.controller_id),
                       channel::encode_peer_message(command))) {
    line_speed_setpoints_[summary.controller_id] = next;
    ++commands_sent_;
    std::cerr << "[supervisor] sorting efficiency " << summary.stats.efficiency << " below "
              << settings_.min_efficiency << "; line_speed for " << summary.controller_id << " -> " << next << '\n';
  }
}

// Lowest of the last commanded setpoint and the controller's reported one; 1.0 before
// either is known.
double Supervisor::current_line_speed(const std::string& controller_id) const {
  std::optional<double> current{};
  const auto commanded = line_speed_setpoints_.find(controller_id);
  if (commanded != line_speed_setpoints_.end()) {
    current = commanded->second;
  }
  const auto reported = controllers_.find(controller_id);
  if (reported != controllers_.end()) {
    const double setpoint = reported->second.line_speed_setpoint;
    current = current.has_value() ? std::min(*current, setpoint) : setpoint;
  }
  return current.value_or(1.0);
}

const std::map<std::string, model::ControllerTelemetry>& Supervisor::controllers() const noexcept {
  return controllers_;
}

const std::optional<model::SortingSummary>& Supervisor::last_sorting_summary() const noexcept {
  return last_summary_;
}

std::uint64_t Supervisor::commands_sent() const noexcept { return commands_sent_; }

std::uint64_t Supervisor::responses_received() const noexcept { return responses_received_; }

}  // namespace factory_sim::supervisor
