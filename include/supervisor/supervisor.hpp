#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "channel/telemetry_channel.hpp"
#include "controllers/peer_link.hpp"
#include "model/telemetry.hpp"
#include "sinks/stdout_debug.hpp"

namespace factory_sim::supervisor {

struct SupervisorSettings {
  std::string id{"supervisor"};
  double min_efficiency{0.90};
  double line_speed_step{0.90};
  double min_line_speed{0.20};
  bool stdout_debug{false};
};

void validate_supervisor_settings(const SupervisorSettings& settings);

// Supervisory node: keeps the latest state of every controller and the sorting line,
// and slows the sorting controller down when sorting efficiency drops.
class Supervisor {
 public:
  Supervisor(SupervisorSettings settings, channel::TelemetryChannel& channel, std::string topic_prefix);

  bool attach();

  void on_controller_telemetry(const model::ControllerTelemetry& telemetry);
  void on_sorting_summary(const model::SortingSummary& summary);

  [[nodiscard]] const std::map<std::string, model::ControllerTelemetry>& controllers() const noexcept;
  [[nodiscard]] const std::optional<model::SortingSummary>& last_sorting_summary() const noexcept;
  [[nodiscard]] std::uint64_t commands_sent() const noexcept;
  [[nodiscard]] std::uint64_t responses_received() const noexcept;

 private:
  double current_line_speed(const std::string& controller_id) const;

  SupervisorSettings settings_;
  channel::TelemetryChannel& channel_;
  std::string topic_prefix_;
  controllers::PeerLink link_;
  sinks::StdoutDebugSink stdout_sink_{};
  std::map<std::string, model::ControllerTelemetry> controllers_{};
  std::map<std::string, double> line_speed_setpoints_{};
  std::optional<model::SortingSummary> last_summary_{};
  std::uint64_t commands_sent_{0};
  std::uint64_t responses_received_{0};
};

}  // namespace factory_sim::supervisor
