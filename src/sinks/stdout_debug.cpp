#include "sinks/stdout_debug.hpp"

#include <cstdio>

namespace factory_sim::sinks {

void StdoutDebugSink::publish(const model::ControllerTelemetry& telemetry) const {
  std::printf("[plc] %s stage=%s avg_temp=%.2f max_pressure=%.2f vibration_alarm=%d health=%.0f status=%s line_speed=%.2f\n",
              telemetry.controller_id.c_str(), telemetry.stage.c_str(), telemetry.avg_temperature.value_or(0.0),
              telemetry.max_pressure.value_or(0.0), telemetry.vibration_alarm ? 1 : 0, telemetry.health,
              model::to_string(telemetry.status), telemetry.line_speed);
}

void StdoutDebugSink::publish(const model::SortingSummary& summary) const {
  const model::SortingStats& stats = summary.stats;
  std::printf("[sorting] %s total=%llu red=%.1f%% blue=%.1f%% green=%.1f%% yellow=%.1f%% unknown=%.1f%% efficiency=%.3f throughput_per_hour=%.1f\n",
              summary.process_id.c_str(), static_cast<unsigned long long>(stats.total_processed),
              model::color_percentage(stats, model::block_color::RED),
              model::color_percentage(stats, model::block_color::BLUE),
              model::color_percentage(stats, model::block_color::GREEN),
              model::color_percentage(stats, model::block_color::YELLOW),
              model::color_percentage(stats, model::block_color::UNKNOWN), stats.efficiency,
              stats.throughput_per_hour);
}

}  // namespace factory_sim::sinks
