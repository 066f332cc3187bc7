#include <csignal>
#include <iostream>
#include <sstream>
#include <string>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/simulation.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

}  // namespace

std::string format_config_settings(const factory_sim::core::SimulationConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[sim] loaded config from " << config_path
         << " | seed=" << config.seed
         << " | tick_interval_ms=" << config.tick_interval.count()
         << " | realtime=" << (config.realtime ? "true" : "false")
         << " | topic_prefix=" << config.topic_prefix
         << " | sensors=" << config.sensors.size()
         << " | controllers=" << config.controllers.size()
         << " | sorting=" << (config.sorting.has_value() ? "true" : "false")
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false");

  if (config.redis.enabled) {
    output << " | redis_address=";
    if (!config.redis.unix_socket.empty()) {
      output << "unix://" << config.redis.unix_socket;
    } else {
      output << config.redis.host << ':' << config.redis.port;
    }
  }
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/factory.default.yaml";

  factory_sim::core::SimulationConfig config{};
  try {
    config = factory_sim::core::load_simulation_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  try {
    factory_sim::core::Simulation simulation{config};
    const std::size_t tick_limit = simulation.ticks_for_duration();
    std::size_t ticks = 0;
    while (g_shutdown_requested == 0 && (tick_limit == 0 || ticks < tick_limit)) {
      ticks += simulation.run_for_ticks(1).ticks_executed;
    }

    if (g_shutdown_requested != 0) {
      std::cerr << "[sim] shutdown signal received; draining\n";
    }
    simulation.shutdown();
  } catch (const factory_sim::core::ConfigurationError& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  } catch (const factory_sim::core::SimulationInvariantViolation& ex) {
    std::cerr << "[sim] invariant violated: " << ex.what() << '\n';
    return 2;
  }

  return 0;
}
