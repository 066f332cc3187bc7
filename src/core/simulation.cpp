#include "core/simulation.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <thread>
#include <utility>

#include "channel/codec.hpp"
#include "channel/in_memory_channel.hpp"
#include "channel/redis_channel.hpp"
#include "channel/topics.hpp"
#include "core/errors.hpp"
#include "core/timestamp.hpp"

namespace factory_sim::core {
namespace {

constexpr std::uint64_t kSeedStride = 0x9E3779B97F4A7C15ULL;
constexpr std::uint64_t kSortingSeedSalt = 0x5EEDULL;

std::unique_ptr<channel::TelemetryChannel> make_channel(const SimulationConfig& config) {
  if (!config.redis.enabled) {
    return std::make_unique<channel::InMemoryChannel>();
  }

  channel::RedisChannelOptions options{};
  options.host = config.redis.host;
  options.port = config.redis.port;
  options.unix_socket = config.redis.unix_socket;
  options.password = config.redis.password;
  options.db = config.redis.db;
  auto redis = std::make_unique<channel::RedisChannel>(options);

  const std::string address =
      !options.unix_socket.empty() ? "unix://" + options.unix_socket : options.host + ':' + std::to_string(options.port);
  if (redis->check_connectivity()) {
    std::cerr << "[sim] redis connectivity confirmed at " << address << '\n';
  } else {
    std::cerr << "[sim] redis connectivity check failed at " << address << '\n';
  }
  return redis;
}

}  // namespace

Simulation::Simulation(SimulationConfig config) : Simulation(config, make_channel(config)) {}

Simulation::Simulation(SimulationConfig config, std::unique_ptr<channel::TelemetryChannel> channel)
    : config_(std::move(config)), channel_(std::move(channel)), tick_interval_(config_.tick_interval) {
  if (channel_ == nullptr) {
    throw ConfigurationError("simulation requires a telemetry channel");
  }
  if (tick_interval_.count() <= 0) {
    throw ConfigurationError("tick interval must be greater than 0");
  }
  validate_simulation_config(config_);

  start_ms_ = config_.start_time_ms != 0 ? config_.start_time_ms : unix_timestamp_now_ms();
  now_ms_ = start_ms_;
  build_entities();
}

Simulation::~Simulation() {
  if (shut_down_) {
    return;
  }
  try {
    shutdown();
  } catch (const std::exception& ex) {
    std::cerr << "[sim] shutdown failed: " << ex.what() << '\n';
  }
}

void Simulation::build_entities() {
  const auto tick_ms = static_cast<std::uint64_t>(tick_interval_.count());

  sensors_.reserve(config_.sensors.size());
  for (std::size_t i = 0; i < config_.sensors.size(); ++i) {
    const model::SensorProfile& profile = config_.sensors[i];
    const std::uint64_t seed = config_.seed + kSeedStride * static_cast<std::uint64_t>(i + 1);
    sensors_.emplace_back(profile, seed, config_.signal, ticks_for_period(profile.update_period_s, tick_ms));

    const double age_days = i < config_.calibration_age_days.size() ? config_.calibration_age_days[i] : 0.0;
    const auto age_ms = static_cast<std::uint64_t>(std::llround(age_days * static_cast<double>(model::kMillisPerDay)));
    const std::uint64_t last_calibration_ms = age_ms > start_ms_ ? 0 : start_ms_ - age_ms;
    SensorEntity& entity = sensors_.back();
    entity.state = entity.generator.initial_state(entity.profile, last_calibration_ms);
  }

  for (const auto& settings : config_.controllers) {
    auto controller = std::make_unique<controllers::ControllerAggregator>(settings, *channel_, config_.topic_prefix);
    if (!controller->attach()) {
      std::cerr << "[sim] controller " << settings.id << " could not subscribe to all of its topics\n";
    }
    controllers_.push_back(std::move(controller));
  }

  supervisor_ = std::make_unique<supervisor::Supervisor>(config_.supervisor, *channel_, config_.topic_prefix);
  if (!supervisor_->attach()) {
    std::cerr << "[sim] supervisor " << config_.supervisor.id << " could not subscribe to all of its topics\n";
  }

  if (config_.sorting.has_value()) {
    sorting_ = std::make_unique<sorting::SortingProcess>(*config_.sorting, *channel_, config_.topic_prefix,
                                                          config_.seed ^ kSortingSeedSalt);
    sorting_->start(start_ms_);
  }

  std::cerr << "[sim] built " << sensors_.size() << " sensor(s), " << controllers_.size() << " controller(s)"
            << (sorting_ != nullptr ? ", 1 sorting line" : "") << '\n';
}

SimulationStats Simulation::run_for_ticks(const std::size_t total_ticks) {
  SimulationStats stats{};
  if (shut_down_) {
    return stats;
  }

  if (first_tick_) {
    next_wakeup_ = std::chrono::steady_clock::now();
    first_tick_ = false;
  }

  for (std::size_t i = 0; (total_ticks == 0 || i < total_ticks) && !shut_down_; ++i) {
    now_ms_ = start_ms_ + sampler_.tick() * static_cast<std::uint64_t>(tick_interval_.count());

    run_sensors(stats);
    dispatch(stats);
    run_controllers(stats);
    dispatch(stats);

    ++stats.ticks_executed;
    sampler_.advance();

    if (config_.realtime) {
      next_wakeup_ += tick_interval_;
      std::this_thread::sleep_until(next_wakeup_);
    }
  }

  accumulate(stats);
  return stats;
}

void Simulation::run_sensors(SimulationStats& stats) {
  for (auto& sensor : sensors_) {
    if (!sampler_.should_sample_every(sensor.every_ticks)) {
      continue;
    }

    try {
      const model::Reading reading = sensor.generator.tick(sensor.state, sensor.profile, now_ms_);
      publish(channel::sensor_topic(config_.topic_prefix, sensor.profile.controller_id, sensor.profile.id),
              channel::encode_reading(reading), stats);
      ++stats.readings_published;

      for (const auto& alert : reading.alerts) {
        publish(channel::alert_topic(config_.topic_prefix, sensor.profile.id), channel::encode_alert(alert), stats);
        ++stats.alerts_published;
      }
    } catch (const SimulationInvariantViolation&) {
      throw;
    } catch (const std::exception& ex) {
      entity_failed("sensor " + sensor.profile.id, ex, stats);
    }
  }
}

void Simulation::run_controllers(SimulationStats& stats) {
  for (auto& controller : controllers_) {
    try {
      controller->tick(now_ms_);
    } catch (const SimulationInvariantViolation&) {
      throw;
    } catch (const std::exception& ex) {
      entity_failed("controller " + controller->settings().id, ex, stats);
    }
  }

  if (sorting_ != nullptr) {
    try {
      sorting_->step(now_ms_);
    } catch (const SimulationInvariantViolation&) {
      throw;
    } catch (const std::exception& ex) {
      entity_failed("sorting " + sorting_->settings().id, ex, stats);
    }
  }
}

void Simulation::dispatch(SimulationStats& stats) {
  try {
    stats.messages_dispatched += channel_->dispatch_pending();
  } catch (const SimulationInvariantViolation&) {
    throw;
  } catch (const std::exception& ex) {
    entity_failed("channel", ex, stats);
  }
}

void Simulation::publish(const std::string& topic, const channel::Payload& payload, SimulationStats& stats) {
  const bool ok = channel_->publish(topic, payload);
  if (!ok) {
    ++stats.publish_failures;
    if (channel_was_ok_) {
      std::cerr << "[sim] publish failed on " << topic << '\n';
      channel_was_ok_ = false;
    }
  } else if (!channel_was_ok_) {
    std::cerr << "[sim] publish recovered\n";
    channel_was_ok_ = true;
  }
}

void Simulation::entity_failed(const std::string& entity, const std::exception& ex, SimulationStats& stats) {
  ++stats.entity_failures;
  std::cerr << "[sim] " << entity << " failed at " << now_ms_ << ": " << ex.what() << '\n';
}

void Simulation::accumulate(const SimulationStats& stats) {
  totals_.ticks_executed += stats.ticks_executed;
  totals_.readings_published += stats.readings_published;
  totals_.alerts_published += stats.alerts_published;
  totals_.publish_failures += stats.publish_failures;
  totals_.messages_dispatched += stats.messages_dispatched;
  totals_.entity_failures += stats.entity_failures;
}

void Simulation::shutdown() {
  if (shut_down_) {
    return;
  }
  shut_down_ = true;

  if (sorting_ != nullptr) {
    sorting_->stop();
  }

  SimulationStats stats{};
  dispatch(stats);
  accumulate(stats);
  channel_->close();

  std::cerr << "[sim] shutdown after " << totals_.ticks_executed << " tick(s), " << totals_.readings_published
            << " reading(s), " << totals_.messages_dispatched << " delivery(ies)\n";
}

std::size_t Simulation::ticks_for_duration() const noexcept {
  if (!(config_.duration_s > 0.0)) {
    return 0;
  }
  const auto ticks = static_cast<std::size_t>(
      std::ceil((config_.duration_s * 1000.0) / static_cast<double>(tick_interval_.count())));
  return std::max<std::size_t>(ticks, 1);
}

std::uint64_t Simulation::now_ms() const noexcept { return now_ms_; }

const SimulationStats& Simulation::totals() const noexcept { return totals_; }

bool Simulation::is_shut_down() const noexcept { return shut_down_; }

const controllers::ControllerAggregator* Simulation::controller(const std::string& id) const {
  const auto it = std::find_if(controllers_.begin(), controllers_.end(),
                               [&id](const auto& controller) { return controller->settings().id == id; });
  return it != controllers_.end() ? it->get() : nullptr;
}

const sorting::SortingProcess* Simulation::sorting_process() const noexcept { return sorting_.get(); }

const supervisor::Supervisor& Simulation::supervisor() const noexcept { return *supervisor_; }

channel::TelemetryChannel& Simulation::channel() noexcept { return *channel_; }

}  // namespace factory_sim::core
