#include "sorting/sorting_process.hpp"

#include <cmath>
#include <iostream>
#include <utility>

#include "channel/codec.hpp"
#include "channel/topics.hpp"
#include "core/errors.hpp"
#include "model/telemetry.hpp"

namespace factory_sim::sorting {

namespace {

constexpr model::block_color kColorOrder[] = {model::block_color::RED, model::block_color::BLUE,
                                              model::block_color::GREEN, model::block_color::YELLOW,
                                              model::block_color::UNKNOWN};

std::uint64_t seconds_to_ms(const double seconds) {
  return static_cast<std::uint64_t>(std::llround(seconds * 1000.0));
}

}  // namespace

const char* to_string(const sorting_state state) noexcept {
  switch (state) {
    case sorting_state::IDLE:
      return "idle";
    case sorting_state::GENERATING:
      return "generating";
    case sorting_state::DETECTING:
      return "detecting";
    case sorting_state::SORTING:
      return "sorting";
    case sorting_state::REPORTING:
      return "reporting";
    case sorting_state::STOPPED:
      return "stopped";
  }
  return "unknown";
}

void validate_sorting_settings(const SortingSettings& settings) {
  if (settings.id.empty() || settings.controller_id.empty() || settings.supervisor_id.empty()) {
    throw core::ConfigurationError("sorting: id, controller and supervisor must be set");
  }
  if (settings.delay_min_s < 0.0 || settings.delay_max_s < settings.delay_min_s) {
    throw core::ConfigurationError("sorting: delay window must satisfy 0 <= min <= max");
  }
  if (settings.summary_every == 0) {
    throw core::ConfigurationError("sorting: summary_every must be greater than 0");
  }
  double weight_sum = 0.0;
  for (const double weight : settings.color_weights) {
    if (weight < 0.0) {
      throw core::ConfigurationError("sorting: color weights must be non-negative");
    }
    weight_sum += weight;
  }
  if (!(weight_sum > 0.0)) {
    throw core::ConfigurationError("sorting: at least one color weight must be positive");
  }
  if (settings.jam_probability < 0.0 || settings.jam_probability > 1.0 || settings.jam_clear_probability <= 0.0 ||
      settings.jam_clear_probability > 1.0) {
    throw core::ConfigurationError("sorting: jam probabilities must be within [0, 1] and clearing must be possible");
  }
  if (!(settings.jam_retry_s > 0.0) || !(settings.error_backoff_s > 0.0)) {
    throw core::ConfigurationError("sorting: jam_retry_s and error_backoff_s must be greater than 0");
  }
}

SortingProcess::SortingProcess(SortingSettings settings, channel::TelemetryChannel& channel,
                               std::string topic_prefix, const std::uint64_t seed)
    : settings_(std::move(settings)), channel_(channel), topic_prefix_(std::move(topic_prefix)), rng_(seed) {
  validate_sorting_settings(settings_);
}

void SortingProcess::start(const std::uint64_t now_ms) {
  if (state_ == sorting_state::STOPPED) {
    return;
  }
  stats_ = model::SortingStats{};
  pending_block_.reset();
  jammed_ = false;
  started_ = true;
  start_ms_ = now_ms;
  next_due_ms_ = now_ms;
  state_ = sorting_state::IDLE;
  std::cerr << "[sorting] " << settings_.id << " started for controller " << settings_.controller_id << '\n';
}

void SortingProcess::step(const std::uint64_t now_ms) {
  if (state_ == sorting_state::STOPPED) {
    return;
  }
  if (!started_) {
    start(now_ms);
  }
  if (now_ms < next_due_ms_) {
    return;
  }

  try {
    if (!pending_block_.has_value()) {
      state_ = sorting_state::GENERATING;
      pending_block_ = generate_block(now_ms);

      state_ = sorting_state::DETECTING;
      detect(*pending_block_, now_ms);
    }

    state_ = sorting_state::SORTING;
    if (!diverter_ready(now_ms)) {
      next_due_ms_ = now_ms + seconds_to_ms(settings_.jam_retry_s);
      return;
    }
    actuate(*pending_block_, now_ms);
    record(*pending_block_, now_ms);

    state_ = sorting_state::REPORTING;
    report(*pending_block_, now_ms);

    pending_block_.reset();
    state_ = sorting_state::IDLE;
    next_due_ms_ = now_ms + draw_delay_ms();
  } catch (const core::SimulationInvariantViolation&) {
    throw;
  } catch (const std::exception& ex) {
    ++stats_.stage_failures;
    std::cerr << "[sorting] " << to_string(state_) << " stage failed: " << ex.what() << "; retrying after backoff\n";
    pending_block_.reset();
    jammed_ = false;
    state_ = sorting_state::IDLE;
    next_due_ms_ = now_ms + seconds_to_ms(settings_.error_backoff_s);
  }
}

void SortingProcess::stop() {
  if (state_ == sorting_state::STOPPED) {
    return;
  }
  if (pending_block_.has_value()) {
    std::cerr << "[sorting] dropping block " << pending_block_->id << " in flight at shutdown\n";
    pending_block_.reset();
  }
  state_ = sorting_state::STOPPED;
  std::cerr << "[sorting] " << settings_.id << " stopped after " << stats_.total_processed << " block(s)\n";
}

model::Block SortingProcess::generate_block(const std::uint64_t now_ms) {
  std::discrete_distribution<int> color(settings_.color_weights.begin(), settings_.color_weights.end());
  std::uniform_int_distribution<int> size(0, 2);

  model::Block block{};
  block.id = next_block_id_++;
  block.color = kColorOrder[color(rng_)];
  if (block.color == model::block_color::UNKNOWN) {
    std::uniform_real_distribution<double> confidence(0.30, 0.60);
    block.confidence = confidence(rng_);
  } else {
    std::uniform_real_distribution<double> confidence(0.85, 0.99);
    block.confidence = confidence(rng_);
  }
  block.size = static_cast<model::size_class>(size(rng_));
  block.created_ms = now_ms;
  return block;
}

void SortingProcess::process_block(const model::Block& block, const std::uint64_t now_ms) {
  if (!started_) {
    start(now_ms);
  }
  if (state_ == sorting_state::STOPPED) {
    return;
  }
  state_ = sorting_state::DETECTING;
  detect(block, now_ms);
  state_ = sorting_state::SORTING;
  actuate(block, now_ms);
  record(block, now_ms);
  state_ = sorting_state::REPORTING;
  report(block, now_ms);
  state_ = sorting_state::IDLE;
}

sorting_state SortingProcess::state() const noexcept { return state_; }

const model::SortingStats& SortingProcess::stats() const noexcept { return stats_; }

bool SortingProcess::jammed() const noexcept { return jammed_; }

std::uint64_t SortingProcess::next_due_ms() const noexcept { return next_due_ms_; }

const SortingSettings& SortingProcess::settings() const noexcept { return settings_; }

void SortingProcess::detect(const model::Block& block, const std::uint64_t now_ms) {
  std::uniform_real_distribution<double> image_quality(0.80, 1.00);

  channel::Payload payload{};
  payload.add("block", block.id);
  payload.add("detected_color", model::to_string(block.color));
  payload.add("confidence", block.confidence);
  payload.add("image_quality", image_quality(rng_));
  payload.add("size", model::to_string(block.size));
  payload.add("ts", now_ms);
  publish(channel::sorting_camera_topic(topic_prefix_, settings_.id), payload);
}

bool SortingProcess::diverter_ready(const std::uint64_t now_ms) {
  if (jammed_) {
    if (!chance(settings_.jam_clear_probability)) {
      return false;
    }
    jammed_ = false;
    std::cerr << "[sorting] diverter jam cleared\n";
    publish_event("jam_cleared", now_ms);
    return true;
  }

  if (chance(settings_.jam_probability)) {
    jammed_ = true;
    ++stats_.jams;
    std::cerr << "[sorting] diverter jammed on block " << pending_block_->id << '\n';
    publish_event("jam", now_ms);
    return false;
  }
  return true;
}

void SortingProcess::actuate(const model::Block& block, const std::uint64_t now_ms) {
  channel::Payload payload{};
  payload.add("block", block.id);
  payload.add("color", model::to_string(block.color));
  payload.add("angle_deg", static_cast<double>(model::bin_angle_deg(block.color)));
  payload.add("ts", now_ms);
  publish(channel::sorting_actuator_topic(topic_prefix_, settings_.id), payload);
}

void SortingProcess::record(const model::Block& block, const std::uint64_t now_ms) {
  switch (block.color) {
    case model::block_color::RED:
      ++stats_.red;
      break;
    case model::block_color::BLUE:
      ++stats_.blue;
      break;
    case model::block_color::GREEN:
      ++stats_.green;
      break;
    case model::block_color::YELLOW:
      ++stats_.yellow;
      break;
    case model::block_color::UNKNOWN:
      ++stats_.unknown;
      break;
  }
  ++stats_.total_processed;

  const double total = static_cast<double>(stats_.total_processed);
  stats_.efficiency = (total - static_cast<double>(stats_.unknown)) / total;

  const double elapsed_s = now_ms > start_ms_ ? static_cast<double>(now_ms - start_ms_) / 1000.0 : 0.0;
  stats_.throughput_per_hour = elapsed_s > 0.0 ? (total * 3600.0) / elapsed_s : 0.0;
}

void SortingProcess::report(const model::Block& block, const std::uint64_t now_ms) {
  channel::Payload incremental{};
  incremental.add("process", settings_.id);
  incremental.add("block", block.id);
  incremental.add("color", model::to_string(block.color));
  incremental.add("total", stats_.total_processed);
  incremental.add("unknown", stats_.unknown);
  incremental.add("jams", stats_.jams);
  incremental.add("efficiency", stats_.efficiency);
  incremental.add("ts", now_ms);
  publish(channel::controller_sorting_topic(topic_prefix_, settings_.controller_id), incremental);

  if (stats_.total_processed % settings_.summary_every != 0) {
    return;
  }

  model::SortingSummary summary{};
  summary.process_id = settings_.id;
  summary.controller_id = settings_.controller_id;
  summary.stats = stats_;
  summary.elapsed_s = now_ms > start_ms_ ? static_cast<double>(now_ms - start_ms_) / 1000.0 : 0.0;
  summary.timestamp_ms = now_ms;
  publish(channel::supervisor_sorting_topic(topic_prefix_, settings_.supervisor_id),
          channel::encode_sorting_summary(summary));
  std::cerr << "[sorting] summary: total=" << stats_.total_processed << " efficiency=" << stats_.efficiency
            << " throughput_per_hour=" << stats_.throughput_per_hour << '\n';
}

void SortingProcess::publish_event(const std::string& event, const std::uint64_t now_ms) {
  channel::Payload payload{};
  payload.add("process", settings_.id);
  payload.add("event", event);
  payload.add("jams", stats_.jams);
  payload.add("ts", now_ms);
  publish(channel::controller_sorting_topic(topic_prefix_, settings_.controller_id), payload);
}

void SortingProcess::publish(const std::string& topic, const channel::Payload& payload) {
  const bool ok = channel_.publish(topic, payload);
  if (!ok && channel_was_ok_) {
    std::cerr << "[sorting] publish to " << topic << " failed\n";
    channel_was_ok_ = false;
  } else if (ok && !channel_was_ok_) {
    std::cerr << "[sorting] publish recovered\n";
    channel_was_ok_ = true;
  }
}

std::uint64_t SortingProcess::draw_delay_ms() {
  std::uniform_real_distribution<double> delay(settings_.delay_min_s, settings_.delay_max_s);
  return seconds_to_ms(delay(rng_));
}

bool SortingProcess::chance(const double probability) {
  std::bernoulli_distribution draw(probability);
  return draw(rng_);
}

}  // namespace factory_sim::sorting
