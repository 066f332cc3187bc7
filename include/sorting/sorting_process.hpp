#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <string>

#include "channel/telemetry_channel.hpp"
#include "model/block.hpp"

namespace factory_sim::sorting {

enum class sorting_state : std::uint8_t {
  IDLE = 0,
  GENERATING = 1,
  DETECTING = 2,
  SORTING = 3,
  REPORTING = 4,
  STOPPED = 5,
};

const char* to_string(sorting_state state) noexcept;

struct SortingSettings {
  std::string id{"sorter"};
  std::string controller_id{};
  std::string supervisor_id{"supervisor"};
  double delay_min_s{3.0};
  double delay_max_s{5.0};
  std::uint64_t summary_every{10};
  // Red, Blue, Green, Yellow, Unknown.
  std::array<double, 5> color_weights{0.25, 0.25, 0.25, 0.20, 0.05};
  double jam_probability{0.02};
  double jam_clear_probability{0.20};
  double jam_retry_s{1.0};
  double error_backoff_s{1.0};
};

void validate_sorting_settings(const SortingSettings& settings);

// Color sorting line: generate a block, detect it, divert it into its bin, report.
// A failure in any stage abandons the current block only; statistics are kept.
class SortingProcess {
 public:
  SortingProcess(SortingSettings settings, channel::TelemetryChannel& channel, std::string topic_prefix,
                 std::uint64_t seed);

  void start(std::uint64_t now_ms);

  // Runs the next cycle once its deadline has passed; otherwise does nothing.
  void step(std::uint64_t now_ms);

  // Terminal. Any block in flight is dropped without being counted.
  void stop();

  model::Block generate_block(std::uint64_t now_ms);

  // Detect, actuate, record and report one block without jam simulation.
  void process_block(const model::Block& block, std::uint64_t now_ms);

  [[nodiscard]] sorting_state state() const noexcept;
  [[nodiscard]] const model::SortingStats& stats() const noexcept;
  [[nodiscard]] bool jammed() const noexcept;
  [[nodiscard]] std::uint64_t next_due_ms() const noexcept;
  [[nodiscard]] const SortingSettings& settings() const noexcept;

 private:
  void detect(const model::Block& block, std::uint64_t now_ms);
  bool diverter_ready(std::uint64_t now_ms);
  void actuate(const model::Block& block, std::uint64_t now_ms);
  void record(const model::Block& block, std::uint64_t now_ms);
  void report(const model::Block& block, std::uint64_t now_ms);
  void publish_event(const std::string& event, std::uint64_t now_ms);
  void publish(const std::string& topic, const channel::Payload& payload);
  std::uint64_t draw_delay_ms();
  bool chance(double probability);

  SortingSettings settings_;
  channel::TelemetryChannel& channel_;
  std::string topic_prefix_;
  std::mt19937_64 rng_;
  sorting_state state_{sorting_state::IDLE};
  model::SortingStats stats_{};
  std::optional<model::Block> pending_block_{};
  bool jammed_{false};
  bool started_{false};
  bool channel_was_ok_{true};
  std::uint64_t start_ms_{0};
  std::uint64_t next_due_ms_{0};
  std::uint64_t next_block_id_{1};
};

}  // namespace factory_sim::sorting
