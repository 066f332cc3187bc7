#pragma once

#include <cstdint>

namespace factory_sim::core {

// Counts loop ticks and answers "is an entity with this divisor due now".
class Sampler {
 public:
  Sampler() = default;

  [[nodiscard]] std::uint64_t tick() const noexcept;

  [[nodiscard]] bool should_sample_every(std::uint64_t every_n_ticks) const noexcept;

  void advance() noexcept;

 private:
  std::uint64_t tick_count_{0};
};

// Converts an entity period into a tick divisor; never less than one tick.
std::uint64_t ticks_for_period(double period_s, std::uint64_t tick_interval_ms) noexcept;

}  // namespace factory_sim::core
