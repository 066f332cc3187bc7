#include "core/sampler.hpp"

#include <cmath>

namespace factory_sim::core {

std::uint64_t Sampler::tick() const noexcept { return tick_count_; }

bool Sampler::should_sample_every(const std::uint64_t every_n_ticks) const noexcept {
  if (every_n_ticks == 0) {
    return false;
  }
  return (tick_count_ % every_n_ticks) == 0;
}

void Sampler::advance() noexcept { ++tick_count_; }

std::uint64_t ticks_for_period(const double period_s, const std::uint64_t tick_interval_ms) noexcept {
  if (tick_interval_ms == 0 || !(period_s > 0.0)) {
    return 1;
  }
  const double ticks = std::round((period_s * 1000.0) / static_cast<double>(tick_interval_ms));
  return ticks < 1.0 ? 1 : static_cast<std::uint64_t>(ticks);
}

}  // namespace factory_sim::core
