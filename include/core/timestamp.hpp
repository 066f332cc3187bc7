#pragma once

#include <chrono>
#include <cstdint>

namespace factory_sim::core {

inline std::uint64_t unix_timestamp_now_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

inline double ms_to_seconds(const std::uint64_t ms) noexcept {
  return static_cast<double>(ms) / 1000.0;
}

}  // namespace factory_sim::core
