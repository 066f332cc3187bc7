#pragma once

#include <algorithm>

namespace factory_sim::core {

inline constexpr double kPi = 3.14159265358979323846;

inline constexpr double clamp_to(const double value, const double lo, const double hi) noexcept {
  return std::clamp(value, lo, hi);
}

inline constexpr double clamp01(const double value) noexcept {
  return std::clamp(value, 0.0, 1.0);
}

}  // namespace factory_sim::core
