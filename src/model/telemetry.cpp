#include "model/telemetry.hpp"

namespace factory_sim::model {

const char* to_string(const connection_status status) noexcept {
  return status == connection_status::CONNECTED ? "connected" : "isolated";
}

double color_percentage(const SortingStats& stats, const block_color color) noexcept {
  if (stats.total_processed == 0) {
    return 0.0;
  }

  std::uint64_t count = 0;
  switch (color) {
    case block_color::RED:
      count = stats.red;
      break;
    case block_color::BLUE:
      count = stats.blue;
      break;
    case block_color::GREEN:
      count = stats.green;
      break;
    case block_color::YELLOW:
      count = stats.yellow;
      break;
    case block_color::UNKNOWN:
      count = stats.unknown;
      break;
  }
  return 100.0 * static_cast<double>(count) / static_cast<double>(stats.total_processed);
}

}  // namespace factory_sim::model
