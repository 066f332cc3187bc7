#include "model/block.hpp"

namespace factory_sim::model {

const char* to_string(const block_color color) noexcept {
  switch (color) {
    case block_color::RED:
      return "red";
    case block_color::BLUE:
      return "blue";
    case block_color::GREEN:
      return "green";
    case block_color::YELLOW:
      return "yellow";
    case block_color::UNKNOWN:
      return "unknown";
  }
  return "unknown";
}

const char* to_string(const size_class size) noexcept {
  switch (size) {
    case size_class::SMALL:
      return "small";
    case size_class::MEDIUM:
      return "medium";
    case size_class::LARGE:
      return "large";
  }
  return "medium";
}

std::optional<block_color> parse_block_color(const std::string& text) {
  for (const auto color : {block_color::RED, block_color::BLUE, block_color::GREEN, block_color::YELLOW,
                           block_color::UNKNOWN}) {
    if (text == to_string(color)) {
      return color;
    }
  }
  return std::nullopt;
}

int bin_angle_deg(const block_color color) noexcept {
  switch (color) {
    case block_color::RED:
      return 0;
    case block_color::BLUE:
      return 90;
    case block_color::GREEN:
      return 180;
    case block_color::YELLOW:
      return 270;
    case block_color::UNKNOWN:
      return 0;
  }
  return 0;
}

}  // namespace factory_sim::model
