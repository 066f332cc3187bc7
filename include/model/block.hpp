#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace factory_sim::model {

enum class block_color : std::uint8_t {
  RED = 0,
  BLUE = 1,
  GREEN = 2,
  YELLOW = 3,
  UNKNOWN = 4,
};

enum class size_class : std::uint8_t {
  SMALL = 0,
  MEDIUM = 1,
  LARGE = 2,
};

struct Block {
  std::uint64_t id{0};
  block_color color{block_color::UNKNOWN};
  double confidence{0.0};
  model::size_class size{size_class::MEDIUM};
  std::uint64_t created_ms{0};
};

struct SortingStats {
  std::uint64_t red{0};
  std::uint64_t blue{0};
  std::uint64_t green{0};
  std::uint64_t yellow{0};
  std::uint64_t unknown{0};
  std::uint64_t total_processed{0};
  std::uint64_t jams{0};
  std::uint64_t stage_failures{0};
  double efficiency{0.0};
  double throughput_per_hour{0.0};
};

const char* to_string(block_color color) noexcept;
const char* to_string(size_class size) noexcept;
std::optional<block_color> parse_block_color(const std::string& text);

// Diverter angle for a color; unknown blocks fall back to the first bin.
int bin_angle_deg(block_color color) noexcept;

}  // namespace factory_sim::model
