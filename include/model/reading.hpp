#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "model/alert.hpp"
#include "model/sensor.hpp"

namespace factory_sim::model {

// One generated sample. Immutable once handed to the channel.
struct Reading {
  std::string sensor_id{};
  std::string controller_id{};
  quantity_kind kind{quantity_kind::TEMPERATURE};
  double value{0.0};
  std::string unit{};
  std::uint64_t timestamp_ms{0};
  // Kind-specific derived values (vision confidence, image quality, ...).
  std::map<std::string, double> aux{};
  std::vector<Alert> alerts{};

  bool operator==(const Reading& other) const = default;
};

}  // namespace factory_sim::model
