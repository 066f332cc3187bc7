#pragma once

#include <stdexcept>
#include <string>

namespace factory_sim::core {

// Invalid profile, topology or config file. Fatal at startup.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

// Malformed payload on the wire. The message is dropped.
class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const std::string& message) : std::runtime_error(message) {}
};

// A computed value left its documented domain. Never expected in a correct build.
class SimulationInvariantViolation : public std::logic_error {
 public:
  explicit SimulationInvariantViolation(const std::string& message) : std::logic_error(message) {}
};

}  // namespace factory_sim::core
