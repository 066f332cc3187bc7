#pragma once

#include <string>

namespace factory_sim::channel {

// Topic layout shared by every publisher and subscriber:
//   <prefix>/sensors/<controller>/<sensor>
//   <prefix>/alerts/<sensor>
//   <prefix>/peers/<node>
//   <prefix>/controllers/<controller>/telemetry
//   <prefix>/controllers/<controller>/sorting
//   <prefix>/sorting/<process>/camera | actuator
//   <prefix>/supervisor/<supervisor>/sorting

inline std::string sensor_topic(const std::string& prefix, const std::string& controller, const std::string& sensor) {
  return prefix + "/sensors/" + controller + "/" + sensor;
}

inline std::string controller_sensors_pattern(const std::string& prefix, const std::string& controller) {
  return prefix + "/sensors/" + controller + "/*";
}

inline std::string alert_topic(const std::string& prefix, const std::string& sensor) {
  return prefix + "/alerts/" + sensor;
}

inline std::string peer_topic(const std::string& prefix, const std::string& node) {
  return prefix + "/peers/" + node;
}

inline std::string controller_telemetry_topic(const std::string& prefix, const std::string& controller) {
  return prefix + "/controllers/" + controller + "/telemetry";
}

inline std::string controller_telemetry_pattern(const std::string& prefix) {
  return prefix + "/controllers/*/telemetry";
}

inline std::string controller_sorting_topic(const std::string& prefix, const std::string& controller) {
  return prefix + "/controllers/" + controller + "/sorting";
}

inline std::string sorting_camera_topic(const std::string& prefix, const std::string& process) {
  return prefix + "/sorting/" + process + "/camera";
}

inline std::string sorting_actuator_topic(const std::string& prefix, const std::string& process) {
  return prefix + "/sorting/" + process + "/actuator";
}

inline std::string supervisor_sorting_topic(const std::string& prefix, const std::string& supervisor) {
  return prefix + "/supervisor/" + supervisor + "/sorting";
}

}  // namespace factory_sim::channel
