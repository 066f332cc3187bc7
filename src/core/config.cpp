#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "core/errors.hpp"

namespace factory_sim::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string lowercase(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool parse_bool(const std::string& key, const std::string& value) {
  const std::string lower = lowercase(value);
  if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
    return true;
  }
  if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
    return false;
  }
  throw ConfigurationError(key + " must be a boolean, got '" + value + "'");
}

double parse_double(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(value, &consumed);
  } catch (const std::exception&) {
    throw ConfigurationError(key + " must be a number, got '" + value + "'");
  }
  if (consumed != value.size() || !std::isfinite(parsed)) {
    throw ConfigurationError(key + " must be a number, got '" + value + "'");
  }
  return parsed;
}

std::uint64_t parse_unsigned(const std::string& key, const std::string& value) {
  if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
    throw ConfigurationError(key + " must be a non-negative integer, got '" + value + "'");
  }
  try {
    return std::stoull(value);
  } catch (const std::exception&) {
    throw ConfigurationError(key + " is out of range: '" + value + "'");
  }
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') || (value.front() == '\'' && value.back() == '\''))) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

std::vector<std::string> parse_list(const std::string& value) {
  std::string body = value;
  if (body.size() >= 2 && body.front() == '[' && body.back() == ']') {
    body = body.substr(1, body.size() - 2);
  }

  std::vector<std::string> items;
  std::stringstream stream(body);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = unquote(trim(item));
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

// Splits "sensors.temp_01.min" into ("temp_01", "min").
std::pair<std::string, std::string> split_entity_key(const std::string& key, const std::string& section) {
  const std::string rest = key.substr(section.size() + 1);
  const auto dot = rest.find('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == rest.size()) {
    throw ConfigurationError("expected " + section + ".<id>.<field>, got '" + key + "'");
  }
  return {rest.substr(0, dot), rest.substr(dot + 1)};
}

std::size_t sensor_index(SimulationConfig& config, const std::string& id) {
  for (std::size_t i = 0; i < config.sensors.size(); ++i) {
    if (config.sensors[i].id == id) {
      return i;
    }
  }
  model::SensorProfile profile{};
  profile.id = id;
  config.sensors.push_back(profile);
  config.calibration_age_days.push_back(0.0);
  return config.sensors.size() - 1;
}

controllers::ControllerSettings& controller_entry(SimulationConfig& config, const std::string& id) {
  for (auto& controller : config.controllers) {
    if (controller.id == id) {
      return controller;
    }
  }
  controllers::ControllerSettings settings{};
  settings.id = id;
  settings.stage = id;
  config.controllers.push_back(settings);
  return config.controllers.back();
}

void apply_sensor_key(SimulationConfig& config, const std::string& key, const std::string& value) {
  const auto [id, field] = split_entity_key(key, "sensors");
  const std::size_t index = sensor_index(config, id);
  model::SensorProfile& profile = config.sensors[index];

  if (field == "kind") {
    const auto kind = model::parse_quantity_kind(lowercase(value));
    if (!kind.has_value()) {
      throw ConfigurationError(key + ": unknown sensor kind '" + value + "'");
    }
    profile.kind = *kind;
  } else if (field == "controller") {
    profile.controller_id = value;
  } else if (field == "min") {
    profile.min = parse_double(key, value);
  } else if (field == "max") {
    profile.max = parse_double(key, value);
  } else if (field == "accuracy") {
    profile.accuracy = parse_double(key, value);
  } else if (field == "update_period_s") {
    profile.update_period_s = parse_double(key, value);
  } else if (field == "nominal") {
    profile.nominal = parse_double(key, value);
  } else if (field == "manufacturer") {
    profile.manufacturer = value;
  } else if (field == "model") {
    profile.model = value;
  } else if (field == "calibration_interval_days") {
    const double days = parse_double(key, value);
    if (days <= 0.0) {
      throw ConfigurationError(key + " must be greater than 0");
    }
    profile.calibration_interval_ms = static_cast<std::uint64_t>(std::llround(days * static_cast<double>(model::kMillisPerDay)));
  } else if (field == "last_calibration_days_ago") {
    const double days = parse_double(key, value);
    if (days < 0.0) {
      throw ConfigurationError(key + " must be greater than or equal to 0");
    }
    config.calibration_age_days[index] = days;
  } else {
    throw ConfigurationError("unknown sensor key: " + key);
  }
}

void apply_controller_key(SimulationConfig& config, const std::string& key, const std::string& value) {
  const auto [id, field] = split_entity_key(key, "controllers");
  controllers::ControllerSettings& settings = controller_entry(config, id);

  if (field == "stage") {
    settings.stage = value;
  } else if (field == "peers") {
    settings.peers = parse_list(value);
  } else if (field == "publish_period_s") {
    settings.publish_period_s = parse_double(key, value);
  } else if (field == "heartbeat_period_s") {
    settings.heartbeat_period_s = parse_double(key, value);
  } else if (field == "hot_threshold") {
    settings.hot_threshold = parse_double(key, value);
  } else if (field == "high_pressure_threshold") {
    settings.high_pressure_threshold = parse_double(key, value);
  } else if (field == "vibration_threshold") {
    settings.vibration_threshold = parse_double(key, value);
  } else if (field == "temperature_setpoint") {
    settings.temperature_setpoint = parse_double(key, value);
  } else if (field == "pressure_setpoint") {
    settings.pressure_setpoint = parse_double(key, value);
  } else if (field == "line_speed") {
    settings.line_speed = parse_double(key, value);
  } else {
    throw ConfigurationError("unknown controller key: " + key);
  }
}

void apply_sorting_key(SimulationConfig& config, const std::string& key, const std::string& value) {
  const std::string field = key.substr(std::string("sorting.").size());
  if (field == "enabled") {
    if (parse_bool(key, value)) {
      if (!config.sorting.has_value()) {
        config.sorting = sorting::SortingSettings{};
      }
    } else {
      config.sorting.reset();
    }
    return;
  }

  if (!config.sorting.has_value()) {
    config.sorting = sorting::SortingSettings{};
  }
  sorting::SortingSettings& settings = *config.sorting;

  static const std::vector<std::pair<std::string, model::block_color>> kWeightKeys = {
      {"weights.red", model::block_color::RED},
      {"weights.blue", model::block_color::BLUE},
      {"weights.green", model::block_color::GREEN},
      {"weights.yellow", model::block_color::YELLOW},
      {"weights.unknown", model::block_color::UNKNOWN},
  };
  for (const auto& [weight_key, color] : kWeightKeys) {
    if (field == weight_key) {
      settings.color_weights[static_cast<std::size_t>(color)] = parse_double(key, value);
      return;
    }
  }

  if (field == "id") {
    settings.id = value;
  } else if (field == "controller") {
    settings.controller_id = value;
  } else if (field == "delay_min_s") {
    settings.delay_min_s = parse_double(key, value);
  } else if (field == "delay_max_s") {
    settings.delay_max_s = parse_double(key, value);
  } else if (field == "summary_every") {
    settings.summary_every = parse_unsigned(key, value);
  } else if (field == "jam_probability") {
    settings.jam_probability = parse_double(key, value);
  } else if (field == "jam_clear_probability") {
    settings.jam_clear_probability = parse_double(key, value);
  } else if (field == "jam_retry_s") {
    settings.jam_retry_s = parse_double(key, value);
  } else if (field == "error_backoff_s") {
    settings.error_backoff_s = parse_double(key, value);
  } else {
    throw ConfigurationError("unknown sorting key: " + key);
  }
}

void apply_supervisor_key(SimulationConfig& config, const std::string& key, const std::string& value) {
  const std::string field = key.substr(std::string("supervisor.").size());
  if (field == "id") {
    config.supervisor.id = value;
  } else if (field == "min_efficiency") {
    config.supervisor.min_efficiency = parse_double(key, value);
  } else if (field == "line_speed_step") {
    config.supervisor.line_speed_step = parse_double(key, value);
  } else if (field == "min_line_speed") {
    config.supervisor.min_line_speed = parse_double(key, value);
  } else {
    throw ConfigurationError("unknown supervisor key: " + key);
  }
}

void apply_signal_key(SimulationConfig& config, const std::string& key, const std::string& value) {
  const std::string field = key.substr(std::string("signal.").size());
  sensors::SignalModelParams& params = config.signal;
  const std::vector<std::pair<std::string, double*>> fields = {
      {"process_period_s", &params.process_period_s},
      {"pump_period_s", &params.pump_period_s},
      {"pressure_drop_probability", &params.pressure_drop_probability},
      {"pressure_drop_fraction", &params.pressure_drop_fraction},
      {"rotation_period_s", &params.rotation_period_s},
      {"vibration_spike_probability", &params.vibration_spike_probability},
      {"vibration_spike_min", &params.vibration_spike_min},
      {"vibration_spike_max", &params.vibration_spike_max},
      {"base_defect_rate", &params.base_defect_rate},
      {"quality_cycle_s", &params.quality_cycle_s},
      {"parts_per_inspection", &params.parts_per_inspection},
      {"drift_rate_per_hour", &params.drift_rate_per_hour},
      {"calibration_error_fraction", &params.calibration_error_fraction},
  };
  for (const auto& [name, target] : fields) {
    if (field == name) {
      *target = parse_double(key, value);
      return;
    }
  }
  throw ConfigurationError("unknown signal key: " + key);
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const std::uint64_t parsed_port = parse_unsigned("redis.address port", value.substr(split + 1));
  if (parsed_port == 0 || parsed_port > 65535) {
    throw ConfigurationError("redis.address port must be in range 1..65535");
  }
  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(SimulationConfig& config, const std::string& key, const std::string& raw_value) {
  const std::string value = unquote(raw_value);

  if (key == "seed") {
    config.seed = parse_unsigned(key, value);
    return;
  }

  if (key == "tick_rate_hz") {
    const auto hz = parse_unsigned(key, value);
    if (hz == 0) {
      throw ConfigurationError("tick_rate_hz must be greater than 0");
    }

    if (hz > 1000) {
      throw ConfigurationError("tick_rate_hz must be less than or equal to 1000");
    }

    config.tick_interval = std::chrono::milliseconds(1000 / hz);
    return;
  }

  if (key == "realtime") {
    config.realtime = parse_bool(key, value);
    return;
  }

  if (key == "topic_prefix") {
    if (value.empty()) {
      throw ConfigurationError("topic_prefix must not be empty");
    }
    config.topic_prefix = value;
    return;
  }

  if (key == "stdout_debug") {
    config.stdout_debug = parse_bool(key, value);
    config.supervisor.stdout_debug = config.stdout_debug;
    return;
  }

  if (key == "duration_s") {
    config.duration_s = parse_double(key, value);
    if (config.duration_s < 0.0) {
      throw ConfigurationError("duration_s must be greater than or equal to 0");
    }
    return;
  }

  if (key == "start_time_ms") {
    config.start_time_ms = parse_unsigned(key, value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }

  if (key == "redis.password") {
    config.redis.password = value;
    return;
  }

  if (key == "redis.db") {
    config.redis.db = static_cast<int>(parse_unsigned(key, value));
    return;
  }

  if (key.rfind("sensors.", 0) == 0) {
    apply_sensor_key(config, key, value);
    return;
  }

  if (key.rfind("controllers.", 0) == 0) {
    apply_controller_key(config, key, value);
    return;
  }

  if (key.rfind("sorting.", 0) == 0) {
    apply_sorting_key(config, key, value);
    return;
  }

  if (key.rfind("supervisor.", 0) == 0) {
    apply_supervisor_key(config, key, value);
    return;
  }

  if (key.rfind("signal.", 0) == 0) {
    apply_signal_key(config, key, value);
    return;
  }

  throw ConfigurationError("unknown config key: " + key);
}

}  // namespace

SimulationConfig parse_simulation_config(const std::string& text) {
  SimulationConfig config{};

  std::istringstream input(text);
  std::vector<std::string> sections;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      throw ConfigurationError("line " + std::to_string(line_number) + ": expected 'key: value'");
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));
    if (depth > sections.size()) {
      throw ConfigurationError("line " + std::to_string(line_number) + ": unexpected indentation");
    }

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      sections.push_back(key);
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  if (config.sorting.has_value()) {
    config.sorting->supervisor_id = config.supervisor.id;
  }
  validate_simulation_config(config);
  return config;
}

SimulationConfig load_simulation_config(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw ConfigurationError("unable to open config file: " + path);
  }

  std::ostringstream contents;
  contents << input.rdbuf();
  return parse_simulation_config(contents.str());
}

void validate_simulation_config(const SimulationConfig& config) {
  sensors::validate_signal_params(config.signal);
  supervisor::validate_supervisor_settings(config.supervisor);

  std::set<std::string> controller_ids;
  for (const auto& controller : config.controllers) {
    controllers::validate_controller_settings(controller);
    if (!controller_ids.insert(controller.id).second) {
      throw ConfigurationError("duplicate controller id: " + controller.id);
    }
  }
  if (controller_ids.count(config.supervisor.id) != 0) {
    throw ConfigurationError("supervisor id collides with controller id: " + config.supervisor.id);
  }

  for (const auto& controller : config.controllers) {
    for (const auto& peer : controller.peers) {
      if (peer == controller.id) {
        throw ConfigurationError("controller " + controller.id + " lists itself as a peer");
      }
      if (controller_ids.count(peer) == 0) {
        throw ConfigurationError("controller " + controller.id + " has unknown peer: " + peer);
      }
    }
  }

  for (const auto& profile : config.sensors) {
    model::validate_profile(profile);
    if (controller_ids.count(profile.controller_id) == 0) {
      throw ConfigurationError("sensor " + profile.id + " references unknown controller: " + profile.controller_id);
    }
  }

  if (config.sorting.has_value()) {
    sorting::validate_sorting_settings(*config.sorting);
    if (controller_ids.count(config.sorting->controller_id) == 0) {
      throw ConfigurationError("sorting.controller references unknown controller: " + config.sorting->controller_id);
    }
  }
}

}  // namespace factory_sim::core
