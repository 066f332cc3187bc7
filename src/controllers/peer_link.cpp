#include "controllers/peer_link.hpp"

#include <cstdio>
#include <utility>

namespace factory_sim::controllers {

namespace {

constexpr const char* kEchoPrefix = "echo.";

model::PeerMessage make_message(const std::string& source, const std::string& destination,
                                const model::peer_message_kind kind, const std::uint64_t sequence,
                                const std::uint64_t now_ms) {
  model::PeerMessage message{};
  message.source = source;
  message.destination = destination;
  message.kind = kind;
  message.sequence = sequence;
  message.timestamp_ms = now_ms;
  return message;
}

std::string format_setpoint(const double value) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.10g", value);
  return buffer;
}

}  // namespace

PeerLink::PeerLink(std::string node_id, const std::size_t duplicate_window)
    : node_id_(std::move(node_id)), duplicate_window_(duplicate_window == 0 ? 1 : duplicate_window) {}

model::PeerMessage PeerLink::make_heartbeat(const std::string& destination, const std::uint64_t now_ms) {
  ++heartbeat_sequence_;
  model::PeerMessage heartbeat =
      make_message(node_id_, destination, model::peer_message_kind::HEARTBEAT, heartbeat_sequence_, now_ms);
  heartbeat.payload["logical_ts"] = std::to_string(heartbeat_sequence_);
  return heartbeat;
}

HeartbeatOutcome PeerLink::on_heartbeat(const model::PeerMessage& heartbeat, const std::uint64_t now_ms) {
  HeartbeatOutcome outcome{};
  outcome.first_seen = remember(heartbeat.source, heartbeat.sequence);
  outcome.ack = make_message(node_id_, heartbeat.source, model::peer_message_kind::ACK, heartbeat.sequence, now_ms);
  outcome.ack.payload["heartbeat_src"] = heartbeat.source;
  return outcome;
}

model::PeerMessage PeerLink::make_command(const std::string& destination,
                                          const std::map<std::string, double>& setpoints,
                                          const std::uint64_t now_ms) {
  ++command_sequence_;
  model::PeerMessage command =
      make_message(node_id_, destination, model::peer_message_kind::COMMAND, command_sequence_, now_ms);
  for (const auto& [key, value] : setpoints) {
    command.payload[key] = format_setpoint(value);
  }
  return command;
}

model::PeerMessage PeerLink::make_response(const model::PeerMessage& command, const std::size_t applied,
                                           const std::string& status, const std::uint64_t now_ms) {
  model::PeerMessage response =
      make_message(node_id_, command.source, model::peer_message_kind::RESPONSE, command.sequence, now_ms);
  response.payload["command_seq"] = std::to_string(command.sequence);
  response.payload["status"] = status;
  response.payload["applied"] = std::to_string(applied);
  for (const auto& [key, value] : command.payload) {
    response.payload[std::string(kEchoPrefix) + key] = value;
  }
  return response;
}

model::PeerMessage PeerLink::make_process_event(const std::string& destination, const std::string& event,
                                                const bool active, const std::uint64_t now_ms) {
  ++event_sequence_;
  model::PeerMessage message =
      make_message(node_id_, destination, model::peer_message_kind::PROCESS_EVENT, event_sequence_, now_ms);
  message.payload["event"] = event;
  message.payload["active"] = active ? "1" : "0";
  return message;
}

const std::string& PeerLink::node_id() const noexcept { return node_id_; }

std::uint64_t PeerLink::last_heartbeat_sequence() const noexcept { return heartbeat_sequence_; }

bool PeerLink::remember(const std::string& sender, const std::uint64_t sequence) {
  std::set<std::uint64_t>& seen = seen_heartbeats_[sender];
  if (seen.size() >= duplicate_window_ && sequence < *seen.begin()) {
    // Older than anything still tracked; treat as a replay.
    return false;
  }
  if (!seen.insert(sequence).second) {
    return false;
  }
  while (seen.size() > duplicate_window_) {
    seen.erase(seen.begin());
  }
  return true;
}

}  // namespace factory_sim::controllers
