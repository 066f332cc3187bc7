#include "model/peer_message.hpp"

namespace factory_sim::model {

const char* to_string(const peer_message_kind kind) noexcept {
  switch (kind) {
    case peer_message_kind::HEARTBEAT:
      return "heartbeat";
    case peer_message_kind::ACK:
      return "ack";
    case peer_message_kind::PROCESS_EVENT:
      return "process_event";
    case peer_message_kind::COMMAND:
      return "command";
    case peer_message_kind::RESPONSE:
      return "response";
  }
  return "unknown";
}

std::optional<peer_message_kind> parse_peer_message_kind(const std::string& text) {
  for (const auto kind : {peer_message_kind::HEARTBEAT, peer_message_kind::ACK, peer_message_kind::PROCESS_EVENT,
                          peer_message_kind::COMMAND, peer_message_kind::RESPONSE}) {
    if (text == to_string(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

}  // namespace factory_sim::model
