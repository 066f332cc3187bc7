#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace factory_sim::model {

enum class peer_message_kind : std::uint8_t {
  HEARTBEAT = 0,
  ACK = 1,
  PROCESS_EVENT = 2,
  COMMAND = 3,
  RESPONSE = 4,
};

struct PeerMessage {
  std::string source{};
  std::string destination{};
  peer_message_kind kind{peer_message_kind::HEARTBEAT};
  std::uint64_t sequence{0};
  std::map<std::string, std::string> payload{};
  std::uint64_t timestamp_ms{0};

  bool operator==(const PeerMessage& other) const = default;
};

const char* to_string(peer_message_kind kind) noexcept;
std::optional<peer_message_kind> parse_peer_message_kind(const std::string& text);

}  // namespace factory_sim::model
