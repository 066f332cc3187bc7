#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <unordered_map>

#include "model/peer_message.hpp"

namespace factory_sim::controllers {

struct HeartbeatOutcome {
  model::PeerMessage ack;
  bool first_seen{false};
};

// Controller-to-controller protocol: numbered heartbeats answered by acks, setpoint
// commands answered by responses, and one-way process events. Tracks outgoing
// sequence counters and per-sender duplicate windows; owns no channel.
class PeerLink {
 public:
  explicit PeerLink(std::string node_id, std::size_t duplicate_window = 1024);

  model::PeerMessage make_heartbeat(const std::string& destination, std::uint64_t now_ms);

  // Always yields exactly one ack. `first_seen` is false for a replayed sequence.
  HeartbeatOutcome on_heartbeat(const model::PeerMessage& heartbeat, std::uint64_t now_ms);

  model::PeerMessage make_command(const std::string& destination, const std::map<std::string, double>& setpoints,
                                  std::uint64_t now_ms);
  model::PeerMessage make_response(const model::PeerMessage& command, std::size_t applied, const std::string& status,
                                   std::uint64_t now_ms);
  model::PeerMessage make_process_event(const std::string& destination, const std::string& event, bool active,
                                        std::uint64_t now_ms);

  [[nodiscard]] const std::string& node_id() const noexcept;
  [[nodiscard]] std::uint64_t last_heartbeat_sequence() const noexcept;

 private:
  bool remember(const std::string& sender, std::uint64_t sequence);

  std::string node_id_;
  std::size_t duplicate_window_{1024};
  std::uint64_t heartbeat_sequence_{0};
  std::uint64_t command_sequence_{0};
  std::uint64_t event_sequence_{0};
  std::unordered_map<std::string, std::set<std::uint64_t>> seen_heartbeats_{};
};

}  // namespace factory_sim::controllers
