#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "channel/telemetry_channel.hpp"

namespace factory_sim::channel {

// Process-local bus. publish() may be called from any thread; dispatch happens on
// the thread calling dispatch_pending().
class InMemoryChannel final : public TelemetryChannel {
 public:
  explicit InMemoryChannel(std::size_t max_dispatch_rounds = 16);

  bool publish(const std::string& topic, const Payload& payload) override;
  bool subscribe(const std::string& pattern, MessageHandler handler) override;
  std::size_t dispatch_pending() override;
  void close() override;

  [[nodiscard]] std::uint64_t published_count() const;
  [[nodiscard]] std::size_t pending() const;

 private:
  struct Subscription {
    std::string pattern;
    MessageHandler handler;
  };

  mutable std::mutex mutex_;
  std::deque<std::pair<std::string, Payload>> queue_{};
  std::vector<Subscription> subscriptions_{};
  std::size_t max_dispatch_rounds_{16};
  std::uint64_t published_{0};
  bool closed_{false};
};

}  // namespace factory_sim::channel
