#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include "channel/payload.hpp"

namespace factory_sim::channel {

using MessageHandler = std::function<void(const std::string& topic, const Payload& payload)>;

// Publish/subscribe bus seen by the simulation. Delivery is at-most-once and ordered
// per (publisher, topic). Handlers only run inside dispatch_pending(), on the
// caller's thread, one message at a time.
class TelemetryChannel {
 public:
  virtual ~TelemetryChannel() = default;

  // Fire-and-forget. False reports a transient failure; nothing is thrown.
  virtual bool publish(const std::string& topic, const Payload& payload) = 0;

  virtual bool subscribe(const std::string& pattern, MessageHandler handler) = 0;

  // Delivers queued messages to matching handlers. Returns the number of deliveries.
  virtual std::size_t dispatch_pending() = 0;

  virtual void close() = 0;
};

}  // namespace factory_sim::channel
