#include "channel/in_memory_channel.hpp"

#include <iostream>
#include <utility>

#include "core/errors.hpp"

namespace factory_sim::channel {

InMemoryChannel::InMemoryChannel(const std::size_t max_dispatch_rounds)
    : max_dispatch_rounds_(max_dispatch_rounds == 0 ? 1 : max_dispatch_rounds) {}

bool InMemoryChannel::publish(const std::string& topic, const Payload& payload) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return false;
  }
  queue_.emplace_back(topic, payload);
  ++published_;
  return true;
}

bool InMemoryChannel::subscribe(const std::string& pattern, MessageHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_ || !handler) {
    return false;
  }
  subscriptions_.push_back(Subscription{pattern, std::move(handler)});
  return true;
}

std::size_t InMemoryChannel::dispatch_pending() {
  std::size_t delivered = 0;

  // Handlers may publish replies; those are delivered in a following round so a
  // request and its acknowledgement settle within one call.
  for (std::size_t round = 0; round < max_dispatch_rounds_; ++round) {
    std::deque<std::pair<std::string, Payload>> batch;
    std::vector<Subscription> subscriptions;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      batch.swap(queue_);
      subscriptions = subscriptions_;
    }
    if (batch.empty()) {
      break;
    }

    for (const auto& [topic, payload] : batch) {
      for (const auto& subscription : subscriptions) {
        if (!topic_matches(subscription.pattern, topic)) {
          continue;
        }
        try {
          subscription.handler(topic, payload);
        } catch (const core::SimulationInvariantViolation&) {
          throw;
        } catch (const core::DecodeError& ex) {
          std::cerr << "[channel] dropped message on " << topic << ": " << ex.what() << '\n';
        } catch (const std::exception& ex) {
          std::cerr << "[channel] handler for " << subscription.pattern << " failed on " << topic << ": "
                    << ex.what() << '\n';
        }
        ++delivered;
      }
    }
  }

  return delivered;
}

void InMemoryChannel::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  queue_.clear();
}

std::uint64_t InMemoryChannel::published_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return published_;
}

std::size_t InMemoryChannel::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

}  // namespace factory_sim::channel
