#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "channel/telemetry_channel.hpp"

struct redisContext;

namespace factory_sim::channel {

struct RedisChannelOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::uint32_t connect_timeout_ms{1000};
  std::uint32_t poll_timeout_ms{200};
  bool subscriber_enabled{true};
};

// Bus over Redis PUBLISH / PSUBSCRIBE. Publishing uses one connection on the caller's
// thread; subscriptions use a second connection owned by a background thread that
// only fills an inbox. Handlers run in dispatch_pending().
class RedisChannel final : public TelemetryChannel {
 public:
  explicit RedisChannel(RedisChannelOptions options = {});
  ~RedisChannel() override;

  RedisChannel(const RedisChannel&) = delete;
  RedisChannel& operator=(const RedisChannel&) = delete;
  RedisChannel(RedisChannel&&) = delete;
  RedisChannel& operator=(RedisChannel&&) = delete;

  bool check_connectivity();

  bool publish(const std::string& topic, const Payload& payload) override;
  bool subscribe(const std::string& pattern, MessageHandler handler) override;
  std::size_t dispatch_pending() override;
  void close() override;

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };
  using ContextPtr = std::unique_ptr<redisContext, ContextDeleter>;

  struct Subscription {
    std::string pattern;
    MessageHandler handler;
  };

  struct InboundMessage {
    std::string pattern;
    std::string topic;
    Payload payload;
  };

  ContextPtr connect_context() const;
  bool prepare_context(redisContext* context) const;
  bool ensure_connected();
  bool reconnect();
  bool publish_impl(const std::string& topic, const std::string& wire);

  void start_subscriber();
  void subscriber_loop();
  bool send_psubscribe(redisContext* context, const std::vector<std::string>& patterns) const;
  void handle_subscriber_reply(void* reply);

  RedisChannelOptions options_;
  std::mutex publish_mutex_;
  ContextPtr publish_context_{};
  bool publish_was_ok_{true};

  std::mutex mutex_;
  std::vector<Subscription> subscriptions_{};
  std::vector<std::string> subscribed_patterns_{};
  std::vector<std::string> pending_patterns_{};
  std::deque<InboundMessage> inbox_{};

  std::atomic<bool> stop_{false};
  std::thread subscriber_{};
};

}  // namespace factory_sim::channel
