#include "channel/redis_channel.hpp"

#include <chrono>
#include <iostream>
#include <utility>

#include <poll.h>

#include <hiredis/hiredis.h>

#include "core/errors.hpp"

namespace factory_sim::channel {

namespace {

timeval to_timeval(const std::uint32_t timeout_ms) {
  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000) * 1000);
  return timeout;
}

std::string reply_string(const redisReply* reply) {
  if (reply == nullptr || reply->str == nullptr) {
    return {};
  }
  return std::string(reply->str, static_cast<std::size_t>(reply->len));
}

}  // namespace

RedisChannel::RedisChannel(RedisChannelOptions options) : options_(std::move(options)) {}

RedisChannel::~RedisChannel() { close(); }

void RedisChannel::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisChannel::check_connectivity() {
  std::lock_guard<std::mutex> lock(publish_mutex_);
  return ensure_connected();
}

RedisChannel::ContextPtr RedisChannel::connect_context() const {
  const timeval timeout = to_timeval(options_.connect_timeout_ms);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return ContextPtr{};
  }

  ContextPtr context(raw);
  if (!prepare_context(context.get())) {
    return ContextPtr{};
  }
  return context;
}

bool RedisChannel::prepare_context(redisContext* context) const {
  if (!options_.password.empty()) {
    auto* reply = static_cast<redisReply*>(redisCommand(context, "AUTH %s", options_.password.c_str()));
    if (reply == nullptr) {
      return false;
    }
    const bool ok = reply->type != REDIS_REPLY_ERROR;
    freeReplyObject(reply);
    if (!ok) {
      std::cerr << "[redis] AUTH rejected\n";
      return false;
    }
  }

  if (options_.db != 0) {
    auto* reply = static_cast<redisReply*>(redisCommand(context, "SELECT %d", options_.db));
    if (reply == nullptr) {
      return false;
    }
    const bool ok = reply->type != REDIS_REPLY_ERROR;
    freeReplyObject(reply);
    if (!ok) {
      std::cerr << "[redis] SELECT " << options_.db << " rejected\n";
      return false;
    }
  }
  return true;
}

bool RedisChannel::ensure_connected() {
  if (publish_context_ != nullptr && publish_context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisChannel::reconnect() {
  publish_context_.reset();
  publish_context_ = connect_context();
  return publish_context_ != nullptr;
}

bool RedisChannel::publish(const std::string& topic, const Payload& payload) {
  const std::string wire = encode_wire(payload);

  std::lock_guard<std::mutex> lock(publish_mutex_);
  if (stop_.load()) {
    return false;
  }

  bool ok = ensure_connected() && publish_impl(topic, wire);
  if (!ok && publish_context_ != nullptr) {
    ok = reconnect() && publish_impl(topic, wire);
  }

  if (!ok && publish_was_ok_) {
    std::cerr << "[redis] publish failed\n";
    publish_was_ok_ = false;
  } else if (ok && !publish_was_ok_) {
    std::cerr << "[redis] publish recovered\n";
    publish_was_ok_ = true;
  }
  return ok;
}

bool RedisChannel::publish_impl(const std::string& topic, const std::string& wire) {
  const char* argv[] = {"PUBLISH", topic.c_str(), wire.c_str()};
  const std::size_t argv_len[] = {7, topic.size(), wire.size()};

  auto* reply = static_cast<redisReply*>(redisCommandArgv(publish_context_.get(), 3, argv, argv_len));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

bool RedisChannel::subscribe(const std::string& pattern, MessageHandler handler) {
  if (!handler || stop_.load()) {
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    bool known = false;
    for (const auto& existing : subscribed_patterns_) {
      known = known || existing == pattern;
    }
    if (!known) {
      subscribed_patterns_.push_back(pattern);
      pending_patterns_.push_back(pattern);
    }
    subscriptions_.push_back(Subscription{pattern, std::move(handler)});
  }

  if (options_.subscriber_enabled) {
    start_subscriber();
  }
  return true;
}

std::size_t RedisChannel::dispatch_pending() {
  std::deque<InboundMessage> batch;
  std::vector<Subscription> subscriptions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    batch.swap(inbox_);
    subscriptions = subscriptions_;
  }

  std::size_t delivered = 0;
  for (const auto& message : batch) {
    for (const auto& subscription : subscriptions) {
      if (subscription.pattern != message.pattern) {
        continue;
      }
      try {
        subscription.handler(message.topic, message.payload);
      } catch (const core::SimulationInvariantViolation&) {
        throw;
      } catch (const std::exception& ex) {
        std::cerr << "[redis] handler for " << message.pattern << " failed on " << message.topic << ": "
                  << ex.what() << '\n';
      }
      ++delivered;
    }
  }
  return delivered;
}

void RedisChannel::close() {
  stop_.store(true);
  if (subscriber_.joinable()) {
    subscriber_.join();
  }

  std::lock_guard<std::mutex> lock(publish_mutex_);
  publish_context_.reset();
}

void RedisChannel::start_subscriber() {
  if (subscriber_.joinable()) {
    return;
  }
  subscriber_ = std::thread([this]() { subscriber_loop(); });
}

void RedisChannel::subscriber_loop() {
  ContextPtr context{};

  while (!stop_.load()) {
    if (context == nullptr) {
      context = connect_context();
      if (context == nullptr) {
        std::this_thread::sleep_for(std::chrono::milliseconds(options_.poll_timeout_ms));
        continue;
      }

      std::vector<std::string> patterns;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        patterns = subscribed_patterns_;
        pending_patterns_.clear();
      }
      if (!send_psubscribe(context.get(), patterns)) {
        context.reset();
        continue;
      }
      std::cerr << "[redis] subscriber connected with " << patterns.size() << " pattern(s)\n";
    }

    std::vector<std::string> fresh;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      fresh.swap(pending_patterns_);
    }
    if (!fresh.empty() && !send_psubscribe(context.get(), fresh)) {
      context.reset();
      continue;
    }

    pollfd descriptor{};
    descriptor.fd = context->fd;
    descriptor.events = POLLIN;
    const int ready = ::poll(&descriptor, 1, static_cast<int>(options_.poll_timeout_ms));
    if (ready <= 0) {
      continue;
    }

    if (redisBufferRead(context.get()) != REDIS_OK) {
      std::cerr << "[redis] subscriber read failed: " << context->errstr << '\n';
      context.reset();
      continue;
    }

    void* reply = nullptr;
    while (redisReaderGetReply(context->reader, &reply) == REDIS_OK && reply != nullptr) {
      handle_subscriber_reply(reply);
      freeReplyObject(reply);
      reply = nullptr;
    }
  }
}

bool RedisChannel::send_psubscribe(redisContext* context, const std::vector<std::string>& patterns) const {
  for (const auto& pattern : patterns) {
    const char* argv[] = {"PSUBSCRIBE", pattern.c_str()};
    const std::size_t argv_len[] = {10, pattern.size()};
    if (redisAppendCommandArgv(context, 2, argv, argv_len) != REDIS_OK) {
      return false;
    }
  }

  int done = 0;
  while (done == 0) {
    if (redisBufferWrite(context, &done) != REDIS_OK) {
      std::cerr << "[redis] PSUBSCRIBE failed: " << context->errstr << '\n';
      return false;
    }
  }
  return true;
}

void RedisChannel::handle_subscriber_reply(void* raw) {
  const auto* reply = static_cast<const redisReply*>(raw);
  if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 4) {
    return;
  }
  if (reply_string(reply->element[0]) != "pmessage") {
    return;
  }

  InboundMessage message{};
  message.pattern = reply_string(reply->element[1]);
  message.topic = reply_string(reply->element[2]);
  try {
    message.payload = decode_wire(reply_string(reply->element[3]));
  } catch (const core::DecodeError& ex) {
    std::cerr << "[redis] dropped message on " << message.topic << ": " << ex.what() << '\n';
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  inbox_.push_back(std::move(message));
}

}  // namespace factory_sim::channel
