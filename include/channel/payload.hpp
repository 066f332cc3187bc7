#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace factory_sim::channel {

// Flat key/value token sequence: key1, value1, key2, value2, ...
struct Payload {
  std::vector<std::string> tokens{};

  void add(const std::string& key, std::string value);
  void add(const std::string& key, const char* value);
  void add(const std::string& key, double value);
  void add(const std::string& key, std::uint64_t value);
  void add(const std::string& key, bool value);

  [[nodiscard]] std::size_t field_count() const noexcept { return tokens.size() / 2; }

  bool operator==(const Payload& other) const = default;
};

// Wire form: tokens joined by ',' with '\' and ',' escaped by a backslash.
std::string encode_wire(const Payload& payload);
// Throws core::DecodeError on a dangling escape or an odd token count.
Payload decode_wire(const std::string& wire);

// Key lookup over a decoded payload. Later duplicates win; unknown keys are simply
// never asked for.
class FieldReader {
 public:
  explicit FieldReader(const Payload& payload);

  [[nodiscard]] bool has(const std::string& key) const;
  [[nodiscard]] const std::string& require(const std::string& key) const;
  [[nodiscard]] double require_double(const std::string& key) const;
  [[nodiscard]] std::uint64_t require_u64(const std::string& key) const;
  [[nodiscard]] bool require_bool(const std::string& key) const;
  [[nodiscard]] std::optional<std::string> get(const std::string& key) const;
  [[nodiscard]] std::optional<double> get_double(const std::string& key) const;
  [[nodiscard]] std::optional<std::uint64_t> get_u64(const std::string& key) const;

  // Fields whose key starts with `prefix`, prefix stripped, in payload order.
  [[nodiscard]] std::vector<std::pair<std::string, std::string>> with_prefix(const std::string& prefix) const;

 private:
  const Payload& payload_;
  std::unordered_map<std::string, std::size_t> index_{};
};

// Glob match with '*' and '?', the semantics of Redis PSUBSCRIBE patterns.
bool topic_matches(const std::string& pattern, const std::string& topic) noexcept;

}  // namespace factory_sim::channel
