#include "channel/payload.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <utility>

#include "core/errors.hpp"

namespace factory_sim::channel {

namespace {

std::string format_double(const double value) {
  if (!std::isfinite(value)) {
    return "0";
  }
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.10g", value);
  return buffer;
}

double parse_double(const std::string& key, const std::string& text) {
  if (text.empty()) {
    throw core::DecodeError("field " + key + " is empty");
  }
  char* end = nullptr;
  errno = 0;
  const double value = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0' || errno == ERANGE || !std::isfinite(value)) {
    throw core::DecodeError("field " + key + " is not a number: " + text);
  }
  return value;
}

std::uint64_t parse_u64(const std::string& key, const std::string& text) {
  if (text.empty() || text.front() == '-') {
    throw core::DecodeError("field " + key + " is not an unsigned integer: " + text);
  }
  char* end = nullptr;
  errno = 0;
  const unsigned long long value = std::strtoull(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0' || errno == ERANGE) {
    throw core::DecodeError("field " + key + " is not an unsigned integer: " + text);
  }
  return static_cast<std::uint64_t>(value);
}

bool parse_bool(const std::string& key, const std::string& text) {
  if (text == "1" || text == "true") {
    return true;
  }
  if (text == "0" || text == "false") {
    return false;
  }
  throw core::DecodeError("field " + key + " is not a bool: " + text);
}

bool glob_match(const char* pattern, const char* text) noexcept {
  const char* star = nullptr;
  const char* resume = nullptr;

  while (*text != '\0') {
    if (*pattern == '?' || (*pattern != '*' && *pattern == *text)) {
      ++pattern;
      ++text;
      continue;
    }
    if (*pattern == '*') {
      star = pattern++;
      resume = text;
      continue;
    }
    if (star != nullptr) {
      pattern = star + 1;
      text = ++resume;
      continue;
    }
    return false;
  }

  while (*pattern == '*') {
    ++pattern;
  }
  return *pattern == '\0';
}

}  // namespace

void Payload::add(const std::string& key, std::string value) {
  tokens.push_back(key);
  tokens.push_back(std::move(value));
}

void Payload::add(const std::string& key, const char* value) { add(key, std::string(value != nullptr ? value : "")); }

void Payload::add(const std::string& key, const double value) { add(key, format_double(value)); }

void Payload::add(const std::string& key, const std::uint64_t value) { add(key, std::to_string(value)); }

void Payload::add(const std::string& key, const bool value) { add(key, std::string(value ? "1" : "0")); }

std::string encode_wire(const Payload& payload) {
  std::string wire;
  for (std::size_t i = 0; i < payload.tokens.size(); ++i) {
    if (i != 0) {
      wire.push_back(',');
    }
    for (const char c : payload.tokens[i]) {
      if (c == '\\' || c == ',') {
        wire.push_back('\\');
      }
      wire.push_back(c);
    }
  }
  return wire;
}

Payload decode_wire(const std::string& wire) {
  Payload payload{};
  if (wire.empty()) {
    return payload;
  }

  std::string token;
  bool escaped = false;
  for (const char c : wire) {
    if (escaped) {
      token.push_back(c);
      escaped = false;
      continue;
    }
    if (c == '\\') {
      escaped = true;
      continue;
    }
    if (c == ',') {
      payload.tokens.push_back(std::move(token));
      token.clear();
      continue;
    }
    token.push_back(c);
  }

  if (escaped) {
    throw core::DecodeError("payload ends inside an escape sequence");
  }
  payload.tokens.push_back(std::move(token));

  if (payload.tokens.size() % 2 != 0) {
    throw core::DecodeError("payload has an odd number of tokens");
  }
  return payload;
}

FieldReader::FieldReader(const Payload& payload) : payload_(payload) {
  if (payload_.tokens.size() % 2 != 0) {
    throw core::DecodeError("payload has an odd number of tokens");
  }
  for (std::size_t i = 0; i < payload_.tokens.size(); i += 2) {
    index_[payload_.tokens[i]] = i + 1;
  }
}

bool FieldReader::has(const std::string& key) const { return index_.find(key) != index_.end(); }

const std::string& FieldReader::require(const std::string& key) const {
  const auto it = index_.find(key);
  if (it == index_.end()) {
    throw core::DecodeError("missing field " + key);
  }
  return payload_.tokens[it->second];
}

double FieldReader::require_double(const std::string& key) const { return parse_double(key, require(key)); }

std::uint64_t FieldReader::require_u64(const std::string& key) const { return parse_u64(key, require(key)); }

bool FieldReader::require_bool(const std::string& key) const { return parse_bool(key, require(key)); }

std::optional<std::string> FieldReader::get(const std::string& key) const {
  const auto it = index_.find(key);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return payload_.tokens[it->second];
}

std::optional<double> FieldReader::get_double(const std::string& key) const {
  if (!has(key)) {
    return std::nullopt;
  }
  return require_double(key);
}

std::optional<std::uint64_t> FieldReader::get_u64(const std::string& key) const {
  if (!has(key)) {
    return std::nullopt;
  }
  return require_u64(key);
}

std::vector<std::pair<std::string, std::string>> FieldReader::with_prefix(const std::string& prefix) const {
  std::vector<std::pair<std::string, std::string>> fields;
  for (std::size_t i = 0; i + 1 < payload_.tokens.size(); i += 2) {
    const std::string& key = payload_.tokens[i];
    if (key.size() > prefix.size() && key.compare(0, prefix.size(), prefix) == 0) {
      fields.emplace_back(key.substr(prefix.size()), payload_.tokens[i + 1]);
    }
  }
  return fields;
}

bool topic_matches(const std::string& pattern, const std::string& topic) noexcept {
  return glob_match(pattern.c_str(), topic.c_str());
}

}  // namespace factory_sim::channel
