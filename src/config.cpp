#include "config.hpp"

#include <set>
#include <stdexcept>

namespace nexsock_protocol {

namespace {

constexpr uint32_t kMinFrameBytes = 16;
constexpr uint32_t kMaxFrameBytesLimit = 64u * 1024u * 1024u;
constexpr uint32_t kMinReadChunk = 64;
constexpr uint32_t kMaxReadChunk = 1024u * 1024u;

template <class T>
T read_scalar(const YAML::Node &node, const std::string &key) {
  if (!node.IsScalar()) {
    throw std::runtime_error("[CONFIG] session." + key + " must be a scalar");
  }
  try {
    return node.as<T>();
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("[CONFIG] Invalid session." + key + ": " +
                             std::string(e.what()));
  }
}

void check_range(const std::string &key, int64_t v, int64_t lo, int64_t hi) {
  if (v < lo || v > hi) {
    throw std::runtime_error("[CONFIG] session." + key +
                             " must be in range [" + std::to_string(lo) +
                             ", " + std::to_string(hi) + "]");
  }
}

} // namespace

void validate_session_config(const SessionConfig &config) {
  check_range("max_frame_bytes", config.max_frame_bytes, kMinFrameBytes,
              kMaxFrameBytesLimit);
  if (config.request_timeout_ms <= 0) {
    throw std::runtime_error("[CONFIG] session.request_timeout_ms must be > 0");
  }
  if (config.drain_timeout_ms < 0) {
    throw std::runtime_error("[CONFIG] session.drain_timeout_ms must be >= 0");
  }
  check_range("read_chunk_bytes", config.read_chunk_bytes, kMinReadChunk,
              kMaxReadChunk);
}

SessionConfig parse_session_config(const YAML::Node &session) {
  if (!session.IsMap()) {
    throw std::runtime_error("[CONFIG] 'session' section must be a map");
  }

  static const std::set<std::string> kKnownKeys = {
      "max_frame_bytes", "request_timeout_ms", "drain_timeout_ms",
      "read_chunk_bytes", "log_warnings"};

  for (const auto &kv : session) {
    const std::string key = kv.first.as<std::string>();
    if (kKnownKeys.find(key) == kKnownKeys.end()) {
      throw std::runtime_error("[CONFIG] Unknown key 'session." + key +
                               "' (prevents silently ignored config)");
    }
  }

  SessionConfig config;

  if (session["max_frame_bytes"]) {
    const auto v =
        read_scalar<int64_t>(session["max_frame_bytes"], "max_frame_bytes");
    // Checked before narrowing to uint32_t.
    check_range("max_frame_bytes", v, kMinFrameBytes, kMaxFrameBytesLimit);
    config.max_frame_bytes = static_cast<uint32_t>(v);
  }

  if (session["request_timeout_ms"]) {
    config.request_timeout_ms = read_scalar<int64_t>(
        session["request_timeout_ms"], "request_timeout_ms");
  }

  if (session["drain_timeout_ms"]) {
    config.drain_timeout_ms =
        read_scalar<int64_t>(session["drain_timeout_ms"], "drain_timeout_ms");
  }

  if (session["read_chunk_bytes"]) {
    const auto v =
        read_scalar<int64_t>(session["read_chunk_bytes"], "read_chunk_bytes");
    check_range("read_chunk_bytes", v, kMinReadChunk, kMaxReadChunk);
    config.read_chunk_bytes = static_cast<uint32_t>(v);
  }

  if (session["log_warnings"]) {
    config.log_warnings =
        read_scalar<bool>(session["log_warnings"], "log_warnings");
  }

  validate_session_config(config);
  return config;
}

SessionConfig load_session_config(const std::string &path) {
  YAML::Node yaml;

  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to load config file '" + path +
                             "': " + e.what());
  }

  if (!yaml["session"]) {
    throw std::runtime_error("[CONFIG] Missing required 'session' section");
  }

  return parse_session_config(yaml["session"]);
}

} // namespace nexsock_protocol
