#pragma once

#include <cstdint>
#include <string>
#include <yaml-cpp/yaml.h>

namespace nexsock_protocol {

// Tuning for one transport session
struct SessionConfig {
  uint32_t max_frame_bytes = 1024u * 1024u; // inbound and outbound limit
  int64_t request_timeout_ms = 5000;        // send_request default timeout
  int64_t drain_timeout_ms = 2000;          // shutdown() wait for pending
  uint32_t read_chunk_bytes = 4096;         // reader buffer size
  bool log_warnings = true;                 // non-fatal diagnostics to stderr
};

// Load session configuration from a YAML file with a top-level 'session'
// section. Missing keys keep their defaults.
// Throws std::runtime_error if file cannot be read, parsed, or validated
SessionConfig load_session_config(const std::string &path);

// Parse the contents of a 'session' section
// Throws std::runtime_error on unknown keys or out-of-range values
SessionConfig parse_session_config(const YAML::Node &session);

// Range checks shared by the loader and the Session constructor
// Throws std::runtime_error naming the offending key
void validate_session_config(const SessionConfig &config);

} // namespace nexsock_protocol
