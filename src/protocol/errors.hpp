#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace nexsock_protocol {

// Codec failures
enum class DecodeError : uint8_t {
  Malformed,         // bytes do not match any known structural layout
  Truncated,         // fewer bytes than the declared structure requires
  UnsupportedVersion // version tag newer than this build understands
};

// Frame layer failures
enum class FrameError : uint8_t {
  FrameTooLarge, // declared length exceeds the configured maximum
  HeaderCorrupt  // header cannot be parsed
};

// Session failures
enum class SessionError : uint8_t {
  Timeout,
  ConnectionClosed,
  ProtocolViolation,
  NoMatchingRequest,
  Cancelled
};

using ErrorCode = std::variant<DecodeError, FrameError, SessionError>;

// A typed failure. `code` is the identity; `detail` is for humans only.
struct Failure {
  ErrorCode code;
  std::optional<uint64_t> correlation_id;
  std::optional<ErrorCode> cause; // underlying code for ProtocolViolation
  std::string detail;

  bool is(SessionError e) const;
  bool is(DecodeError e) const;
  bool is(FrameError e) const;
};

Failure make_failure(ErrorCode code, std::string detail = {});
Failure make_failure(ErrorCode code, uint64_t correlation_id,
                     std::string detail = {});

const char *to_string(DecodeError e);
const char *to_string(FrameError e);
const char *to_string(SessionError e);
std::string to_string(const ErrorCode &code);
std::string to_string(const Failure &f);

// Fatal codes close the session when raised by inbound data: framing
// integrity can no longer be trusted.
bool is_fatal(const ErrorCode &code);

// Codes after which a caller may reasonably retry (possibly on a new session).
bool is_retryable(const ErrorCode &code);

} // namespace nexsock_protocol
