#include "protocol/errors.hpp"

#include <utility>

namespace nexsock_protocol {

bool Failure::is(SessionError e) const {
  const auto *v = std::get_if<SessionError>(&code);
  return v != nullptr && *v == e;
}

bool Failure::is(DecodeError e) const {
  const auto *v = std::get_if<DecodeError>(&code);
  return v != nullptr && *v == e;
}

bool Failure::is(FrameError e) const {
  const auto *v = std::get_if<FrameError>(&code);
  return v != nullptr && *v == e;
}

Failure make_failure(ErrorCode code, std::string detail) {
  Failure f;
  f.code = code;
  f.detail = std::move(detail);
  return f;
}

Failure make_failure(ErrorCode code, uint64_t correlation_id,
                     std::string detail) {
  Failure f = make_failure(code, std::move(detail));
  f.correlation_id = correlation_id;
  return f;
}

const char *to_string(DecodeError e) {
  switch (e) {
  case DecodeError::Malformed:
    return "Malformed";
  case DecodeError::Truncated:
    return "Truncated";
  case DecodeError::UnsupportedVersion:
    return "UnsupportedVersion";
  }
  return "DecodeError(?)";
}

const char *to_string(FrameError e) {
  switch (e) {
  case FrameError::FrameTooLarge:
    return "FrameTooLarge";
  case FrameError::HeaderCorrupt:
    return "HeaderCorrupt";
  }
  return "FrameError(?)";
}

const char *to_string(SessionError e) {
  switch (e) {
  case SessionError::Timeout:
    return "Timeout";
  case SessionError::ConnectionClosed:
    return "ConnectionClosed";
  case SessionError::ProtocolViolation:
    return "ProtocolViolation";
  case SessionError::NoMatchingRequest:
    return "NoMatchingRequest";
  case SessionError::Cancelled:
    return "Cancelled";
  }
  return "SessionError(?)";
}

std::string to_string(const ErrorCode &code) {
  return std::visit([](auto e) { return std::string(to_string(e)); }, code);
}

std::string to_string(const Failure &f) {
  std::string out = to_string(f.code);
  if (f.correlation_id) {
    out += " (correlation_id=" + std::to_string(*f.correlation_id) + ")";
  }
  if (f.cause) {
    out += " caused by " + to_string(*f.cause);
  }
  if (!f.detail.empty()) {
    out += ": " + f.detail;
  }
  return out;
}

bool is_fatal(const ErrorCode &code) {
  if (std::holds_alternative<DecodeError>(code) ||
      std::holds_alternative<FrameError>(code)) {
    return true;
  }
  return std::get<SessionError>(code) == SessionError::ProtocolViolation;
}

bool is_retryable(const ErrorCode &code) {
  const auto *e = std::get_if<SessionError>(&code);
  if (e == nullptr) {
    return false;
  }
  return *e == SessionError::Timeout || *e == SessionError::ConnectionClosed;
}

} // namespace nexsock_protocol
