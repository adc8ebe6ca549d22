#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <variant>

#include "protocol/errors.hpp"
#include "protocol/messages.hpp"

namespace nexsock_session {

using nexsock_protocol::Failure;
using nexsock_protocol::OperationKind;
using nexsock_protocol::Response;

using RequestResult = std::variant<Response, Failure>;

// Outcome of routing an inbound Response to the table
enum class ResolveStatus : uint8_t {
  Delivered,    // handed to the waiting caller
  NoMatch,      // unknown, timed out or cancelled id
  KindMismatch  // entry removed; caller got ProtocolViolation
};

// Pending requests of one session: correlation id -> completion handle.
//
// Ids are allocated here, start at 1 and are never reused. Every entry is
// completed exactly once: by a response, a cancel/timeout, or close().
//
// Thread safety: all methods are thread-safe.
class CorrelationTable {
public:
  struct Registration {
    uint64_t correlation_id = 0;
    std::future<RequestResult> result;
  };

  // After close() the returned future is already completed with the close
  // failure.
  Registration register_request(OperationKind kind);

  ResolveStatus resolve(Response response);

  // Completes a pending entry with `failure` and removes it. Returns false if
  // the id is not pending (already answered, cancelled or never issued).
  bool fail(uint64_t correlation_id, Failure failure);

  // Completes every pending entry with `failure` and refuses new ones.
  // Returns the number of entries failed.
  size_t close(const Failure &failure);

  bool is_pending(uint64_t correlation_id) const;
  size_t size() const;
  bool closed() const;

  // Blocks until no request is pending or the timeout elapses.
  bool wait_empty(std::chrono::milliseconds timeout) const;

private:
  struct Entry {
    OperationKind kind;
    std::promise<RequestResult> promise;
  };

  mutable std::mutex mutex_;
  mutable std::condition_variable empty_cv_;
  std::map<uint64_t, Entry> pending_;
  uint64_t next_id_ = 1;
  std::optional<Failure> closed_with_;
};

} // namespace nexsock_session
