#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "config.hpp"
#include "protocol/errors.hpp"
#include "protocol/messages.hpp"
#include "session/correlation_table.hpp"
#include "transport/framing.hpp"
#include "transport/stream.hpp"

namespace nexsock_session {

using nexsock_protocol::Event;
using nexsock_protocol::EventBody;
using nexsock_protocol::Request;
using nexsock_protocol::RequestBody;
using nexsock_protocol::ResponseBody;
using nexsock_protocol::SessionConfig;

// Connecting -> Open -> Draining -> Closed. Only Open accepts new requests.
// The peer closing its write half also moves Open to Draining.
enum class SessionState : uint8_t { Connecting, Open, Draining, Closed };

const char *to_string(SessionState s);

struct SessionMetrics {
  uint64_t frames_sent = 0;
  uint64_t frames_received = 0;
  uint64_t responses_matched = 0;
  uint64_t unmatched_responses = 0; // late, cancelled or unknown ids
  uint64_t timeouts = 0;
  uint64_t cancellations = 0;
  uint64_t events_delivered = 0;
  uint64_t requests_served = 0; // peer requests answered
};

namespace detail {

// State shared between a session and the PendingRequest handles it issued,
// so a handle stays usable after the session is gone.
struct SessionShared {
  CorrelationTable table;
  std::atomic<uint64_t> timeouts{0};
  std::atomic<uint64_t> cancellations{0};
  bool log_warnings = true;
};

} // namespace detail

// Caller's handle on one in-flight request.
class PendingRequest {
public:
  PendingRequest() = default;

  uint64_t correlation_id() const { return correlation_id_; }

  // Blocks until the response, a session close or the timeout. On timeout
  // the request is withdrawn: the result is Timeout and a late response is
  // dropped. Calling wait() again returns the same result.
  RequestResult wait(std::chrono::milliseconds timeout);
  RequestResult wait();

  // Withdraws the request; wait() then yields Cancelled. Returns false if
  // the request had already completed.
  bool cancel();

private:
  friend class Session;

  PendingRequest(uint64_t correlation_id, std::future<RequestResult> result,
                 std::shared_ptr<detail::SessionShared> shared);

  uint64_t correlation_id_ = 0;
  std::future<RequestResult> result_;
  std::optional<RequestResult> done_;
  std::shared_ptr<detail::SessionShared> shared_;
};

// One live connection between controller and daemon.
//
// Responsibilities:
// - Frame, encode and write outgoing requests, responses and events
// - Run the inbound loop on its own reader thread: deframe, decode, route
// - Match responses to pending requests by correlation id
//
// Writes are serialized by a mutex held for exactly one frame, so frames
// never interleave. Handlers run on the reader thread; they must not call
// the blocking send_request() of the same session or destroy it.
//
// Thread safety: all public methods are thread-safe.
class Session {
public:
  using EventHandler = std::function<void(const Event &)>;
  using RequestHandler = std::function<ResponseBody(const Request &)>;
  using WarningHandler = std::function<void(const Failure &)>;
  using ClosedHandler = std::function<void(const Failure &)>;

  explicit Session(std::unique_ptr<nexsock_transport::Stream> stream,
                   SessionConfig config = {});
  ~Session();

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  void set_event_handler(EventHandler handler);
  // Without a handler, peer requests are answered with Unimplemented.
  void set_request_handler(RequestHandler handler);
  // Non-fatal typed failures: NoMatchingRequest, response kind mismatch.
  void set_warning_handler(WarningHandler handler);
  // Fires exactly once, with the reason the session closed. Exceptions
  // thrown by any handler are logged and dropped.
  void on_closed(ClosedHandler handler);

  // Connecting -> Open; starts the reader thread.
  // Throws std::runtime_error if the session was already opened.
  void open();

  PendingRequest start_request(RequestBody body);

  // start_request() + wait(). The first form uses request_timeout_ms.
  RequestResult send_request(RequestBody body);
  RequestResult send_request(RequestBody body,
                             std::chrono::milliseconds timeout);

  // Fire-and-forget. Allowed while Open or Draining.
  std::optional<Failure> send_event(EventBody body);

  // Answers a request received from the peer. Allowed while Open or Draining.
  std::optional<Failure> send_response(uint64_t correlation_id,
                                       ResponseBody body);

  // Open -> Draining: refuse new requests, let pending ones finish. A
  // request already being written completes; none starts afterwards.
  void drain();

  // drain(), wait for pending requests up to the timeout, close().
  // Returns true if nothing was pending at close.
  bool shutdown();
  bool shutdown(std::chrono::milliseconds timeout);

  // Terminal. Pending requests resolve with ConnectionClosed. Wakes a
  // writer blocked on a peer that stopped reading.
  void close();

  SessionState state() const { return state_.load(); }
  std::optional<Failure> close_reason() const;
  size_t pending_requests() const { return shared_->table.size(); }
  SessionMetrics metrics() const;
  const SessionConfig &config() const { return config_; }

private:
  void reader_loop();
  bool dispatch(const std::vector<uint8_t> &frame);
  void handle_request(const Request &req);
  std::optional<Failure> write_message(const nexsock_protocol::Message &msg);
  void fail_session(Failure reason);
  void peer_closed();
  void warn(const Failure &failure);
  void log(const std::string &msg) const;

  std::unique_ptr<nexsock_transport::Stream> stream_;
  SessionConfig config_;
  std::shared_ptr<detail::SessionShared> shared_;
  nexsock_transport::Deframer deframer_; // reader thread only

  std::atomic<SessionState> state_{SessionState::Connecting};

  std::mutex write_mutex_; // held for one frame write
  std::mutex join_mutex_;  // guards reader_ start and join
  std::thread reader_;
  std::atomic<std::thread::id> reader_id_{};

  mutable std::mutex handlers_mutex_;
  EventHandler event_handler_;
  RequestHandler request_handler_;
  WarningHandler warning_handler_;
  ClosedHandler closed_handler_;

  mutable std::mutex reason_mutex_;
  std::optional<Failure> close_reason_;

  std::atomic<uint64_t> frames_sent_{0};
  std::atomic<uint64_t> frames_received_{0};
  std::atomic<uint64_t> responses_matched_{0};
  std::atomic<uint64_t> unmatched_responses_{0};
  std::atomic<uint64_t> events_delivered_{0};
  std::atomic<uint64_t> requests_served_{0};
};

} // namespace nexsock_session
