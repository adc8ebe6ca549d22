#include "session/session.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "protocol/codec.hpp"

namespace nexsock_session {

using nexsock_protocol::DecodeError;
using nexsock_protocol::FailureCode;
using nexsock_protocol::FailurePayload;
using nexsock_protocol::FrameError;
using nexsock_protocol::Message;
using nexsock_protocol::SessionError;
using nexsock_protocol::make_failure;

namespace {

template <class> inline constexpr bool kAlwaysFalse = false;

Failure closed_failure(const std::string &detail) {
  return make_failure(SessionError::ConnectionClosed, detail);
}

// Runs a user handler. An exception is logged and stops there: it must not
// unwind the reader thread or the caller of close().
template <class Fn>
bool run_handler(const char *name, bool log_enabled, Fn &&fn) {
  try {
    fn();
    return true;
  } catch (const std::exception &e) {
    if (log_enabled) {
      std::cerr << "[Session] " << name << " handler threw: " << e.what()
                << "\n";
    }
  } catch (...) {
    if (log_enabled) {
      std::cerr << "[Session] " << name
                << " handler threw a non-standard exception\n";
    }
  }
  return false;
}

} // namespace

const char *to_string(SessionState s) {
  switch (s) {
  case SessionState::Connecting:
    return "connecting";
  case SessionState::Open:
    return "open";
  case SessionState::Draining:
    return "draining";
  case SessionState::Closed:
    return "closed";
  }
  return "unknown";
}

// -----------------------------
// PendingRequest
// -----------------------------

PendingRequest::PendingRequest(uint64_t correlation_id,
                               std::future<RequestResult> result,
                               std::shared_ptr<detail::SessionShared> shared)
    : correlation_id_(correlation_id), result_(std::move(result)),
      shared_(std::move(shared)) {}

RequestResult PendingRequest::wait(std::chrono::milliseconds timeout) {
  if (done_) {
    return *done_;
  }
  if (!result_.valid()) {
    return closed_failure("request was never issued");
  }

  if (result_.wait_for(timeout) == std::future_status::timeout) {
    // Whoever completes the entry first wins: if a response or close raced
    // in, fail() returns false and the future already holds that outcome.
    if (shared_->table.fail(
            correlation_id_,
            make_failure(SessionError::Timeout,
                         "no response within " +
                             std::to_string(timeout.count()) + "ms"))) {
      ++shared_->timeouts;
      if (shared_->log_warnings) {
        std::cerr << "[Session] request " << correlation_id_
                  << " timed out after " << timeout.count() << "ms\n";
      }
    }
  }

  done_ = result_.get();
  return *done_;
}

RequestResult PendingRequest::wait() {
  if (done_) {
    return *done_;
  }
  if (!result_.valid()) {
    return closed_failure("request was never issued");
  }
  done_ = result_.get();
  return *done_;
}

bool PendingRequest::cancel() {
  if (done_ || !shared_) {
    return false;
  }
  if (!shared_->table.fail(correlation_id_,
                           make_failure(SessionError::Cancelled,
                                        "cancelled by caller"))) {
    return false;
  }
  ++shared_->cancellations;
  return true;
}

// -----------------------------
// Session lifecycle
// -----------------------------

Session::Session(std::unique_ptr<nexsock_transport::Stream> stream,
                 SessionConfig config)
    : stream_(std::move(stream)), config_(config),
      shared_(std::make_shared<detail::SessionShared>()),
      deframer_(config.max_frame_bytes) {
  if (!stream_) {
    throw std::runtime_error("Session: stream is required");
  }
  nexsock_protocol::validate_session_config(config_);
  shared_->log_warnings = config_.log_warnings;
}

Session::~Session() { close(); }

void Session::set_event_handler(EventHandler handler) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  event_handler_ = std::move(handler);
}

void Session::set_request_handler(RequestHandler handler) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  request_handler_ = std::move(handler);
}

void Session::set_warning_handler(WarningHandler handler) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  warning_handler_ = std::move(handler);
}

void Session::on_closed(ClosedHandler handler) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  closed_handler_ = std::move(handler);
}

void Session::open() {
  SessionState expected = SessionState::Connecting;
  if (!state_.compare_exchange_strong(expected, SessionState::Open)) {
    throw std::runtime_error(std::string("Session::open: session is ") +
                             to_string(expected));
  }
  {
    std::lock_guard<std::mutex> lock(join_mutex_);
    reader_ = std::thread([this] { reader_loop(); });
    reader_id_.store(reader_.get_id());
  }
  log("open");
}

void Session::drain() {
  SessionState expected = SessionState::Open;
  if (state_.compare_exchange_strong(expected, SessionState::Draining)) {
    log("draining (" + std::to_string(shared_->table.size()) +
        " requests pending)");
  }
}

bool Session::shutdown() {
  return shutdown(std::chrono::milliseconds(config_.drain_timeout_ms));
}

bool Session::shutdown(std::chrono::milliseconds timeout) {
  drain();
  const bool drained = shared_->table.wait_empty(timeout);
  if (!drained) {
    log("drain timeout elapsed with " +
        std::to_string(shared_->table.size()) + " requests pending");
  }
  close();
  return drained;
}

void Session::close() {
  fail_session(closed_failure("closed locally"));

  // Called from a handler: the reader exits on its own and is joined by the
  // next close() from another thread, at the latest the destructor's.
  if (reader_id_.load() == std::this_thread::get_id()) {
    return;
  }

  std::lock_guard<std::mutex> lock(join_mutex_);
  if (reader_.joinable()) {
    reader_.join();
  }
  std::lock_guard<std::mutex> write_lock(write_mutex_);
  stream_->close();
}

std::optional<Failure> Session::close_reason() const {
  std::lock_guard<std::mutex> lock(reason_mutex_);
  return close_reason_;
}

SessionMetrics Session::metrics() const {
  SessionMetrics m;
  m.frames_sent = frames_sent_.load();
  m.frames_received = frames_received_.load();
  m.responses_matched = responses_matched_.load();
  m.unmatched_responses = unmatched_responses_.load();
  m.timeouts = shared_->timeouts.load();
  m.cancellations = shared_->cancellations.load();
  m.events_delivered = events_delivered_.load();
  m.requests_served = requests_served_.load();
  return m;
}

// Single transition into Closed. Whoever gets here first decides the reason.
void Session::fail_session(Failure reason) {
  const SessionState prev = state_.exchange(SessionState::Closed);
  if (prev == SessionState::Closed) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(reason_mutex_);
    close_reason_ = reason;
  }
  log("closed: " + nexsock_protocol::to_string(reason));

  const size_t failed = shared_->table.close(
      closed_failure("session closed: " + nexsock_protocol::to_string(reason)));
  if (failed > 0) {
    log(std::to_string(failed) + " pending requests resolved as ConnectionClosed");
  }

  stream_->interrupt();
  {
    // Waits for an in-flight frame write to finish; later writers see Closed.
    std::lock_guard<std::mutex> lock(write_mutex_);
    stream_->shutdown_write();
  }

  ClosedHandler handler;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handler = closed_handler_;
  }
  if (handler) {
    run_handler("closed", config_.log_warnings, [&] { handler(reason); });
  }
}

// The peer can send nothing more, so pending requests fail now. The write
// half stays usable until close(), shutdown() or a write failure.
void Session::peer_closed() {
  SessionState expected = SessionState::Open;
  if (!state_.compare_exchange_strong(expected, SessionState::Draining) &&
      expected != SessionState::Draining) {
    return;
  }
  log("peer closed its write half; draining");

  const size_t failed =
      shared_->table.close(closed_failure("peer closed the stream"));
  if (failed > 0) {
    log(std::to_string(failed) + " pending requests resolved as ConnectionClosed");
  }
}

// -----------------------------
// Outbound
// -----------------------------

PendingRequest Session::start_request(RequestBody body) {
  const SessionState st = state_.load();
  if (st != SessionState::Open) {
    std::promise<RequestResult> refused;
    refused.set_value(closed_failure(std::string("session is ") +
                                     to_string(st) +
                                     "; new requests are not accepted"));
    return PendingRequest(0, refused.get_future(), shared_);
  }

  // Register before writing: the response may arrive before write returns.
  auto reg =
      shared_->table.register_request(nexsock_protocol::operation_kind(body));
  const uint64_t id = reg.correlation_id;

  if (auto failure = write_message(Request{id, std::move(body)})) {
    shared_->table.fail(id, *failure);
  }

  return PendingRequest(id, std::move(reg.result), shared_);
}

RequestResult Session::send_request(RequestBody body) {
  return send_request(std::move(body),
                      std::chrono::milliseconds(config_.request_timeout_ms));
}

RequestResult Session::send_request(RequestBody body,
                                    std::chrono::milliseconds timeout) {
  PendingRequest pending = start_request(std::move(body));
  return pending.wait(timeout);
}

std::optional<Failure> Session::send_event(EventBody body) {
  const SessionState st = state_.load();
  if (st != SessionState::Open && st != SessionState::Draining) {
    return closed_failure(std::string("cannot send event: session is ") +
                          to_string(st));
  }
  return write_message(Event{std::move(body)});
}

std::optional<Failure> Session::send_response(uint64_t correlation_id,
                                              ResponseBody body) {
  const SessionState st = state_.load();
  if (st != SessionState::Open && st != SessionState::Draining) {
    return closed_failure(std::string("cannot send response: session is ") +
                          to_string(st));
  }
  return write_message(nexsock_protocol::Response{correlation_id, std::move(body)});
}

std::optional<Failure> Session::write_message(const Message &msg) {
  const std::vector<uint8_t> encoded = nexsock_protocol::encode(msg);
  nexsock_transport::FrameResult framed =
      nexsock_transport::frame(encoded, config_.max_frame_bytes);
  if (const auto *e = std::get_if<FrameError>(&framed)) {
    // Nothing was written; the session is unaffected.
    return make_failure(*e, "outbound message of " +
                                std::to_string(encoded.size()) +
                                " bytes cannot be framed");
  }
  const auto &bytes = std::get<std::vector<uint8_t>>(framed);

  std::string err;
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    const SessionState st = state_.load();
    if (st == SessionState::Closed) {
      return closed_failure("session closed");
    }
    // Checked under the write lock: once drain() has returned, no request
    // frame starts.
    if (st != SessionState::Open && std::holds_alternative<Request>(msg)) {
      return closed_failure(std::string("session is ") + to_string(st) +
                            "; request not sent");
    }
    if (stream_->write_all(bytes.data(), bytes.size(), err)) {
      ++frames_sent_;
      return std::nullopt;
    }
  }

  // A partial frame may be on the wire: the stream is unusable.
  Failure f = closed_failure("write failed: " + err);
  fail_session(f);
  return f;
}

// -----------------------------
// Inbound
// -----------------------------

void Session::reader_loop() {
  std::vector<uint8_t> buf(config_.read_chunk_bytes);
  std::vector<uint8_t> frame;
  std::string err;

  while (true) {
    size_t n = 0;
    const auto status = stream_->read_some(buf.data(), buf.size(), n, err);

    switch (status) {
    case nexsock_transport::ReadStatus::Interrupted:
      return;
    case nexsock_transport::ReadStatus::Eof:
      peer_closed();
      return;
    case nexsock_transport::ReadStatus::Error:
      fail_session(closed_failure("read failed: " + err));
      return;
    case nexsock_transport::ReadStatus::Ok:
      break;
    }

    deframer_.feed(buf.data(), n);

    while (true) {
      const auto ds = deframer_.next(frame);
      if (ds == nexsock_transport::DeframeStatus::NeedMore) {
        break;
      }
      if (ds == nexsock_transport::DeframeStatus::Error) {
        Failure f = make_failure(SessionError::ProtocolViolation,
                                 "corrupt frame on the stream");
        if (const auto e = deframer_.error()) {
          f.cause = *e;
        }
        fail_session(f);
        return;
      }

      ++frames_received_;
      if (!dispatch(frame)) {
        return;
      }
    }
  }
}

bool Session::dispatch(const std::vector<uint8_t> &frame) {
  nexsock_protocol::DecodeResult decoded = nexsock_protocol::decode(frame);
  if (const auto *e = std::get_if<DecodeError>(&decoded)) {
    Failure f = make_failure(SessionError::ProtocolViolation,
                             "undecodable frame of " +
                                 std::to_string(frame.size()) + " bytes");
    f.cause = *e;
    fail_session(f);
    return false;
  }

  Message &msg = std::get<Message>(decoded);
  std::visit(
      [this](auto &m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, nexsock_protocol::Response>) {
          const uint64_t id = m.correlation_id;
          switch (shared_->table.resolve(std::move(m))) {
          case ResolveStatus::Delivered:
            ++responses_matched_;
            break;
          case ResolveStatus::NoMatch:
            ++unmatched_responses_;
            warn(make_failure(SessionError::NoMatchingRequest, id,
                              "late or unknown response discarded"));
            break;
          case ResolveStatus::KindMismatch:
            warn(make_failure(SessionError::ProtocolViolation, id,
                              "response does not answer the request kind"));
            break;
          }
        } else if constexpr (std::is_same_v<T, Event>) {
          EventHandler handler;
          {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handler = event_handler_;
          }
          if (!handler) {
            return;
          }
          if (run_handler("event", config_.log_warnings,
                          [&] { handler(m); })) {
            ++events_delivered_;
          }
        } else if constexpr (std::is_same_v<T, Request>) {
          handle_request(m);
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled message kind");
        }
      },
      msg);

  return state_.load() != SessionState::Closed;
}

void Session::handle_request(const Request &req) {
  RequestHandler handler;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handler = request_handler_;
  }

  ResponseBody body;
  if (!handler) {
    body = FailurePayload{FailureCode::Unimplemented,
                          std::string(nexsock_protocol::to_string(
                              nexsock_protocol::operation_kind(req.body))) +
                              " is not handled by this peer"};
  } else {
    try {
      body = handler(req);
    } catch (const std::exception &e) {
      log(std::string("request handler threw: ") + e.what());
      body = FailurePayload{FailureCode::Internal, e.what()};
    } catch (...) {
      log("request handler threw a non-standard exception");
      body = FailurePayload{FailureCode::Internal,
                            "request handler failed with an unknown error"};
    }
  }

  if (auto failure = send_response(req.correlation_id, std::move(body))) {
    log("failed to answer request " + std::to_string(req.correlation_id) +
        ": " + nexsock_protocol::to_string(*failure));
    return;
  }
  ++requests_served_;
}

void Session::warn(const Failure &failure) {
  log("warning: " + nexsock_protocol::to_string(failure));

  WarningHandler handler;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handler = warning_handler_;
  }
  if (handler) {
    run_handler("warning", config_.log_warnings, [&] { handler(failure); });
  }
}

void Session::log(const std::string &msg) const {
  if (config_.log_warnings) {
    std::cerr << "[Session] " << msg << "\n";
  }
}

} // namespace nexsock_session
