#include "session/correlation_table.hpp"

#include <utility>

namespace nexsock_session {

using nexsock_protocol::SessionError;

CorrelationTable::Registration
CorrelationTable::register_request(OperationKind kind) {
  Registration reg;
  std::lock_guard<std::mutex> lock(mutex_);

  reg.correlation_id = next_id_++;

  if (closed_with_) {
    std::promise<RequestResult> p;
    Failure f = *closed_with_;
    f.correlation_id = reg.correlation_id;
    p.set_value(std::move(f));
    reg.result = p.get_future();
    return reg;
  }

  Entry &e = pending_[reg.correlation_id];
  e.kind = kind;
  reg.result = e.promise.get_future();
  return reg;
}

ResolveStatus CorrelationTable::resolve(Response response) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = pending_.find(response.correlation_id);
  if (it == pending_.end()) {
    return ResolveStatus::NoMatch;
  }

  const auto kind = nexsock_protocol::operation_kind(response.body);
  ResolveStatus status = ResolveStatus::Delivered;
  if (kind && *kind != it->second.kind) {
    it->second.promise.set_value(nexsock_protocol::make_failure(
        SessionError::ProtocolViolation, response.correlation_id,
        std::string("response kind ") + nexsock_protocol::to_string(*kind) +
            " does not answer " +
            nexsock_protocol::to_string(it->second.kind)));
    status = ResolveStatus::KindMismatch;
  } else {
    it->second.promise.set_value(std::move(response));
  }

  pending_.erase(it);
  if (pending_.empty()) {
    empty_cv_.notify_all();
  }
  return status;
}

bool CorrelationTable::fail(uint64_t correlation_id, Failure failure) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = pending_.find(correlation_id);
  if (it == pending_.end()) {
    return false;
  }

  failure.correlation_id = correlation_id;
  it->second.promise.set_value(std::move(failure));
  pending_.erase(it);
  if (pending_.empty()) {
    empty_cv_.notify_all();
  }
  return true;
}

size_t CorrelationTable::close(const Failure &failure) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!closed_with_) {
    closed_with_ = failure;
  }

  const size_t n = pending_.size();
  for (auto &kv : pending_) {
    Failure f = failure;
    f.correlation_id = kv.first;
    kv.second.promise.set_value(std::move(f));
  }
  pending_.clear();
  empty_cv_.notify_all();
  return n;
}

bool CorrelationTable::is_pending(uint64_t correlation_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.find(correlation_id) != pending_.end();
}

size_t CorrelationTable::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

bool CorrelationTable::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_with_.has_value();
}

bool CorrelationTable::wait_empty(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return empty_cv_.wait_for(lock, timeout, [this] { return pending_.empty(); });
}

} // namespace nexsock_session
