#include "protocol/codec.hpp"

#include <climits>
#include <type_traits>

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/unknown_field_set.h>

#include "nexsock_protocol.pb.h"

namespace nexsock_protocol {

namespace pb = nexsock::protocol::v1;

namespace {

template <class> inline constexpr bool kAlwaysFalse = false;

// -----------------------------
// Enum mapping
// -----------------------------

pb::ServiceStatus::State to_pb(ServiceState s) {
  switch (s) {
  case ServiceState::Stopped:
    return pb::ServiceStatus::STATE_STOPPED;
  case ServiceState::Starting:
    return pb::ServiceStatus::STATE_STARTING;
  case ServiceState::Running:
    return pb::ServiceStatus::STATE_RUNNING;
  case ServiceState::Stopping:
    return pb::ServiceStatus::STATE_STOPPING;
  case ServiceState::Failed:
    return pb::ServiceStatus::STATE_FAILED;
  }
  return pb::ServiceStatus::STATE_UNSPECIFIED;
}

bool from_pb(pb::ServiceStatus::State s, ServiceState &out) {
  switch (s) {
  case pb::ServiceStatus::STATE_STOPPED:
    out = ServiceState::Stopped;
    return true;
  case pb::ServiceStatus::STATE_STARTING:
    out = ServiceState::Starting;
    return true;
  case pb::ServiceStatus::STATE_RUNNING:
    out = ServiceState::Running;
    return true;
  case pb::ServiceStatus::STATE_STOPPING:
    out = ServiceState::Stopping;
    return true;
  case pb::ServiceStatus::STATE_FAILED:
    out = ServiceState::Failed;
    return true;
  default:
    // STATE_UNSPECIFIED or a value from a newer peer
    return false;
  }
}

pb::Failure::Code to_pb(FailureCode c) {
  switch (c) {
  case FailureCode::NotFound:
    return pb::Failure::CODE_NOT_FOUND;
  case FailureCode::AlreadyRunning:
    return pb::Failure::CODE_ALREADY_RUNNING;
  case FailureCode::NotRunning:
    return pb::Failure::CODE_NOT_RUNNING;
  case FailureCode::InvalidArgument:
    return pb::Failure::CODE_INVALID_ARGUMENT;
  case FailureCode::Unimplemented:
    return pb::Failure::CODE_UNIMPLEMENTED;
  case FailureCode::Internal:
    return pb::Failure::CODE_INTERNAL;
  }
  return pb::Failure::CODE_UNSPECIFIED;
}

bool from_pb(pb::Failure::Code c, FailureCode &out) {
  switch (c) {
  case pb::Failure::CODE_NOT_FOUND:
    out = FailureCode::NotFound;
    return true;
  case pb::Failure::CODE_ALREADY_RUNNING:
    out = FailureCode::AlreadyRunning;
    return true;
  case pb::Failure::CODE_NOT_RUNNING:
    out = FailureCode::NotRunning;
    return true;
  case pb::Failure::CODE_INVALID_ARGUMENT:
    out = FailureCode::InvalidArgument;
    return true;
  case pb::Failure::CODE_UNIMPLEMENTED:
    out = FailureCode::Unimplemented;
    return true;
  case pb::Failure::CODE_INTERNAL:
    out = FailureCode::Internal;
    return true;
  default:
    return false;
  }
}

pb::ServiceOutput::Stream to_pb(OutputStream s) {
  switch (s) {
  case OutputStream::Stdout:
    return pb::ServiceOutput::STREAM_STDOUT;
  case OutputStream::Stderr:
    return pb::ServiceOutput::STREAM_STDERR;
  }
  return pb::ServiceOutput::STREAM_UNSPECIFIED;
}

bool from_pb(pb::ServiceOutput::Stream s, OutputStream &out) {
  switch (s) {
  case pb::ServiceOutput::STREAM_STDOUT:
    out = OutputStream::Stdout;
    return true;
  case pb::ServiceOutput::STREAM_STDERR:
    out = OutputStream::Stderr;
    return true;
  default:
    return false;
  }
}

// -----------------------------
// Message -> protobuf
// -----------------------------

void fill_status(const ServiceStatus &s, pb::ServiceStatus *out) {
  out->set_name(s.name);
  out->set_state(to_pb(s.state));
  out->set_pid(s.pid);
  out->set_uptime_ms(s.uptime_ms);
  out->set_restart_count(s.restart_count);
  if (s.last_exit_code) {
    out->set_last_exit_code(*s.last_exit_code);
  }
}

void fill_request(const RequestBody &body, pb::Request *out) {
  std::visit(
      [out](const auto &req) {
        using T = std::decay_t<decltype(req)>;
        if constexpr (std::is_same_v<T, ListServicesRequest>) {
          out->mutable_list_services()->set_include_stopped(
              req.include_stopped);
        } else if constexpr (std::is_same_v<T, StartServiceRequest>) {
          auto *m = out->mutable_start_service();
          m->set_name(req.name);
          for (const auto &a : req.args) {
            m->add_args(a);
          }
          for (const auto &kv : req.env) {
            (*m->mutable_env())[kv.first] = kv.second;
          }
        } else if constexpr (std::is_same_v<T, StopServiceRequest>) {
          auto *m = out->mutable_stop_service();
          m->set_name(req.name);
          m->set_force(req.force);
        } else if constexpr (std::is_same_v<T, RestartServiceRequest>) {
          out->mutable_restart_service()->set_name(req.name);
        } else if constexpr (std::is_same_v<T, GetStatusRequest>) {
          out->mutable_get_status()->set_name(req.name);
        } else if constexpr (std::is_same_v<T, SubscribeEventsRequest>) {
          auto *m = out->mutable_subscribe_events();
          for (const auto &s : req.services) {
            m->add_services(s);
          }
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled request payload");
        }
      },
      body);
}

void fill_response(const ResponseBody &body, pb::Response *out) {
  std::visit(
      [out](const auto &resp) {
        using T = std::decay_t<decltype(resp)>;
        if constexpr (std::is_same_v<T, ListServicesResponse>) {
          auto *m = out->mutable_list_services();
          for (const auto &s : resp.services) {
            fill_status(s, m->add_services());
          }
        } else if constexpr (std::is_same_v<T, StartServiceResponse>) {
          fill_status(resp.status, out->mutable_start_service()->mutable_status());
        } else if constexpr (std::is_same_v<T, StopServiceResponse>) {
          fill_status(resp.status, out->mutable_stop_service()->mutable_status());
        } else if constexpr (std::is_same_v<T, RestartServiceResponse>) {
          fill_status(resp.status,
                      out->mutable_restart_service()->mutable_status());
        } else if constexpr (std::is_same_v<T, GetStatusResponse>) {
          fill_status(resp.status, out->mutable_get_status()->mutable_status());
        } else if constexpr (std::is_same_v<T, SubscribeEventsResponse>) {
          out->mutable_subscribe_events()->set_subscription_id(
              resp.subscription_id);
        } else if constexpr (std::is_same_v<T, FailurePayload>) {
          auto *m = out->mutable_failure();
          m->set_code(to_pb(resp.code));
          m->set_message(resp.message);
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled response payload");
        }
      },
      body);
}

void fill_event(const EventBody &body, pb::Event *out) {
  std::visit(
      [out](const auto &ev) {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, ServiceStateChanged>) {
          auto *m = out->mutable_state_changed();
          m->set_name(ev.name);
          m->set_previous(to_pb(ev.previous));
          m->set_current(to_pb(ev.current));
          m->set_pid(ev.pid);
        } else if constexpr (std::is_same_v<T, ServiceOutput>) {
          auto *m = out->mutable_output();
          m->set_name(ev.name);
          m->set_stream(to_pb(ev.stream));
          m->set_line(ev.line);
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled event payload");
        }
      },
      body);
}

// -----------------------------
// protobuf -> Message
// -----------------------------

bool from_pb(const pb::ServiceStatus &in, ServiceStatus &out) {
  if (!from_pb(in.state(), out.state)) {
    return false;
  }
  out.name = in.name();
  out.pid = in.pid();
  out.uptime_ms = in.uptime_ms();
  out.restart_count = in.restart_count();
  if (in.has_last_exit_code()) {
    out.last_exit_code = in.last_exit_code();
  }
  return true;
}

template <class T>
bool status_response_from_pb(const pb::ServiceStatusResponse &in,
                             ResponseBody &out) {
  if (!in.has_status()) {
    return false;
  }
  T resp;
  if (!from_pb(in.status(), resp.status)) {
    return false;
  }
  out = std::move(resp);
  return true;
}

bool from_pb(const pb::Request &in, RequestBody &out) {
  switch (in.payload_case()) {
  case pb::Request::kListServices:
    out = ListServicesRequest{in.list_services().include_stopped()};
    return true;
  case pb::Request::kStartService: {
    StartServiceRequest req;
    req.name = in.start_service().name();
    req.args.assign(in.start_service().args().begin(),
                    in.start_service().args().end());
    for (const auto &kv : in.start_service().env()) {
      req.env.emplace(kv.first, kv.second);
    }
    out = std::move(req);
    return true;
  }
  case pb::Request::kStopService:
    out = StopServiceRequest{in.stop_service().name(),
                             in.stop_service().force()};
    return true;
  case pb::Request::kRestartService:
    out = RestartServiceRequest{in.restart_service().name()};
    return true;
  case pb::Request::kGetStatus:
    out = GetStatusRequest{in.get_status().name()};
    return true;
  case pb::Request::kSubscribeEvents: {
    SubscribeEventsRequest req;
    req.services.assign(in.subscribe_events().services().begin(),
                        in.subscribe_events().services().end());
    out = std::move(req);
    return true;
  }
  case pb::Request::PAYLOAD_NOT_SET:
    break;
  }
  return false;
}

bool from_pb(const pb::Response &in, ResponseBody &out) {
  switch (in.payload_case()) {
  case pb::Response::kListServices: {
    ListServicesResponse resp;
    resp.services.reserve(
        static_cast<size_t>(in.list_services().services_size()));
    for (const auto &s : in.list_services().services()) {
      ServiceStatus status;
      if (!from_pb(s, status)) {
        return false;
      }
      resp.services.push_back(std::move(status));
    }
    out = std::move(resp);
    return true;
  }
  case pb::Response::kStartService:
    return status_response_from_pb<StartServiceResponse>(in.start_service(),
                                                         out);
  case pb::Response::kStopService:
    return status_response_from_pb<StopServiceResponse>(in.stop_service(),
                                                        out);
  case pb::Response::kRestartService:
    return status_response_from_pb<RestartServiceResponse>(
        in.restart_service(), out);
  case pb::Response::kGetStatus:
    return status_response_from_pb<GetStatusResponse>(in.get_status(), out);
  case pb::Response::kSubscribeEvents:
    out = SubscribeEventsResponse{in.subscribe_events().subscription_id()};
    return true;
  case pb::Response::kFailure: {
    FailurePayload f;
    if (!from_pb(in.failure().code(), f.code)) {
      return false;
    }
    f.message = in.failure().message();
    out = std::move(f);
    return true;
  }
  case pb::Response::PAYLOAD_NOT_SET:
    break;
  }
  return false;
}

bool from_pb(const pb::Event &in, EventBody &out) {
  switch (in.payload_case()) {
  case pb::Event::kStateChanged: {
    ServiceStateChanged ev;
    const auto &m = in.state_changed();
    if (!from_pb(m.previous(), ev.previous) ||
        !from_pb(m.current(), ev.current)) {
      return false;
    }
    ev.name = m.name();
    ev.pid = m.pid();
    out = std::move(ev);
    return true;
  }
  case pb::Event::kOutput: {
    ServiceOutput ev;
    const auto &m = in.output();
    if (!from_pb(m.stream(), ev.stream)) {
      return false;
    }
    ev.name = m.name();
    ev.line = m.line();
    out = std::move(ev);
    return true;
  }
  case pb::Event::PAYLOAD_NOT_SET:
    break;
  }
  return false;
}

DecodeResult from_envelope(const pb::Envelope &env) {
  switch (env.kind_case()) {
  case pb::Envelope::kRequest: {
    Request req;
    req.correlation_id = env.correlation_id();
    if (req.correlation_id == 0 || !from_pb(env.request(), req.body)) {
      return DecodeError::Malformed;
    }
    return Message{std::move(req)};
  }
  case pb::Envelope::kResponse: {
    Response resp;
    resp.correlation_id = env.correlation_id();
    if (resp.correlation_id == 0 || !from_pb(env.response(), resp.body)) {
      return DecodeError::Malformed;
    }
    return Message{std::move(resp)};
  }
  case pb::Envelope::kEvent: {
    Event ev;
    if (env.correlation_id() != 0 || !from_pb(env.event(), ev.body)) {
      return DecodeError::Malformed;
    }
    return Message{std::move(ev)};
  }
  case pb::Envelope::KIND_NOT_SET:
    // encode() always writes the kind after correlation_id. Without it and
    // without foreign fields, the input stopped at a field boundary.
    if (env.GetReflection()->GetUnknownFields(env).empty()) {
      return DecodeError::Truncated;
    }
    break;
  }
  return DecodeError::Malformed;
}

// protobuf reports a single failure for every kind of bad input. Walk the
// top-level wire structure to tell a short read apart from garbage.
DecodeError classify_parse_failure(const uint8_t *data, size_t len) {
  google::protobuf::io::CodedInputStream in(data, static_cast<int>(len));
  const auto at_end = [&in, len]() {
    return static_cast<size_t>(in.CurrentPosition()) >= len;
  };

  while (true) {
    if (at_end()) {
      // Every declared field is present; the content itself is invalid.
      return DecodeError::Malformed;
    }
    const size_t tag_pos = static_cast<size_t>(in.CurrentPosition());
    const uint32_t tag = in.ReadTag();
    if (tag == 0) {
      // A literal zero tag is garbage; a cut tag varint is a short read.
      if (data[tag_pos] == 0 || !at_end()) {
        return DecodeError::Malformed;
      }
      return DecodeError::Truncated;
    }
    if ((tag >> 3) == 0) {
      return DecodeError::Malformed;
    }

    switch (tag & 0x7u) {
    case 0: { // varint
      uint64_t v = 0;
      if (!in.ReadVarint64(&v)) {
        return at_end() ? DecodeError::Truncated : DecodeError::Malformed;
      }
      break;
    }
    case 1: { // fixed64
      uint64_t v = 0;
      if (!in.ReadLittleEndian64(&v)) {
        return DecodeError::Truncated;
      }
      break;
    }
    case 2: { // length-delimited
      uint32_t n = 0;
      if (!in.ReadVarint32(&n)) {
        return at_end() ? DecodeError::Truncated : DecodeError::Malformed;
      }
      if (n > static_cast<uint32_t>(INT_MAX) ||
          !in.Skip(static_cast<int>(n))) {
        return DecodeError::Truncated;
      }
      break;
    }
    case 5: { // fixed32
      uint32_t v = 0;
      if (!in.ReadLittleEndian32(&v)) {
        return DecodeError::Truncated;
      }
      break;
    }
    default: // groups and reserved wire types are never produced by encode()
      return DecodeError::Malformed;
    }
  }
}

} // namespace

std::vector<uint8_t> encode(const Message &msg) {
  pb::Envelope env;
  std::visit(
      [&env](const auto &m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Request>) {
          env.set_correlation_id(m.correlation_id);
          fill_request(m.body, env.mutable_request());
        } else if constexpr (std::is_same_v<T, Response>) {
          env.set_correlation_id(m.correlation_id);
          fill_response(m.body, env.mutable_response());
        } else if constexpr (std::is_same_v<T, Event>) {
          fill_event(m.body, env.mutable_event());
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled message kind");
        }
      },
      msg);

  const size_t body_len = env.ByteSizeLong();
  std::vector<uint8_t> out(1 + body_len);
  out[0] = kCodecVersion;
  {
    google::protobuf::io::ArrayOutputStream array_out(
        out.data() + 1, static_cast<int>(body_len));
    google::protobuf::io::CodedOutputStream coded_out(&array_out);
    // Map entries (StartServiceRequest.env) are otherwise unordered.
    coded_out.SetSerializationDeterministic(true);
    env.SerializeWithCachedSizes(&coded_out);
  }
  return out;
}

DecodeResult decode(const uint8_t *data, size_t len) {
  if (len == 0) {
    return DecodeError::Truncated;
  }

  const uint8_t version = data[0];
  if (version == 0) {
    return DecodeError::Malformed;
  }
  if (version > kCodecVersion) {
    return DecodeError::UnsupportedVersion;
  }

  const uint8_t *body = data + 1;
  const size_t body_len = len - 1;
  if (body_len > static_cast<size_t>(INT_MAX)) {
    return DecodeError::Malformed;
  }

  pb::Envelope env;
  if (!env.ParseFromArray(body, static_cast<int>(body_len))) {
    return classify_parse_failure(body, body_len);
  }
  return from_envelope(env);
}

DecodeResult decode(const std::vector<uint8_t> &bytes) {
  return decode(bytes.data(), bytes.size());
}

} // namespace nexsock_protocol
