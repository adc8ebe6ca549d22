#include "protocol/messages.hpp"

#include <tuple>
#include <type_traits>

namespace nexsock_protocol {

namespace {

template <class> inline constexpr bool kAlwaysFalse = false;

} // namespace

OperationKind operation_kind(const RequestBody &body) {
  return std::visit(
      [](const auto &req) -> OperationKind {
        using T = std::decay_t<decltype(req)>;
        if constexpr (std::is_same_v<T, ListServicesRequest>) {
          return OperationKind::ListServices;
        } else if constexpr (std::is_same_v<T, StartServiceRequest>) {
          return OperationKind::StartService;
        } else if constexpr (std::is_same_v<T, StopServiceRequest>) {
          return OperationKind::StopService;
        } else if constexpr (std::is_same_v<T, RestartServiceRequest>) {
          return OperationKind::RestartService;
        } else if constexpr (std::is_same_v<T, GetStatusRequest>) {
          return OperationKind::GetStatus;
        } else if constexpr (std::is_same_v<T, SubscribeEventsRequest>) {
          return OperationKind::SubscribeEvents;
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled request payload");
        }
      },
      body);
}

std::optional<OperationKind> operation_kind(const ResponseBody &body) {
  return std::visit(
      [](const auto &resp) -> std::optional<OperationKind> {
        using T = std::decay_t<decltype(resp)>;
        if constexpr (std::is_same_v<T, ListServicesResponse>) {
          return OperationKind::ListServices;
        } else if constexpr (std::is_same_v<T, StartServiceResponse>) {
          return OperationKind::StartService;
        } else if constexpr (std::is_same_v<T, StopServiceResponse>) {
          return OperationKind::StopService;
        } else if constexpr (std::is_same_v<T, RestartServiceResponse>) {
          return OperationKind::RestartService;
        } else if constexpr (std::is_same_v<T, GetStatusResponse>) {
          return OperationKind::GetStatus;
        } else if constexpr (std::is_same_v<T, SubscribeEventsResponse>) {
          return OperationKind::SubscribeEvents;
        } else if constexpr (std::is_same_v<T, FailurePayload>) {
          return std::nullopt;
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled response payload");
        }
      },
      body);
}

const char *to_string(OperationKind kind) {
  switch (kind) {
  case OperationKind::ListServices:
    return "list-services";
  case OperationKind::StartService:
    return "start-service";
  case OperationKind::StopService:
    return "stop-service";
  case OperationKind::RestartService:
    return "restart-service";
  case OperationKind::GetStatus:
    return "get-status";
  case OperationKind::SubscribeEvents:
    return "subscribe-events";
  }
  return "unknown-operation";
}

const char *to_string(ServiceState state) {
  switch (state) {
  case ServiceState::Stopped:
    return "stopped";
  case ServiceState::Starting:
    return "starting";
  case ServiceState::Running:
    return "running";
  case ServiceState::Stopping:
    return "stopping";
  case ServiceState::Failed:
    return "failed";
  }
  return "unknown";
}

const char *to_string(FailureCode code) {
  switch (code) {
  case FailureCode::NotFound:
    return "NOT_FOUND";
  case FailureCode::AlreadyRunning:
    return "ALREADY_RUNNING";
  case FailureCode::NotRunning:
    return "NOT_RUNNING";
  case FailureCode::InvalidArgument:
    return "INVALID_ARGUMENT";
  case FailureCode::Unimplemented:
    return "UNIMPLEMENTED";
  case FailureCode::Internal:
    return "INTERNAL";
  }
  return "UNKNOWN";
}

// -----------------------------
// Equality
// -----------------------------

bool operator==(const ServiceStatus &a, const ServiceStatus &b) {
  return std::tie(a.name, a.state, a.pid, a.uptime_ms, a.restart_count,
                  a.last_exit_code) == std::tie(b.name, b.state, b.pid,
                                                b.uptime_ms, b.restart_count,
                                                b.last_exit_code);
}

bool operator==(const ListServicesRequest &a, const ListServicesRequest &b) {
  return a.include_stopped == b.include_stopped;
}

bool operator==(const StartServiceRequest &a, const StartServiceRequest &b) {
  return std::tie(a.name, a.args, a.env) == std::tie(b.name, b.args, b.env);
}

bool operator==(const StopServiceRequest &a, const StopServiceRequest &b) {
  return std::tie(a.name, a.force) == std::tie(b.name, b.force);
}

bool operator==(const RestartServiceRequest &a,
                const RestartServiceRequest &b) {
  return a.name == b.name;
}

bool operator==(const GetStatusRequest &a, const GetStatusRequest &b) {
  return a.name == b.name;
}

bool operator==(const SubscribeEventsRequest &a,
                const SubscribeEventsRequest &b) {
  return a.services == b.services;
}

bool operator==(const ListServicesResponse &a, const ListServicesResponse &b) {
  return a.services == b.services;
}

bool operator==(const StartServiceResponse &a, const StartServiceResponse &b) {
  return a.status == b.status;
}

bool operator==(const StopServiceResponse &a, const StopServiceResponse &b) {
  return a.status == b.status;
}

bool operator==(const RestartServiceResponse &a,
                const RestartServiceResponse &b) {
  return a.status == b.status;
}

bool operator==(const GetStatusResponse &a, const GetStatusResponse &b) {
  return a.status == b.status;
}

bool operator==(const SubscribeEventsResponse &a,
                const SubscribeEventsResponse &b) {
  return a.subscription_id == b.subscription_id;
}

bool operator==(const FailurePayload &a, const FailurePayload &b) {
  return std::tie(a.code, a.message) == std::tie(b.code, b.message);
}

bool operator==(const ServiceStateChanged &a, const ServiceStateChanged &b) {
  return std::tie(a.name, a.previous, a.current, a.pid) ==
         std::tie(b.name, b.previous, b.current, b.pid);
}

bool operator==(const ServiceOutput &a, const ServiceOutput &b) {
  return std::tie(a.name, a.stream, a.line) ==
         std::tie(b.name, b.stream, b.line);
}

bool operator==(const Request &a, const Request &b) {
  return a.correlation_id == b.correlation_id && a.body == b.body;
}

bool operator==(const Response &a, const Response &b) {
  return a.correlation_id == b.correlation_id && a.body == b.body;
}

bool operator==(const Event &a, const Event &b) { return a.body == b.body; }

} // namespace nexsock_protocol
