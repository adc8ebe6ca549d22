#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace nexsock_protocol {

// Closed set of operations a controller can ask the daemon to perform.
// Adding one means extending OperationKind, the request/response variants
// and the codec; every std::visit over them must then be updated.
enum class OperationKind : uint8_t {
  ListServices,
  StartService,
  StopService,
  RestartService,
  GetStatus,
  SubscribeEvents
};

enum class ServiceState : uint8_t { Stopped, Starting, Running, Stopping, Failed };

struct ServiceStatus {
  std::string name;
  ServiceState state = ServiceState::Stopped;
  uint32_t pid = 0; // 0 when not running
  uint64_t uptime_ms = 0;
  uint32_t restart_count = 0;
  std::optional<int32_t> last_exit_code;
};

// -----------------------------
// Request payloads
// -----------------------------

struct ListServicesRequest {
  bool include_stopped = true;
};

struct StartServiceRequest {
  std::string name;
  std::vector<std::string> args;
  std::map<std::string, std::string> env;
};

struct StopServiceRequest {
  std::string name;
  bool force = false;
};

struct RestartServiceRequest {
  std::string name;
};

struct GetStatusRequest {
  std::string name;
};

struct SubscribeEventsRequest {
  std::vector<std::string> services; // empty = all services
};

using RequestBody =
    std::variant<ListServicesRequest, StartServiceRequest, StopServiceRequest,
                 RestartServiceRequest, GetStatusRequest,
                 SubscribeEventsRequest>;

// -----------------------------
// Response payloads
// -----------------------------

struct ListServicesResponse {
  std::vector<ServiceStatus> services;
};

struct StartServiceResponse {
  ServiceStatus status;
};

struct StopServiceResponse {
  ServiceStatus status;
};

struct RestartServiceResponse {
  ServiceStatus status;
};

struct GetStatusResponse {
  ServiceStatus status;
};

struct SubscribeEventsResponse {
  uint64_t subscription_id = 0;
};

enum class FailureCode : uint8_t {
  NotFound,
  AlreadyRunning,
  NotRunning,
  InvalidArgument,
  Unimplemented,
  Internal
};

// Failure payload shared by every operation.
struct FailurePayload {
  FailureCode code = FailureCode::Internal;
  std::string message;
};

using ResponseBody =
    std::variant<ListServicesResponse, StartServiceResponse,
                 StopServiceResponse, RestartServiceResponse,
                 GetStatusResponse, SubscribeEventsResponse, FailurePayload>;

// -----------------------------
// Event payloads
// -----------------------------

struct ServiceStateChanged {
  std::string name;
  ServiceState previous = ServiceState::Stopped;
  ServiceState current = ServiceState::Stopped;
  uint32_t pid = 0;
};

enum class OutputStream : uint8_t { Stdout, Stderr };

struct ServiceOutput {
  std::string name;
  OutputStream stream = OutputStream::Stdout;
  std::string line;
};

using EventBody = std::variant<ServiceStateChanged, ServiceOutput>;

// -----------------------------
// Messages
// -----------------------------

struct Request {
  uint64_t correlation_id = 0;
  RequestBody body;
};

struct Response {
  uint64_t correlation_id = 0;
  ResponseBody body;

  bool ok() const { return !std::holds_alternative<FailurePayload>(body); }
};

// Events are broadcast and carry no correlation id.
struct Event {
  EventBody body;
};

using Message = std::variant<Request, Response, Event>;

OperationKind operation_kind(const RequestBody &body);

// Empty for FailurePayload, which answers any operation.
std::optional<OperationKind> operation_kind(const ResponseBody &body);

const char *to_string(OperationKind kind);
const char *to_string(ServiceState state);
const char *to_string(FailureCode code);

bool operator==(const ServiceStatus &a, const ServiceStatus &b);
bool operator==(const ListServicesRequest &a, const ListServicesRequest &b);
bool operator==(const StartServiceRequest &a, const StartServiceRequest &b);
bool operator==(const StopServiceRequest &a, const StopServiceRequest &b);
bool operator==(const RestartServiceRequest &a, const RestartServiceRequest &b);
bool operator==(const GetStatusRequest &a, const GetStatusRequest &b);
bool operator==(const SubscribeEventsRequest &a,
                const SubscribeEventsRequest &b);
bool operator==(const ListServicesResponse &a, const ListServicesResponse &b);
bool operator==(const StartServiceResponse &a, const StartServiceResponse &b);
bool operator==(const StopServiceResponse &a, const StopServiceResponse &b);
bool operator==(const RestartServiceResponse &a,
                const RestartServiceResponse &b);
bool operator==(const GetStatusResponse &a, const GetStatusResponse &b);
bool operator==(const SubscribeEventsResponse &a,
                const SubscribeEventsResponse &b);
bool operator==(const FailurePayload &a, const FailurePayload &b);
bool operator==(const ServiceStateChanged &a, const ServiceStateChanged &b);
bool operator==(const ServiceOutput &a, const ServiceOutput &b);
bool operator==(const Request &a, const Request &b);
bool operator==(const Response &a, const Response &b);
bool operator==(const Event &a, const Event &b);

} // namespace nexsock_protocol
