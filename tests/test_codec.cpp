#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "nexsock_protocol.pb.h"
#include "protocol/codec.hpp"

using namespace nexsock_protocol;
namespace pb = nexsock::protocol::v1;

namespace {

std::vector<uint8_t> envelope_bytes(const pb::Envelope &env,
                                    uint8_t version = kCodecVersion) {
  const std::string body = env.SerializeAsString();
  std::vector<uint8_t> out;
  out.push_back(version);
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

DecodeError decode_error(const std::vector<uint8_t> &bytes) {
  DecodeResult r = decode(bytes);
  EXPECT_TRUE(std::holds_alternative<DecodeError>(r));
  if (const auto *e = std::get_if<DecodeError>(&r)) {
    return *e;
  }
  return DecodeError::Malformed;
}

Message roundtrip(const Message &m) {
  DecodeResult r = decode(encode(m));
  EXPECT_TRUE(std::holds_alternative<Message>(r));
  return std::get<Message>(r);
}

ServiceStatus running_web() {
  ServiceStatus s;
  s.name = "web";
  s.state = ServiceState::Running;
  s.pid = 4242;
  s.uptime_ms = 120000;
  s.restart_count = 2;
  s.last_exit_code = 137;
  return s;
}

} // namespace

TEST(Codec, VersionByteLeads) {
  const auto bytes = encode(Request{1, ListServicesRequest{}});
  ASSERT_FALSE(bytes.empty());
  EXPECT_EQ(bytes[0], kCodecVersion);
}

TEST(Codec, RequestsRoundTrip) {
  StartServiceRequest start;
  start.name = "web";
  start.args = {"--port", "8080"};
  start.env = {{"RUST_LOG", "debug"}, {"HOME", "/srv/web"}};

  const std::vector<Message> messages = {
      Request{1, ListServicesRequest{false}},
      Request{7, start},
      Request{8, StopServiceRequest{"web", true}},
      Request{9, RestartServiceRequest{"db"}},
      Request{10, GetStatusRequest{"cache"}},
      Request{11, SubscribeEventsRequest{{"web", "db"}}},
      Request{~0ull, SubscribeEventsRequest{}},
  };

  for (const auto &m : messages) {
    EXPECT_TRUE(roundtrip(m) == m);
  }
}

TEST(Codec, ResponsesRoundTrip) {
  ServiceStatus stopped;
  stopped.name = "db";

  const std::vector<Message> messages = {
      Response{7, StartServiceResponse{running_web()}},
      Response{3, ListServicesResponse{{running_web(), stopped}}},
      Response{4, ListServicesResponse{}},
      Response{5, StopServiceResponse{stopped}},
      Response{6, RestartServiceResponse{running_web()}},
      Response{12, GetStatusResponse{stopped}},
      Response{13, SubscribeEventsResponse{99}},
      Response{14, FailurePayload{FailureCode::NotFound, "no service 'x'"}},
  };

  for (const auto &m : messages) {
    EXPECT_TRUE(roundtrip(m) == m);
  }
}

TEST(Codec, EventsRoundTrip) {
  const std::vector<Message> messages = {
      Event{ServiceStateChanged{"web", ServiceState::Starting,
                                ServiceState::Running, 4242}},
      Event{ServiceOutput{"web", OutputStream::Stderr, "listening on :8080"}},
  };

  for (const auto &m : messages) {
    EXPECT_TRUE(roundtrip(m) == m);
  }
}

TEST(Codec, LastExitCodeAbsentVersusZero) {
  ServiceStatus absent;
  absent.name = "a";
  ServiceStatus zero = absent;
  zero.last_exit_code = 0;

  const Message a = Response{1, GetStatusResponse{absent}};
  const Message z = Response{2, GetStatusResponse{zero}};

  const Response ra = std::get<Response>(roundtrip(a));
  const Response rz = std::get<Response>(roundtrip(z));
  EXPECT_FALSE(std::get<GetStatusResponse>(ra.body).status.last_exit_code);
  ASSERT_TRUE(std::get<GetStatusResponse>(rz.body).status.last_exit_code);
  EXPECT_EQ(*std::get<GetStatusResponse>(rz.body).status.last_exit_code, 0);
}

TEST(Codec, FailurePayloadIsNotOk) {
  const Message m = Response{3, FailurePayload{FailureCode::AlreadyRunning,
                                               "web is already running"}};
  const auto r = std::get<Response>(roundtrip(m));
  EXPECT_FALSE(r.ok());
  EXPECT_EQ(r.correlation_id, 3u);
}

TEST(Codec, EncodingIsDeterministic) {
  StartServiceRequest a;
  a.name = "web";
  a.env = {{"B", "2"}, {"A", "1"}, {"C", "3"}};
  StartServiceRequest b;
  b.name = "web";
  b.env["C"] = "3";
  b.env["A"] = "1";
  b.env["B"] = "2";

  EXPECT_EQ(encode(Request{5, a}), encode(Request{5, b}));
}

TEST(Codec, EmptyInputIsTruncated) {
  EXPECT_EQ(decode_error({}), DecodeError::Truncated);
}

TEST(Codec, VersionZeroIsMalformed) {
  auto bytes = encode(Request{1, ListServicesRequest{}});
  bytes[0] = 0;
  EXPECT_EQ(decode_error(bytes), DecodeError::Malformed);
}

TEST(Codec, NewerVersionIsUnsupported) {
  auto bytes = encode(Request{1, ListServicesRequest{}});
  bytes[0] = kCodecVersion + 1;
  EXPECT_EQ(decode_error(bytes), DecodeError::UnsupportedVersion);
}

TEST(Codec, CutShortIsTruncated) {
  StartServiceRequest start;
  start.name = "a-service-with-a-long-name";
  start.args = {"--verbose"};
  const auto full = encode(Request{7, start});

  for (size_t cut : {size_t{1}, size_t{3}, size_t{10}}) {
    std::vector<uint8_t> bytes(full.begin(), full.end() - cut);
    EXPECT_EQ(decode_error(bytes), DecodeError::Truncated) << "cut " << cut;
  }
}

TEST(Codec, InvalidWireTypeIsMalformed) {
  // field 1 with wire type 7, which does not exist
  const std::vector<uint8_t> bytes = {kCodecVersion, 0x0F, 0x01};
  EXPECT_EQ(decode_error(bytes), DecodeError::Malformed);
}

TEST(Codec, VersionByteAloneIsTruncated) {
  EXPECT_EQ(decode_error({kCodecVersion}), DecodeError::Truncated);
}

TEST(Codec, CutAfterCorrelationIdIsTruncated) {
  const auto full = encode(Request{5, GetStatusRequest{"web"}});
  // version byte, then field 1 tag and the one-byte varint 5
  const std::vector<uint8_t> bytes(full.begin(), full.begin() + 3);
  ASSERT_EQ(bytes[1], 0x08);
  EXPECT_EQ(decode_error(bytes), DecodeError::Truncated);

  pb::Envelope env;
  env.set_correlation_id(5);
  EXPECT_EQ(decode_error(envelope_bytes(env)), DecodeError::Truncated);
}

TEST(Codec, EnvelopeWithOnlyForeignFieldsIsMalformed) {
  // field 15, varint 1: parses, but carries nothing this codec knows
  const std::vector<uint8_t> bytes = {kCodecVersion, 0x78, 0x01};
  EXPECT_EQ(decode_error(bytes), DecodeError::Malformed);
}

TEST(Codec, RequestWithoutCorrelationIsMalformed) {
  pb::Envelope env;
  env.mutable_request()->mutable_get_status()->set_name("web");
  EXPECT_EQ(decode_error(envelope_bytes(env)), DecodeError::Malformed);
}

TEST(Codec, EventWithCorrelationIsMalformed) {
  pb::Envelope env;
  env.set_correlation_id(3);
  env.mutable_event()->mutable_output()->set_name("web");
  env.mutable_event()->mutable_output()->set_stream(
      pb::ServiceOutput::STREAM_STDOUT);
  EXPECT_EQ(decode_error(envelope_bytes(env)), DecodeError::Malformed);
}

TEST(Codec, EmptyRequestPayloadIsMalformed) {
  pb::Envelope env;
  env.set_correlation_id(2);
  env.mutable_request();
  EXPECT_EQ(decode_error(envelope_bytes(env)), DecodeError::Malformed);
}

TEST(Codec, UnknownStateIsMalformed) {
  pb::Envelope env;
  env.set_correlation_id(4);
  auto *status = env.mutable_response()->mutable_get_status()->mutable_status();
  status->set_name("web");
  status->set_state(static_cast<pb::ServiceStatus::State>(42));
  EXPECT_EQ(decode_error(envelope_bytes(env)), DecodeError::Malformed);
}

TEST(Codec, UnspecifiedFailureCodeIsMalformed) {
  pb::Envelope env;
  env.set_correlation_id(4);
  env.mutable_response()->mutable_failure()->set_message("?");
  EXPECT_EQ(decode_error(envelope_bytes(env)), DecodeError::Malformed);
}

TEST(Messages, OperationKindOfPayloads) {
  EXPECT_EQ(operation_kind(RequestBody{StartServiceRequest{}}),
            OperationKind::StartService);
  EXPECT_EQ(operation_kind(RequestBody{SubscribeEventsRequest{}}),
            OperationKind::SubscribeEvents);

  const auto kind = operation_kind(ResponseBody{StopServiceResponse{}});
  ASSERT_TRUE(kind.has_value());
  EXPECT_EQ(*kind, OperationKind::StopService);
  EXPECT_FALSE(operation_kind(ResponseBody{FailurePayload{}}).has_value());

  EXPECT_STREQ(to_string(OperationKind::StartService), "start-service");
  EXPECT_STREQ(to_string(ServiceState::Running), "running");
  EXPECT_STREQ(to_string(FailureCode::NotFound), "NOT_FOUND");
}
