#include <gtest/gtest.h>

#include "protocol/errors.hpp"

using namespace nexsock_protocol;

TEST(Errors, NamesAreStable) {
  EXPECT_STREQ(to_string(DecodeError::Malformed), "Malformed");
  EXPECT_STREQ(to_string(DecodeError::Truncated), "Truncated");
  EXPECT_STREQ(to_string(DecodeError::UnsupportedVersion), "UnsupportedVersion");
  EXPECT_STREQ(to_string(FrameError::FrameTooLarge), "FrameTooLarge");
  EXPECT_STREQ(to_string(FrameError::HeaderCorrupt), "HeaderCorrupt");
  EXPECT_STREQ(to_string(SessionError::Timeout), "Timeout");
  EXPECT_STREQ(to_string(SessionError::ConnectionClosed), "ConnectionClosed");
  EXPECT_STREQ(to_string(SessionError::ProtocolViolation), "ProtocolViolation");
  EXPECT_STREQ(to_string(SessionError::NoMatchingRequest), "NoMatchingRequest");
  EXPECT_STREQ(to_string(SessionError::Cancelled), "Cancelled");
}

TEST(Errors, FailureCarriesCorrelationAndCause) {
  Failure f = make_failure(SessionError::ProtocolViolation, 42, "bad frame");
  f.cause = FrameError::HeaderCorrupt;

  EXPECT_TRUE(f.is(SessionError::ProtocolViolation));
  EXPECT_FALSE(f.is(SessionError::Timeout));
  EXPECT_FALSE(f.is(FrameError::HeaderCorrupt));
  ASSERT_TRUE(f.correlation_id.has_value());
  EXPECT_EQ(*f.correlation_id, 42u);

  const std::string text = to_string(f);
  EXPECT_NE(text.find("ProtocolViolation"), std::string::npos);
  EXPECT_NE(text.find("correlation_id=42"), std::string::npos);
  EXPECT_NE(text.find("HeaderCorrupt"), std::string::npos);
  EXPECT_NE(text.find("bad frame"), std::string::npos);
}

TEST(Errors, FailureWithoutCorrelation) {
  const Failure f = make_failure(DecodeError::Truncated);
  EXPECT_TRUE(f.is(DecodeError::Truncated));
  EXPECT_FALSE(f.correlation_id.has_value());
  EXPECT_EQ(to_string(f), "Truncated");
}

TEST(Errors, FatalClassification) {
  EXPECT_TRUE(is_fatal(DecodeError::Malformed));
  EXPECT_TRUE(is_fatal(DecodeError::UnsupportedVersion));
  EXPECT_TRUE(is_fatal(FrameError::HeaderCorrupt));
  EXPECT_TRUE(is_fatal(FrameError::FrameTooLarge));
  EXPECT_TRUE(is_fatal(SessionError::ProtocolViolation));

  EXPECT_FALSE(is_fatal(SessionError::Timeout));
  EXPECT_FALSE(is_fatal(SessionError::NoMatchingRequest));
  EXPECT_FALSE(is_fatal(SessionError::Cancelled));
  EXPECT_FALSE(is_fatal(SessionError::ConnectionClosed));
}

TEST(Errors, RetryableClassification) {
  EXPECT_TRUE(is_retryable(SessionError::Timeout));
  EXPECT_TRUE(is_retryable(SessionError::ConnectionClosed));

  EXPECT_FALSE(is_retryable(SessionError::ProtocolViolation));
  EXPECT_FALSE(is_retryable(SessionError::Cancelled));
  EXPECT_FALSE(is_retryable(DecodeError::Malformed));
  EXPECT_FALSE(is_retryable(FrameError::FrameTooLarge));
}
