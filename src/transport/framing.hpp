#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include "protocol/errors.hpp"

namespace nexsock_transport {

using nexsock_protocol::FrameError;

// Wire layout: [u32 payload length, big-endian][u8 version/format tag][payload]
// The length counts only the bytes after the 5-byte header.
constexpr size_t kHeaderBytes = 5;

// Default frame limit: 1 MiB
constexpr uint32_t kDefaultMaxFrameBytes = 1024u * 1024u;

struct FrameHeader {
  uint32_t payload_len = 0;
  uint8_t tag = 0;
};

using HeaderResult = std::variant<FrameHeader, FrameError>;
using FrameResult = std::variant<std::vector<uint8_t>, FrameError>;

// Parses kHeaderBytes bytes. Checks the declared length against max_len
// before anything is allocated for the payload.
HeaderResult parse_header(const uint8_t *hdr, uint32_t max_len);

// Frames codec output. The first byte of `encoded` is the version tag and
// goes into the header; the remainder is the payload.
FrameResult frame(const uint8_t *encoded, size_t len,
                  uint32_t max_len = kDefaultMaxFrameBytes);
FrameResult frame(const std::vector<uint8_t> &encoded,
                  uint32_t max_len = kDefaultMaxFrameBytes);

enum class DeframeStatus : uint8_t {
  NeedMore, // no complete frame buffered yet
  Frame,    // one frame written to `out`
  Error     // see error(); sticky until reset()
};

// Incremental frame reassembly for a byte stream with no message boundaries.
//
// feed() accepts chunks of any size; next() hands out one complete frame at
// a time as [tag][payload], i.e. exactly the bytes frame() was given.
// Partial frames stay buffered and are never an error.
//
// Thread safety: NOT thread-safe. Owned by the reader.
class Deframer {
public:
  explicit Deframer(uint32_t max_frame_bytes = kDefaultMaxFrameBytes);

  // Ignored once the deframer is in the error state.
  void feed(const uint8_t *data, size_t len);

  DeframeStatus next(std::vector<uint8_t> &out);

  std::optional<FrameError> error() const { return error_; }

  // Bytes fed but not yet handed out
  size_t buffered() const noexcept { return buffer_.size() - head_; }

  uint32_t max_frame_bytes() const noexcept { return max_frame_bytes_; }

  void reset();

private:
  void compact();

  uint32_t max_frame_bytes_;
  std::vector<uint8_t> buffer_;
  size_t head_ = 0;                   // start of the current frame in buffer_
  std::optional<FrameHeader> header_; // parsed header of the current frame
  std::optional<FrameError> error_;
};

} // namespace nexsock_transport
