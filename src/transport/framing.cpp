#include "transport/framing.hpp"

#include <algorithm>
#include <cstddef>
#include <iostream>

namespace nexsock_transport {

namespace {

// Buffer compaction threshold: don't shuffle small prefixes.
constexpr size_t kCompactMinBytes = 4096;

inline uint32_t decode_u32_be(const uint8_t b[4]) {
  return (static_cast<uint32_t>(b[0]) << 24) |
         (static_cast<uint32_t>(b[1]) << 16) |
         (static_cast<uint32_t>(b[2]) << 8) | (static_cast<uint32_t>(b[3]));
}

inline void encode_u32_be(uint32_t v, uint8_t b[4]) {
  b[0] = static_cast<uint8_t>((v >> 24) & 0xFF);
  b[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
  b[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
  b[3] = static_cast<uint8_t>(v & 0xFF);
}

} // namespace

HeaderResult parse_header(const uint8_t *hdr, uint32_t max_len) {
  FrameHeader h;
  h.payload_len = decode_u32_be(hdr);
  h.tag = hdr[4];

  // Tag 0 is never written: codec versions start at 1.
  if (h.tag == 0) {
    return FrameError::HeaderCorrupt;
  }
  if (h.payload_len > max_len) {
    return FrameError::FrameTooLarge;
  }
  return h;
}

FrameResult frame(const uint8_t *encoded, size_t len, uint32_t max_len) {
  if (len == 0 || encoded[0] == 0) {
    return FrameError::HeaderCorrupt;
  }

  const size_t payload_len = len - 1;
  if (payload_len > max_len) {
    return FrameError::FrameTooLarge;
  }

  std::vector<uint8_t> out(kHeaderBytes + payload_len);
  encode_u32_be(static_cast<uint32_t>(payload_len), out.data());
  out[4] = encoded[0];
  std::copy(encoded + 1, encoded + len, out.begin() + kHeaderBytes);
  return out;
}

FrameResult frame(const std::vector<uint8_t> &encoded, uint32_t max_len) {
  return frame(encoded.data(), encoded.size(), max_len);
}

// -----------------------------
// Deframer
// -----------------------------

Deframer::Deframer(uint32_t max_frame_bytes)
    : max_frame_bytes_(max_frame_bytes) {}

void Deframer::feed(const uint8_t *data, size_t len) {
  if (error_ || len == 0) {
    return;
  }
  buffer_.insert(buffer_.end(), data, data + len);
}

DeframeStatus Deframer::next(std::vector<uint8_t> &out) {
  if (error_) {
    return DeframeStatus::Error;
  }

  const size_t avail = buffer_.size() - head_;

  if (!header_) {
    if (avail < kHeaderBytes) {
      return DeframeStatus::NeedMore;
    }
    HeaderResult r = parse_header(buffer_.data() + head_, max_frame_bytes_);
    if (const auto *e = std::get_if<FrameError>(&r)) {
      error_ = *e;
      std::cerr << "[Deframer] rejecting frame header: "
                << nexsock_protocol::to_string(*e) << "\n";
      return DeframeStatus::Error;
    }
    header_ = std::get<FrameHeader>(r);
  }

  const size_t total = kHeaderBytes + static_cast<size_t>(header_->payload_len);
  if (avail < total) {
    return DeframeStatus::NeedMore;
  }

  const auto payload_begin =
      buffer_.begin() + static_cast<std::ptrdiff_t>(head_ + kHeaderBytes);
  out.clear();
  out.reserve(1 + header_->payload_len);
  out.push_back(header_->tag);
  out.insert(out.end(), payload_begin,
             payload_begin + static_cast<std::ptrdiff_t>(header_->payload_len));

  head_ += total;
  header_.reset();
  compact();
  return DeframeStatus::Frame;
}

void Deframer::reset() {
  buffer_.clear();
  head_ = 0;
  header_.reset();
  error_.reset();
}

void Deframer::compact() {
  if (head_ == buffer_.size()) {
    buffer_.clear();
    head_ = 0;
    return;
  }
  if (head_ >= kCompactMinBytes && head_ * 2 >= buffer_.size()) {
    buffer_.erase(buffer_.begin(),
                  buffer_.begin() + static_cast<std::ptrdiff_t>(head_));
    head_ = 0;
  }
}

} // namespace nexsock_transport
