// src/transport/framed_stream.cpp
#include "transport/framed_stream.hpp"

namespace nexsock_transport {

bool read_exact(Stream &in, uint8_t *buf, size_t n, std::string &err) {
  err.clear();
  size_t got = 0;
  while (got < n) {
    size_t r = 0;
    const ReadStatus st = in.read_some(buf + got, n - got, r, err);
    switch (st) {
    case ReadStatus::Ok:
      got += r;
      continue;
    case ReadStatus::Eof:
      return false;
    case ReadStatus::Interrupted:
      err = "read interrupted";
      return false;
    case ReadStatus::Error:
      return false;
    }
  }
  return true;
}

bool read_frame(Stream &in, std::vector<uint8_t> &out, std::string &err,
                uint32_t max_len) {
  err.clear();

  uint8_t hdr[kHeaderBytes] = {0, 0, 0, 0, 0};

  // Distinguish clean EOF (0 bytes) from a truncated header: read the first
  // byte on its own.
  if (!read_exact(in, hdr, 1, err)) {
    return false;
  }
  if (!read_exact(in, hdr + 1, kHeaderBytes - 1, err)) {
    if (err.empty()) {
      err = "unexpected EOF while reading frame header";
    }
    return false;
  }

  const HeaderResult h = parse_header(hdr, max_len);
  if (const auto *e = std::get_if<FrameError>(&h)) {
    err = std::string("bad frame header: ") + nexsock_protocol::to_string(*e);
    return false;
  }
  const FrameHeader &header = std::get<FrameHeader>(h);

  out.assign(1 + static_cast<size_t>(header.payload_len), 0);
  out[0] = header.tag;
  if (!read_exact(in, out.data() + 1, header.payload_len, err)) {
    if (err.empty()) {
      err = "unexpected EOF while reading frame payload";
    }
    return false;
  }

  return true;
}

bool write_frame(Stream &out, const std::vector<uint8_t> &encoded,
                 std::string &err, uint32_t max_len) {
  err.clear();

  FrameResult framed = frame(encoded, max_len);
  if (const auto *e = std::get_if<FrameError>(&framed)) {
    err = std::string("cannot frame message: ") +
          nexsock_protocol::to_string(*e);
    return false;
  }

  const auto &bytes = std::get<std::vector<uint8_t>>(framed);
  if (!out.write_all(bytes.data(), bytes.size(), err)) {
    err = "failed writing frame: " + err;
    return false;
  }
  return true;
}

} // namespace nexsock_transport
