// src/transport/framed_stream.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "transport/framing.hpp"
#include "transport/stream.hpp"

namespace nexsock_transport {

// Blocking one-frame-at-a-time helpers for callers that don't run a Session
// (diagnostic tools, tests, simple request/response clients).

// Reads exactly n bytes into buf. Returns false on EOF or stream failure
// before n bytes; err is set unless the stream hit a clean EOF.
bool read_exact(Stream &in, uint8_t *buf, size_t n, std::string &err);

// Reads one frame and returns it as [tag][payload] (codec bytes).
// Returns:
//  - true  => frame read successfully into out
//  - false => EOF before any header byte (err empty) or fatal
//             protocol/IO error (err non-empty)
bool read_frame(Stream &in, std::vector<uint8_t> &out, std::string &err,
                uint32_t max_len = kDefaultMaxFrameBytes);

// Frames codec bytes and writes them in one piece.
// Returns false on error and sets err.
bool write_frame(Stream &out, const std::vector<uint8_t> &encoded,
                 std::string &err, uint32_t max_len = kDefaultMaxFrameBytes);

} // namespace nexsock_transport
