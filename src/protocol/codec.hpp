#pragma once

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

#include "protocol/errors.hpp"
#include "protocol/messages.hpp"

namespace nexsock_protocol {

// Codec version written as the first byte of every encoded message.
// A decoder rejects anything newer than this.
constexpr uint8_t kCodecVersion = 1;

using DecodeResult = std::variant<Message, DecodeError>;

// Encodes a message as [version byte][protobuf Envelope].
// Deterministic: equal messages always produce equal bytes.
std::vector<uint8_t> encode(const Message &msg);

// Never throws. Returns the message or the reason it was rejected.
DecodeResult decode(const uint8_t *data, size_t len);
DecodeResult decode(const std::vector<uint8_t> &bytes);

} // namespace nexsock_protocol
