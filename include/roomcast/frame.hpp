#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace roomcast {

namespace wire {
class MessageWrapper;
}

namespace frame {

// Every frame: uint32 big-endian payload length, then a serialized MessageWrapper
const size_t HEADER_SIZE = 4;

std::array<uint8_t, HEADER_SIZE> encode_header(uint32_t payload_size);
uint32_t decode_header(const std::array<uint8_t, HEADER_SIZE>& header);

// Header followed by the serialized message
std::string encode(const wire::MessageWrapper& msg);

} // namespace frame
} // namespace roomcast
