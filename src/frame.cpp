#include "roomcast/frame.hpp"
#include "roomcast.pb.h"
#include <arpa/inet.h>
#include <cstring>
#include <stdexcept>

namespace roomcast {
namespace frame {

std::array<uint8_t, HEADER_SIZE> encode_header(uint32_t payload_size) {
    std::array<uint8_t, HEADER_SIZE> header;
    uint32_t size = htonl(payload_size);
    std::memcpy(header.data(), &size, HEADER_SIZE);
    return header;
}

uint32_t decode_header(const std::array<uint8_t, HEADER_SIZE>& header) {
    uint32_t size;
    std::memcpy(&size, header.data(), HEADER_SIZE);
    return ntohl(size);
}

std::string encode(const wire::MessageWrapper& msg) {
    std::string payload;
    if (!msg.SerializeToString(&payload)) {
        throw std::runtime_error("Failed to serialize message");
    }
    auto header = encode_header(static_cast<uint32_t>(payload.size()));

    std::string out;
    out.reserve(HEADER_SIZE + payload.size());
    out.append(reinterpret_cast<const char*>(header.data()), header.size());
    out.append(payload);
    return out;
}

} // namespace frame
} // namespace roomcast
