#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace roomcast {
namespace codec {

// --- Hex and digests ---
std::string to_hex(const std::string& s);
std::string to_hex(const std::vector<uint8_t>& bytes);

// Raw 32-byte SHA-256 digest of [data, data + len)
std::vector<uint8_t> sha256(const char* data, size_t len);

// Lowercase hex SHA-256 digest (64 characters)
std::string sha256_hex(const char* data, size_t len);
inline std::string sha256_hex(const std::string& data) {
    return sha256_hex(data.data(), data.size());
}

// --- Base64 (standard alphabet, padded) ---
std::string base64_encode(const char* data, size_t len);
inline std::string base64_encode(const std::string& data) {
    return base64_encode(data.data(), data.size());
}

// Throws DecodeError on malformed input.
std::string base64_decode(const std::string& encoded);

} // namespace codec
} // namespace roomcast
