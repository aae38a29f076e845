#include "roomcast/codec_utils.hpp"
#include "roomcast/errors.hpp"
#include <openssl/evp.h>
#include <cctype>
#include <iomanip>
#include <memory>
#include <sstream>

namespace roomcast {
namespace codec {

// Helper for managing EVP_MD_CTX context
using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string to_hex(const std::string& s) {
    std::stringstream hex_stream;
    hex_stream << std::hex << std::setfill('0');
    for (unsigned char c : s) {
        hex_stream << std::setw(2) << static_cast<int>(c);
    }
    return hex_stream.str();
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
    return to_hex(std::string(bytes.begin(), bytes.end()));
}

std::vector<uint8_t> sha256(const char* data, size_t len) {
    EVP_MD_CTX_ptr mdctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!mdctx ||
        EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(mdctx.get(), data, len) != 1) {
        throw std::runtime_error("SHA-256 digest initialisation failed");
    }

    std::vector<uint8_t> hash(EVP_MAX_MD_SIZE);
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(mdctx.get(), hash.data(), &hash_len) != 1) {
        throw std::runtime_error("SHA-256 digest finalisation failed");
    }
    hash.resize(hash_len);
    return hash;
}

std::string sha256_hex(const char* data, size_t len) {
    return to_hex(sha256(data, len));
}

std::string base64_encode(const char* data, size_t len) {
    if (len == 0) {
        return {};
    }
    // 4 output characters per 3 input bytes, plus the NUL EVP_EncodeBlock appends
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(data),
                                  static_cast<int>(len));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::string base64_decode(const std::string& encoded) {
    if (encoded.empty()) {
        return {};
    }
    if (encoded.size() % 4 != 0) {
        throw DecodeError("Base64 input length must be a multiple of 4");
    }

    // EVP_DecodeBlock reads '=' anywhere as zero bits; only up to two trailing '=' are valid
    size_t padding = 0;
    while (padding < encoded.size() && encoded[encoded.size() - 1 - padding] == '=') {
        ++padding;
    }
    if (padding > 2) {
        throw DecodeError("Invalid base64 padding");
    }
    for (size_t i = 0; i < encoded.size() - padding; ++i) {
        unsigned char c = static_cast<unsigned char>(encoded[i]);
        if (!std::isalnum(c) && c != '+' && c != '/') {
            throw DecodeError("Invalid base64 content");
        }
    }

    std::string out(3 * (encoded.size() / 4), '\0');
    int decoded = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (decoded < 0) {
        throw DecodeError("Invalid base64 content");
    }

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    out.resize(static_cast<size_t>(decoded) - padding);
    return out;
}

} // namespace codec
} // namespace roomcast
