#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace roomcast {

struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    unsigned short port = 5000;
    std::string certificate_file;
    std::string private_key_file;
    size_t threads = 1;
    uint64_t max_upload_bytes = 100ull * 1024 * 1024;
    std::chrono::seconds upload_session_ttl{900};
    std::chrono::seconds sweep_interval{30};
    bool show_help = false;

    // Largest frame a client may send: a base64 upload of max_upload_bytes plus 1 MiB of slack
    uint64_t max_frame_bytes() const {
        return (max_upload_bytes + 2) / 3 * 4 + 1024 * 1024;
    }
};

// Throws std::invalid_argument on unknown flags, missing or malformed values
ServerConfig parse_arguments(int argc, const char* const argv[]);

std::string usage(const std::string& program);

} // namespace roomcast
