#include "server_config.hpp"
#include <sstream>
#include <stdexcept>
#include <thread>

namespace roomcast {

namespace {

uint64_t parse_number(const std::string& flag, const std::string& value, uint64_t min, uint64_t max) {
    size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
    if (consumed != value.size() || value[0] == '-') {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
    if (parsed < min || parsed > max) {
        throw std::invalid_argument(flag + " must be between " + std::to_string(min) +
                                    " and " + std::to_string(max));
    }
    return parsed;
}

} // namespace

ServerConfig parse_arguments(int argc, const char* const argv[]) {
    ServerConfig config;
    unsigned int hardware = std::thread::hardware_concurrency();
    config.threads = hardware > 0 ? hardware : 1;

    for (int i = 1; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--help" || flag == "-h") {
            config.show_help = true;
            return config;
        }
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + flag);
        }
        std::string value = argv[++i];

        if (flag == "--listen") {
            config.port = static_cast<unsigned short>(parse_number(flag, value, 1, 65535));
        } else if (flag == "--bind") {
            config.bind_address = value;
        } else if (flag == "--cert") {
            config.certificate_file = value;
        } else if (flag == "--key") {
            config.private_key_file = value;
        } else if (flag == "--threads") {
            config.threads = static_cast<size_t>(parse_number(flag, value, 1, 256));
        } else if (flag == "--max-upload-mb") {
            config.max_upload_bytes = parse_number(flag, value, 1, 1024) * 1024 * 1024;
        } else if (flag == "--upload-ttl") {
            config.upload_session_ttl = std::chrono::seconds(parse_number(flag, value, 1, 86400));
        } else if (flag == "--sweep-interval") {
            config.sweep_interval = std::chrono::seconds(parse_number(flag, value, 1, 3600));
        } else {
            throw std::invalid_argument("Unknown option " + flag);
        }
    }

    if (config.certificate_file.empty() || config.private_key_file.empty()) {
        throw std::invalid_argument("--cert and --key are required");
    }
    return config;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " --cert <chain.pem> --key <key.pem> [options]\n"
        << "  --listen <port>            TCP port (default 5000)\n"
        << "  --bind <address>           listen address (default 0.0.0.0)\n"
        << "  --threads <n>              worker threads (default: hardware concurrency)\n"
        << "  --max-upload-mb <n>        largest accepted upload (default 100)\n"
        << "  --upload-ttl <seconds>     idle time before an upload announcement expires (default 900)\n"
        << "  --sweep-interval <seconds> how often announcements are checked (default 30)\n";
    return out.str();
}

} // namespace roomcast
