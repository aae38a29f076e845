#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace roomcast {

using SteadyTime = std::chrono::steady_clock::time_point;

// One in-flight "receiving" notification cycle per room
struct ActiveUpload {
    std::string uploader_connection_id;
    std::string filename;
    uint32_t receiver_count = 0;
    uint32_t dismissed_count = 0;
    SteadyTime last_update;
};

enum class DismissOutcome {
    Ignored,   // no active upload in the room
    Counted,   // dismissal recorded, upload continues
    Cancelled  // every receiver dismissed; the uploader must be told to stop
};

struct DismissResult {
    DismissOutcome outcome = DismissOutcome::Ignored;
    std::string uploader_connection_id;
    std::string filename;
};

class TransferSessionManager {
public:
    // Replaces any upload already announced in the room
    void upload_start(const std::string& room_code, const std::string& uploader_connection_id,
                      const std::string& filename, uint32_t receiver_count, SteadyTime now);

    // Returns false when nothing is announced for the room; the progress event is relayed either way
    bool upload_progress(const std::string& room_code, SteadyTime now);

    // Returns true when an announced upload was cleared
    bool upload_complete(const std::string& room_code);

    DismissResult dismiss(const std::string& room_code);

    // Clears every upload announced by the connection; returns the affected rooms
    std::vector<std::string> forget_uploader(const std::string& connection_id);

    // Clears uploads idle for longer than ttl; returns the affected rooms
    std::vector<std::string> expire_stale(SteadyTime now, std::chrono::seconds ttl);

    std::optional<ActiveUpload> active(const std::string& room_code) const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ActiveUpload> uploads_; // room_code -> upload
};

} // namespace roomcast
