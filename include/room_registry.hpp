#pragma once

#include "chunk_codec.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace roomcast {

const size_t MAX_DEVICES_PER_ROOM = 10;
const size_t ROOM_CODE_LENGTH = 6;

using SystemTime = std::chrono::system_clock::time_point;

struct DeviceInfo {
    std::string connection_id;
    std::string name;
    std::string platform;
    SystemTime joined_at;
};

// Immutable once stored. Optional members are the ones a lookup re-validates.
struct FileRecord {
    std::string file_id;
    std::string filename;
    std::string mime_type;
    std::string file_type;
    uint64_t size = 0;
    std::shared_ptr<const std::string> content;
    std::string content_hash;
    std::string created_at; // ISO-8601, local time
    std::string uploader;   // device label
    std::string safe_path;
    std::optional<Manifest> manifest;
    std::optional<std::string> manifest_signature;
    std::string room_code;
};

struct Room {
    std::string room_code;
    std::map<std::string, FileRecord> files;
    std::unordered_map<std::string, DeviceInfo> devices; // connection_id -> device
    SystemTime created_at;
    SystemTime last_activity;
};

enum class JoinResult { Joined, Full, NotFound };

class RoomRegistry {
public:
    using CodeGenerator = std::function<std::string()>;

    RoomRegistry();
    explicit RoomRegistry(CodeGenerator generator);

    // Returns a code not used by any live room
    std::string create_room();
    bool room_exists(const std::string& room_code) const;

    // --- Membership ---
    JoinResult join(const std::string& room_code, const DeviceInfo& device);
    // Returns the room the connection was removed from, if any
    std::optional<std::string> leave(const std::string& connection_id);
    std::optional<std::string> room_of(const std::string& connection_id) const;
    bool is_member(const std::string& connection_id, const std::string& room_code) const;

    // Sorted by join time
    std::vector<DeviceInfo> devices(const std::string& room_code) const;
    std::vector<std::string> connections(const std::string& room_code) const;
    std::optional<DeviceInfo> device(const std::string& connection_id) const;
    size_t device_count(const std::string& room_code) const;

    // --- Files ---
    void add_file(const std::string& room_code, const FileRecord& record);
    // Returns the removed record; absence is not an error
    std::optional<FileRecord> remove_file(const std::string& room_code, const std::string& file_id);
    size_t clear_files(const std::string& room_code);

    // Throws CorruptRecordError when a stored record lacks its content or manifest data
    std::optional<FileRecord> resolve_file(const std::string& file_id, const std::string& room_code) const;
    // Oldest first
    std::vector<FileRecord> list_files(const std::string& room_code) const;
    size_t file_count(const std::string& room_code) const;

    // --- Diagnostics ---
    std::optional<SystemTime> last_activity(const std::string& room_code) const;
    size_t room_count() const;

private:
    struct RoomSlot {
        std::mutex mutex;
        Room room;
    };

    std::shared_ptr<RoomSlot> find_slot(const std::string& room_code) const;
    std::string generate_code();

    mutable std::mutex index_mutex_; // guards rooms_, connection_rooms_ and the generator
    std::unordered_map<std::string, std::shared_ptr<RoomSlot>> rooms_;
    std::unordered_map<std::string, std::string> connection_rooms_; // connection_id -> room_code

    CodeGenerator generator_;
    std::mt19937 rng_;
};

} // namespace roomcast
