#include "room_registry.hpp"
#include "roomcast/errors.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace roomcast {

namespace {

const char ROOM_CODE_ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
const int MAX_CODE_ATTEMPTS = 10000;

} // namespace

RoomRegistry::RoomRegistry() : RoomRegistry(nullptr) {}

RoomRegistry::RoomRegistry(CodeGenerator generator)
    : generator_(std::move(generator)),
      rng_(std::random_device{}()) {}

std::string RoomRegistry::generate_code() {
    if (generator_) {
        std::string code = generator_();
        std::transform(code.begin(), code.end(), code.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return code;
    }
    std::uniform_int_distribution<size_t> dis(0, sizeof(ROOM_CODE_ALPHABET) - 2);
    std::string code;
    for (size_t i = 0; i < ROOM_CODE_LENGTH; ++i) {
        code += ROOM_CODE_ALPHABET[dis(rng_)];
    }
    return code;
}

std::string RoomRegistry::create_room() {
    std::lock_guard<std::mutex> lock(index_mutex_);

    for (int attempt = 0; attempt < MAX_CODE_ATTEMPTS; ++attempt) {
        std::string code = generate_code();
        if (rooms_.count(code)) {
            continue;
        }
        auto slot = std::make_shared<RoomSlot>();
        slot->room.room_code = code;
        slot->room.created_at = std::chrono::system_clock::now();
        slot->room.last_activity = slot->room.created_at;
        rooms_.emplace(code, std::move(slot));

        std::cout << "[Rooms] Created room " << code << " (" << rooms_.size() << " live)" << std::endl;
        return code;
    }
    throw std::runtime_error("Unable to allocate a unique room code");
}

std::shared_ptr<RoomRegistry::RoomSlot> RoomRegistry::find_slot(const std::string& room_code) const {
    std::lock_guard<std::mutex> lock(index_mutex_);
    auto it = rooms_.find(room_code);
    if (it == rooms_.end()) {
        return nullptr;
    }
    return it->second;
}

bool RoomRegistry::room_exists(const std::string& room_code) const {
    return find_slot(room_code) != nullptr;
}

// --- Membership ---

JoinResult RoomRegistry::join(const std::string& room_code, const DeviceInfo& device) {
    auto slot = find_slot(room_code);
    if (!slot) {
        return JoinResult::NotFound;
    }

    const std::string& connection_id = device.connection_id;
    std::optional<std::string> previous_room = room_of(connection_id);

    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        auto& devices = slot->room.devices;
        if (!devices.count(connection_id) && devices.size() >= MAX_DEVICES_PER_ROOM) {
            return JoinResult::Full;
        }
        devices[connection_id] = device;
        slot->room.last_activity = std::chrono::system_clock::now();
    }

    // A connection belongs to one room at a time
    if (previous_room && *previous_room != room_code) {
        if (auto previous_slot = find_slot(*previous_room)) {
            std::lock_guard<std::mutex> lock(previous_slot->mutex);
            previous_slot->room.devices.erase(connection_id);
            previous_slot->room.last_activity = std::chrono::system_clock::now();
        }
    }

    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        connection_rooms_[connection_id] = room_code;
    }

    std::cout << "[Rooms] " << connection_id << " joined " << room_code << std::endl;
    return JoinResult::Joined;
}

std::optional<std::string> RoomRegistry::leave(const std::string& connection_id) {
    std::string room_code;
    std::shared_ptr<RoomSlot> slot;
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        auto it = connection_rooms_.find(connection_id);
        if (it == connection_rooms_.end()) {
            return std::nullopt;
        }
        room_code = it->second;
        connection_rooms_.erase(it);
        auto room_it = rooms_.find(room_code);
        if (room_it != rooms_.end()) {
            slot = room_it->second;
        }
    }

    if (slot) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        slot->room.devices.erase(connection_id);
        slot->room.last_activity = std::chrono::system_clock::now();
    }

    std::cout << "[Rooms] " << connection_id << " left " << room_code << std::endl;
    return room_code;
}

std::optional<std::string> RoomRegistry::room_of(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(index_mutex_);
    auto it = connection_rooms_.find(connection_id);
    if (it == connection_rooms_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool RoomRegistry::is_member(const std::string& connection_id, const std::string& room_code) const {
    auto room = room_of(connection_id);
    return room && *room == room_code;
}

std::vector<DeviceInfo> RoomRegistry::devices(const std::string& room_code) const {
    std::vector<DeviceInfo> result;
    auto slot = find_slot(room_code);
    if (!slot) {
        return result;
    }
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        for (const auto& entry : slot->room.devices) {
            result.push_back(entry.second);
        }
    }
    std::sort(result.begin(), result.end(), [](const DeviceInfo& a, const DeviceInfo& b) {
        if (a.joined_at != b.joined_at) {
            return a.joined_at < b.joined_at;
        }
        return a.connection_id < b.connection_id;
    });
    return result;
}

std::vector<std::string> RoomRegistry::connections(const std::string& room_code) const {
    std::vector<std::string> result;
    for (const auto& device : devices(room_code)) {
        result.push_back(device.connection_id);
    }
    return result;
}

std::optional<DeviceInfo> RoomRegistry::device(const std::string& connection_id) const {
    auto room_code = room_of(connection_id);
    if (!room_code) {
        return std::nullopt;
    }
    auto slot = find_slot(*room_code);
    if (!slot) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    auto it = slot->room.devices.find(connection_id);
    if (it == slot->room.devices.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t RoomRegistry::device_count(const std::string& room_code) const {
    auto slot = find_slot(room_code);
    if (!slot) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->room.devices.size();
}

// --- Files ---

void RoomRegistry::add_file(const std::string& room_code, const FileRecord& record) {
    auto slot = find_slot(room_code);
    if (!slot) {
        return;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    slot->room.files[record.file_id] = record;
    slot->room.last_activity = std::chrono::system_clock::now();
}

std::optional<FileRecord> RoomRegistry::remove_file(const std::string& room_code, const std::string& file_id) {
    auto slot = find_slot(room_code);
    if (!slot) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    auto it = slot->room.files.find(file_id);
    if (it == slot->room.files.end()) {
        return std::nullopt;
    }
    FileRecord removed = std::move(it->second);
    slot->room.files.erase(it);
    slot->room.last_activity = std::chrono::system_clock::now();
    return removed;
}

size_t RoomRegistry::clear_files(const std::string& room_code) {
    auto slot = find_slot(room_code);
    if (!slot) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    size_t removed = slot->room.files.size();
    slot->room.files.clear();
    slot->room.last_activity = std::chrono::system_clock::now();
    return removed;
}

std::optional<FileRecord> RoomRegistry::resolve_file(const std::string& file_id, const std::string& room_code) const {
    auto slot = find_slot(room_code);
    if (!slot) {
        return std::nullopt;
    }

    FileRecord record;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        auto it = slot->room.files.find(file_id);
        if (it == slot->room.files.end()) {
            return std::nullopt;
        }
        record = it->second;
    }

    if (!record.content) {
        throw CorruptRecordError("Missing file content");
    }
    if (!record.manifest || !record.manifest_signature) {
        throw CorruptRecordError("Missing manifest data");
    }
    return record;
}

std::vector<FileRecord> RoomRegistry::list_files(const std::string& room_code) const {
    std::vector<FileRecord> result;
    auto slot = find_slot(room_code);
    if (!slot) {
        return result;
    }
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        for (const auto& entry : slot->room.files) {
            result.push_back(entry.second);
        }
    }
    std::sort(result.begin(), result.end(), [](const FileRecord& a, const FileRecord& b) {
        if (a.created_at != b.created_at) {
            return a.created_at < b.created_at;
        }
        return a.file_id < b.file_id;
    });
    return result;
}

size_t RoomRegistry::file_count(const std::string& room_code) const {
    auto slot = find_slot(room_code);
    if (!slot) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->room.files.size();
}

// --- Diagnostics ---

std::optional<SystemTime> RoomRegistry::last_activity(const std::string& room_code) const {
    auto slot = find_slot(room_code);
    if (!slot) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->room.last_activity;
}

size_t RoomRegistry::room_count() const {
    std::lock_guard<std::mutex> lock(index_mutex_);
    return rooms_.size();
}

} // namespace roomcast
