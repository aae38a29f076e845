#include "transfer_sessions.hpp"
#include <iostream>

namespace roomcast {

void TransferSessionManager::upload_start(const std::string& room_code, const std::string& uploader_connection_id,
                                          const std::string& filename, uint32_t receiver_count, SteadyTime now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = uploads_.find(room_code);
    if (it != uploads_.end()) {
        std::cout << "[Transfer] Replacing announced upload '" << it->second.filename
                  << "' in room " << room_code << std::endl;
    }

    ActiveUpload upload;
    upload.uploader_connection_id = uploader_connection_id;
    upload.filename = filename;
    upload.receiver_count = receiver_count;
    upload.dismissed_count = 0;
    upload.last_update = now;
    uploads_[room_code] = upload;

    std::cout << "[Transfer] " << uploader_connection_id << " announced '" << filename << "' to "
              << receiver_count << " receiver(s) in room " << room_code << std::endl;
}

bool TransferSessionManager::upload_progress(const std::string& room_code, SteadyTime now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = uploads_.find(room_code);
    if (it == uploads_.end()) {
        return false;
    }
    it->second.last_update = now;
    return true;
}

bool TransferSessionManager::upload_complete(const std::string& room_code) {
    std::lock_guard<std::mutex> lock(mutex_);
    return uploads_.erase(room_code) > 0;
}

DismissResult TransferSessionManager::dismiss(const std::string& room_code) {
    std::lock_guard<std::mutex> lock(mutex_);
    DismissResult result;

    auto it = uploads_.find(room_code);
    if (it == uploads_.end()) {
        return result;
    }

    ActiveUpload& upload = it->second;
    ++upload.dismissed_count;
    result.uploader_connection_id = upload.uploader_connection_id;
    result.filename = upload.filename;

    // A room holding only the uploader has no receivers and is never cancelled
    if (upload.receiver_count > 0 && upload.dismissed_count >= upload.receiver_count) {
        std::cout << "[Transfer] All " << upload.receiver_count << " receiver(s) dismissed '"
                  << upload.filename << "' in room " << room_code << std::endl;
        uploads_.erase(it);
        result.outcome = DismissOutcome::Cancelled;
    } else {
        result.outcome = DismissOutcome::Counted;
    }
    return result;
}

std::vector<std::string> TransferSessionManager::forget_uploader(const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> rooms;
    for (auto it = uploads_.begin(); it != uploads_.end();) {
        if (it->second.uploader_connection_id == connection_id) {
            rooms.push_back(it->first);
            it = uploads_.erase(it);
        } else {
            ++it;
        }
    }
    return rooms;
}

std::vector<std::string> TransferSessionManager::expire_stale(SteadyTime now, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> rooms;
    for (auto it = uploads_.begin(); it != uploads_.end();) {
        if (now - it->second.last_update > ttl) {
            std::cout << "[Transfer] Expiring stale upload '" << it->second.filename
                      << "' in room " << it->first << std::endl;
            rooms.push_back(it->first);
            it = uploads_.erase(it);
        } else {
            ++it;
        }
    }
    return rooms;
}

std::optional<ActiveUpload> TransferSessionManager::active(const std::string& room_code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = uploads_.find(room_code);
    if (it == uploads_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t TransferSessionManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return uploads_.size();
}

} // namespace roomcast
