#pragma once

#include "broadcast_gateway.hpp"
#include "chunk_codec.hpp"
#include "file_streamer.hpp"
#include "manifest_signer.hpp"
#include "room_registry.hpp"
#include "transfer_sessions.hpp"
#include "roomcast/errors.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace roomcast {

const uint64_t DEFAULT_MAX_UPLOAD_BYTES = 100ull * 1024 * 1024;
const size_t MAX_STREAMS_PER_CONNECTION = 4;

// Handles every inbound real-time event. Each handler applies one state change
// to the registry or the transfer sessions and describes the resulting broadcast
// through the gateway. Failures go back to the requesting connection only.
class RoomService : public ConnectionHandler {
public:
    RoomService(RoomRegistry& registry, TransferSessionManager& transfers,
                BroadcastGateway& gateway, Scheduler scheduler,
                uint64_t max_upload_bytes = DEFAULT_MAX_UPLOAD_BYTES);

    void on_connect(const std::string& connection_id) override;
    void on_disconnect(const std::string& connection_id) override;
    void on_message(const std::string& connection_id, const wire::MessageWrapper& msg) override;

    // Drops announced uploads that saw no progress for longer than ttl
    void expire_stale_uploads(SteadyTime now, std::chrono::seconds ttl);

private:
    void create_room(const std::string& connection_id);
    void join_room(const std::string& connection_id, const wire::JoinRoom& req);
    void leave_room(const std::string& connection_id, const wire::LeaveRoom& req);
    void upload_file(const std::string& connection_id, const wire::UploadFile& req);
    void request_file(const std::string& connection_id, const wire::RequestFile& req);
    void delete_file(const std::string& connection_id, const wire::DeleteFile& req);
    void clear_files(const std::string& connection_id, const wire::ClearFiles& req);
    void file_info(const std::string& connection_id, const wire::FileInfoRequest& req);
    void upload_start(const std::string& connection_id, const wire::UploadStart& req);
    void upload_progress(const std::string& connection_id, const wire::UploadProgress& req);
    void upload_complete(const std::string& connection_id, const wire::UploadComplete& req);
    void dismiss_receiving(const std::string& connection_id, const wire::DismissReceiving& req);

    // Removes the connection from its room and tells the remaining members
    void depart(const std::string& connection_id);

    // Registers the stream, or throws ValidationError when the connection already
    // has MAX_STREAMS_PER_CONNECTION downloads in flight
    void track_stream(const std::string& connection_id, const std::shared_ptr<FileStreamer>& streamer);

    // Normalizes the code; emits not_found and returns false unless the connection is a member
    bool check_member(const std::string& connection_id, const std::string& room_code,
                      const std::string& context);
    void reply_error(const std::string& connection_id, ErrorKind kind,
                     const std::string& message, const std::string& context);

    // Registry view of the sender, overlaid with whatever the client supplied
    wire::DeviceInfo sender_device(const std::string& connection_id, const wire::DeviceInfo* supplied) const;

    RoomRegistry& registry_;
    TransferSessionManager& transfers_;
    BroadcastGateway& gateway_;
    Scheduler scheduler_;
    uint64_t max_upload_bytes_;
    ChunkCodec codec_;
    ManifestSigner signer_;

    std::mutex streams_mutex_;
    std::unordered_map<std::string, std::vector<std::weak_ptr<FileStreamer>>> streams_;
};

} // namespace roomcast
