#include "room_service.hpp"
#include "roomcast/codec_utils.hpp"
#include "roomcast/events.hpp"
#include "roomcast/file_catalog.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <iostream>

namespace roomcast {

namespace {

const char* UNKNOWN_DEVICE = "Unknown Device";

std::string new_file_id() {
    boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

} // namespace

RoomService::RoomService(RoomRegistry& registry, TransferSessionManager& transfers,
                         BroadcastGateway& gateway, Scheduler scheduler,
                         uint64_t max_upload_bytes)
    : registry_(registry),
      transfers_(transfers),
      gateway_(gateway),
      scheduler_(std::move(scheduler)),
      max_upload_bytes_(max_upload_bytes) {}

// --- Transport notifications ---

void RoomService::on_connect(const std::string& connection_id) {
    std::cout << "[Rooms] Client connected: " << connection_id << std::endl;
    gateway_.emit_to(connection_id, events::connection_ready(connection_id));
}

void RoomService::on_disconnect(const std::string& connection_id) {
    std::cout << "[Rooms] Client disconnected: " << connection_id << std::endl;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        streams_.erase(connection_id);
    }
    depart(connection_id);
}

void RoomService::on_message(const std::string& connection_id, const wire::MessageWrapper& msg) {
    const std::string context = events::event_name(msg);
    try {
        switch (msg.event_case()) {
            case wire::MessageWrapper::kCreateRoom:       create_room(connection_id); break;
            case wire::MessageWrapper::kJoinRoom:         join_room(connection_id, msg.join_room()); break;
            case wire::MessageWrapper::kLeaveRoom:        leave_room(connection_id, msg.leave_room()); break;
            case wire::MessageWrapper::kUploadFile:       upload_file(connection_id, msg.upload_file()); break;
            case wire::MessageWrapper::kRequestFile:      request_file(connection_id, msg.request_file()); break;
            case wire::MessageWrapper::kDeleteFile:       delete_file(connection_id, msg.delete_file()); break;
            case wire::MessageWrapper::kClearFiles:       clear_files(connection_id, msg.clear_files()); break;
            case wire::MessageWrapper::kFileInfo:         file_info(connection_id, msg.file_info()); break;
            case wire::MessageWrapper::kUploadStart:      upload_start(connection_id, msg.upload_start()); break;
            case wire::MessageWrapper::kUploadProgress:   upload_progress(connection_id, msg.upload_progress()); break;
            case wire::MessageWrapper::kUploadComplete:   upload_complete(connection_id, msg.upload_complete()); break;
            case wire::MessageWrapper::kDismissReceiving: dismiss_receiving(connection_id, msg.dismiss_receiving()); break;
            default:
                throw ValidationError("Unsupported event '" + context + "'");
        }
    } catch (const Error& e) {
        std::cerr << "[Rooms] " << (context.empty() ? "message" : context) << " from "
                  << connection_id << " failed: " << e.what() << std::endl;
        gateway_.emit_to(connection_id, events::error(e.kind(), e.what(), context));
    } catch (const std::exception& e) {
        std::cerr << "[Rooms] " << (context.empty() ? "message" : context) << " from "
                  << connection_id << " hit an internal fault: " << e.what() << std::endl;
        gateway_.emit_to(connection_id, events::error(ErrorKind::Internal, "Internal server error", context));
    }
}

void RoomService::expire_stale_uploads(SteadyTime now, std::chrono::seconds ttl) {
    auto expired = transfers_.expire_stale(now, ttl);
    if (!expired.empty()) {
        std::cout << "[Rooms] Expired " << expired.size() << " stale upload announcement(s)" << std::endl;
    }
}

// --- Rooms ---

void RoomService::create_room(const std::string& connection_id) {
    std::string room_code = registry_.create_room();
    gateway_.emit_to(connection_id, events::room_created(room_code));
}

void RoomService::join_room(const std::string& connection_id, const wire::JoinRoom& req) {
    std::string room_code = catalog::normalize_room_code(req.room_code());

    DeviceInfo device;
    device.connection_id = connection_id;
    device.name = req.device_info().name().empty() ? UNKNOWN_DEVICE : req.device_info().name();
    device.platform = req.device_info().platform();
    device.joined_at = std::chrono::system_clock::now();

    std::optional<std::string> previous_room = registry_.room_of(connection_id);

    switch (registry_.join(room_code, device)) {
        case JoinResult::NotFound:
            reply_error(connection_id, ErrorKind::NotFound, "Room not found", "join_room");
            return;
        case JoinResult::Full:
            reply_error(connection_id, ErrorKind::Full,
                        "Room is full (" + std::to_string(MAX_DEVICES_PER_ROOM) + " devices)", "join_room");
            return;
        case JoinResult::Joined:
            break;
    }

    if (previous_room && *previous_room != room_code) {
        transfers_.forget_uploader(connection_id);
        gateway_.emit_to_room(*previous_room, events::devices_updated(registry_.devices(*previous_room)));
    }

    auto files = registry_.list_files(room_code);
    auto devices = registry_.devices(room_code);

    gateway_.emit_to(connection_id, events::room_joined(room_code, files.size(), devices.size()));
    for (const auto& record : files) {
        gateway_.emit_to(connection_id, events::file_available(record));
    }
    gateway_.emit_to_room(room_code, events::devices_updated(devices));
}

void RoomService::leave_room(const std::string& connection_id, const wire::LeaveRoom& req) {
    std::string room_code = catalog::normalize_room_code(req.room_code());
    // Leaving a room the connection is not in is a no-op
    if (!registry_.is_member(connection_id, room_code)) {
        return;
    }
    depart(connection_id);
}

void RoomService::depart(const std::string& connection_id) {
    std::optional<std::string> room_code = registry_.leave(connection_id);
    auto cleared = transfers_.forget_uploader(connection_id);
    for (const auto& room : cleared) {
        std::cout << "[Rooms] Cleared upload announcement in " << room << " after "
                  << connection_id << " left" << std::endl;
    }
    if (room_code) {
        gateway_.emit_to_room(*room_code, events::devices_updated(registry_.devices(*room_code)));
    }
}

// --- Files ---

void RoomService::upload_file(const std::string& connection_id, const wire::UploadFile& req) {
    std::string room_code = catalog::normalize_room_code(req.room_code());
    if (!registry_.room_exists(room_code)) {
        reply_error(connection_id, ErrorKind::NotFound, "Room not found", "upload_file");
        return;
    }

    std::string filename = catalog::base_name(req.filename());
    if (filename.empty()) {
        throw ValidationError("No file selected");
    }
    // base64 is 4 characters per 3 bytes
    if (req.content().size() / 4 * 3 > max_upload_bytes_ + 2) {
        throw ValidationError("File exceeds the upload limit");
    }

    auto content = std::make_shared<const std::string>(codec::base64_decode(req.content()));
    if (content->empty()) {
        throw ValidationError("Empty file");
    }
    if (content->size() > max_upload_bytes_) {
        throw ValidationError("File exceeds the upload limit");
    }

    std::string safe_path = catalog::sanitize_relative_path(
        req.relative_path().empty() ? req.filename() : req.relative_path());
    if (safe_path.empty()) {
        safe_path = filename;
    }

    std::string uploader = req.device_label();
    if (uploader.empty()) {
        auto device = registry_.device(connection_id);
        uploader = device ? device->name : UNKNOWN_DEVICE;
    }

    FileRecord record;
    record.file_id = new_file_id();
    record.filename = filename;
    record.file_type = catalog::classify_file_type(filename);
    record.mime_type = catalog::guess_mime_type(filename);
    record.size = content->size();
    record.content_hash = codec_.content_hash(*content);
    record.manifest = codec_.split(record.file_id, *content);
    record.manifest_signature = signer_.sign(*record.manifest);
    record.content = content;
    record.created_at = events::format_iso_time(std::chrono::system_clock::now());
    record.uploader = uploader;
    record.safe_path = safe_path;
    record.room_code = room_code;

    registry_.add_file(room_code, record);
    std::cout << "[Rooms] Stored '" << record.filename << "' (" << record.size << " bytes, "
              << record.manifest->chunks.size() << " chunks) in " << room_code << std::endl;

    gateway_.emit_to(connection_id, events::file_uploaded(record));
    gateway_.emit_to_room(room_code, events::file_available(record));
}

void RoomService::request_file(const std::string& connection_id, const wire::RequestFile& req) {
    if (req.file_id().empty()) {
        throw ValidationError("Missing file_id");
    }
    catalog::validate_file_id(req.file_id());
    if (!check_member(connection_id, req.room_code(), "request_file")) {
        return;
    }
    std::string room_code = catalog::normalize_room_code(req.room_code());

    std::optional<FileRecord> record = registry_.resolve_file(req.file_id(), room_code);
    if (!record) {
        reply_error(connection_id, ErrorKind::NotFound, "File not found", "request_file");
        return;
    }

    auto streamer = std::make_shared<FileStreamer>(gateway_, scheduler_, connection_id, std::move(*record));
    track_stream(connection_id, streamer);
    streamer->start();
}

void RoomService::track_stream(const std::string& connection_id, const std::shared_ptr<FileStreamer>& streamer) {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    // A streamer lives only while a chunk task or a writable wait still holds it
    auto& active = streams_[connection_id];
    active.erase(std::remove_if(active.begin(), active.end(),
                                [](const std::weak_ptr<FileStreamer>& s) { return s.expired(); }),
                 active.end());
    if (active.size() >= MAX_STREAMS_PER_CONNECTION) {
        throw ValidationError("Too many downloads in progress (" +
                              std::to_string(MAX_STREAMS_PER_CONNECTION) + ")");
    }
    active.push_back(streamer);
}

void RoomService::delete_file(const std::string& connection_id, const wire::DeleteFile& req) {
    catalog::validate_file_id(req.file_id());
    if (!check_member(connection_id, req.room_code(), "delete_file")) {
        return;
    }
    std::string room_code = catalog::normalize_room_code(req.room_code());

    std::optional<FileRecord> removed = registry_.remove_file(room_code, req.file_id());
    if (!removed) {
        reply_error(connection_id, ErrorKind::NotFound, "File not found", "delete_file");
        return;
    }

    std::string label = req.device_label();
    if (label.empty()) {
        auto device = registry_.device(connection_id);
        label = device ? device->name : UNKNOWN_DEVICE;
    }
    std::cout << "[Rooms] Deleted '" << removed->filename << "' from " << room_code << std::endl;
    gateway_.emit_to_room(room_code, events::file_deleted(*removed, label));
}

void RoomService::clear_files(const std::string& connection_id, const wire::ClearFiles& req) {
    if (!check_member(connection_id, req.room_code(), "clear_files")) {
        return;
    }
    std::string room_code = catalog::normalize_room_code(req.room_code());

    size_t removed = registry_.clear_files(room_code);
    std::cout << "[Rooms] Cleared " << removed << " file(s) from " << room_code << std::endl;
    gateway_.emit_to_room(room_code, events::files_cleared());
}

void RoomService::file_info(const std::string& connection_id, const wire::FileInfoRequest& req) {
    catalog::validate_file_id(req.file_id());
    if (!check_member(connection_id, req.room_code(), "file_info")) {
        return;
    }
    std::string room_code = catalog::normalize_room_code(req.room_code());

    std::optional<FileRecord> record = registry_.resolve_file(req.file_id(), room_code);
    if (!record) {
        reply_error(connection_id, ErrorKind::NotFound, "File not found", "file_info");
        return;
    }
    gateway_.emit_to(connection_id, events::file_details(*record));
}

// --- Upload notifications ---

void RoomService::upload_start(const std::string& connection_id, const wire::UploadStart& req) {
    if (!check_member(connection_id, req.room_code(), "upload_start")) {
        return;
    }
    std::string room_code = catalog::normalize_room_code(req.room_code());

    size_t devices = registry_.device_count(room_code);
    uint32_t receivers = devices > 0 ? static_cast<uint32_t>(devices - 1) : 0;
    transfers_.upload_start(room_code, connection_id, req.filename(), receivers,
                            std::chrono::steady_clock::now());

    wire::DeviceInfo device = sender_device(connection_id, req.has_device_info() ? &req.device_info() : nullptr);
    gateway_.emit_to_room(room_code, events::receiving_file(req.filename(), req.size(), device), {connection_id});
}

void RoomService::upload_progress(const std::string& connection_id, const wire::UploadProgress& req) {
    if (!check_member(connection_id, req.room_code(), "upload_progress")) {
        return;
    }
    std::string room_code = catalog::normalize_room_code(req.room_code());

    transfers_.upload_progress(room_code, std::chrono::steady_clock::now());

    uint32_t progress = std::min<uint32_t>(req.progress(), 100);
    wire::DeviceInfo device = sender_device(connection_id, nullptr);
    gateway_.emit_to_room(room_code, events::receiving_progress(req.filename(), progress, device), {connection_id});
}

void RoomService::upload_complete(const std::string& connection_id, const wire::UploadComplete& req) {
    if (!check_member(connection_id, req.room_code(), "upload_complete")) {
        return;
    }
    std::string room_code = catalog::normalize_room_code(req.room_code());

    transfers_.upload_complete(room_code);

    wire::DeviceInfo device = sender_device(connection_id, req.has_device_info() ? &req.device_info() : nullptr);
    gateway_.emit_to_room(room_code, events::receiving_complete(req.filename(), device), {connection_id});
}

void RoomService::dismiss_receiving(const std::string& connection_id, const wire::DismissReceiving& req) {
    if (!check_member(connection_id, req.room_code(), "dismiss_receiving")) {
        return;
    }
    std::string room_code = catalog::normalize_room_code(req.room_code());

    DismissResult result = transfers_.dismiss(room_code);
    if (result.outcome == DismissOutcome::Cancelled) {
        gateway_.emit_to(result.uploader_connection_id,
                         events::cancel_upload("All receivers dismissed '" + result.filename + "'"));
    }
}

// --- Helpers ---

bool RoomService::check_member(const std::string& connection_id, const std::string& room_code,
                               const std::string& context) {
    std::string normalized = catalog::normalize_room_code(room_code);
    if (registry_.is_member(connection_id, normalized)) {
        return true;
    }
    reply_error(connection_id, ErrorKind::NotFound, "Not a member of room " + normalized, context);
    return false;
}

void RoomService::reply_error(const std::string& connection_id, ErrorKind kind,
                              const std::string& message, const std::string& context) {
    std::cout << "[Rooms] " << context << " from " << connection_id << ": " << message << std::endl;
    gateway_.emit_to(connection_id, events::error(kind, message, context));
}

wire::DeviceInfo RoomService::sender_device(const std::string& connection_id,
                                            const wire::DeviceInfo* supplied) const {
    wire::DeviceInfo device;
    if (auto known = registry_.device(connection_id)) {
        events::fill_device(*known, &device);
    } else {
        device.set_connection_id(connection_id);
        device.set_name(UNKNOWN_DEVICE);
    }
    if (supplied) {
        if (!supplied->name().empty()) device.set_name(supplied->name());
        if (!supplied->platform().empty()) device.set_platform(supplied->platform());
    }
    return device;
}

} // namespace roomcast
