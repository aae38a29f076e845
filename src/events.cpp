#include "roomcast/events.hpp"
#include "roomcast/codec_utils.hpp"
#include "roomcast/file_catalog.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace roomcast {
namespace events {

std::string event_name(const wire::MessageWrapper& msg) {
    if (msg.event_case() == wire::MessageWrapper::EVENT_NOT_SET) {
        return "";
    }
    const auto* field = wire::MessageWrapper::descriptor()->FindFieldByNumber(msg.event_case());
    return field ? std::string(field->name()) : std::string();
}

std::string format_iso_time(SystemTime time) {
    auto since_epoch = time.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - seconds).count();

    std::time_t tt = static_cast<std::time_t>(seconds.count());
    std::tm local{};
    localtime_r(&tt, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(6) << std::setfill('0') << micros;
    return out.str();
}

// --- Conversions ---

void fill_device(const DeviceInfo& device, wire::DeviceInfo* out) {
    out->set_name(device.name);
    out->set_platform(device.platform);
    out->set_connection_id(device.connection_id);
    out->set_joined_at(format_iso_time(device.joined_at));
}

void fill_manifest(const Manifest& manifest, wire::Manifest* out) {
    out->set_file_id(manifest.file_id);
    out->set_chunk_size(manifest.chunk_size);
    out->set_total_size(manifest.total_size);
    for (const auto& chunk : manifest.chunks) {
        auto* info = out->add_chunks();
        info->set_index(chunk.index);
        info->set_offset(chunk.offset);
        info->set_size(chunk.size);
        info->set_hash(chunk.hash);
    }
}

Manifest from_proto(const wire::Manifest& manifest) {
    Manifest result;
    result.file_id = manifest.file_id();
    result.chunk_size = manifest.chunk_size();
    result.total_size = manifest.total_size();
    for (const auto& info : manifest.chunks()) {
        Chunk chunk;
        chunk.index = info.index();
        chunk.offset = info.offset();
        chunk.size = info.size();
        chunk.hash = info.hash();
        result.chunks.push_back(std::move(chunk));
    }
    return result;
}

// --- Room events ---

wire::MessageWrapper connection_ready(const std::string& connection_id) {
    wire::MessageWrapper msg;
    msg.mutable_connection_ready()->set_connection_id(connection_id);
    return msg;
}

wire::MessageWrapper room_created(const std::string& room_code) {
    wire::MessageWrapper msg;
    msg.mutable_room_created()->set_room_code(room_code);
    return msg;
}

wire::MessageWrapper room_joined(const std::string& room_code, size_t file_count, size_t device_count) {
    wire::MessageWrapper msg;
    auto* joined = msg.mutable_room_joined();
    joined->set_room_code(room_code);
    joined->set_file_count(static_cast<uint32_t>(file_count));
    joined->set_device_count(static_cast<uint32_t>(device_count));
    return msg;
}

wire::MessageWrapper devices_updated(const std::vector<DeviceInfo>& devices) {
    wire::MessageWrapper msg;
    auto* updated = msg.mutable_devices_updated();
    for (const auto& device : devices) {
        fill_device(device, updated->add_devices());
    }
    updated->set_count(static_cast<uint32_t>(devices.size()));
    return msg;
}

// --- File events ---

wire::MessageWrapper file_available(const FileRecord& record) {
    wire::MessageWrapper msg;
    auto* available = msg.mutable_file_available();
    available->set_file_id(record.file_id);
    available->set_filename(record.filename);
    available->set_file_type(record.file_type);
    available->set_mime_type(record.mime_type);
    available->set_size(record.size);
    available->set_size_display(catalog::format_file_size(record.size));
    available->set_device_info(record.uploader);
    available->set_safe_path(record.safe_path.empty() ? record.filename : record.safe_path);
    available->set_chunks(record.manifest ? static_cast<uint32_t>(record.manifest->chunks.size()) : 0);
    available->set_uploaded_at(record.created_at);
    return msg;
}

wire::MessageWrapper file_uploaded(const FileRecord& record) {
    wire::MessageWrapper msg;
    auto* uploaded = msg.mutable_file_uploaded();
    uploaded->set_file_id(record.file_id);
    uploaded->set_filename(record.filename);
    uploaded->set_file_type(record.file_type);
    return msg;
}

wire::MessageWrapper file_deleted(const FileRecord& record, const std::string& device_label) {
    wire::MessageWrapper msg;
    auto* deleted = msg.mutable_file_deleted();
    deleted->set_file_id(record.file_id);
    deleted->set_filename(record.filename);
    deleted->set_device_info(device_label);
    return msg;
}

wire::MessageWrapper files_cleared() {
    wire::MessageWrapper msg;
    msg.mutable_files_cleared();
    return msg;
}

wire::MessageWrapper file_details(const FileRecord& record) {
    wire::MessageWrapper msg;
    auto* details = msg.mutable_file_details();
    details->set_file_id(record.file_id);
    details->set_name(record.filename);
    details->set_type(record.file_type);
    details->set_mime_type(record.mime_type);
    details->set_size(record.size);
    details->set_size_display(catalog::format_file_size(record.size));
    details->set_created(record.created_at);
    details->set_device_info(record.uploader);
    details->set_safe_path(record.safe_path.empty() ? record.filename : record.safe_path);
    if (record.manifest) {
        details->set_chunks(static_cast<uint32_t>(record.manifest->chunks.size()));
        details->set_chunk_size(record.manifest->chunk_size);
    }
    details->set_manifest_signature(record.manifest_signature.value_or(""));
    details->set_content_hash(record.content_hash);
    return msg;
}

// --- Transfer stream ---

wire::MessageWrapper file_manifest(const FileRecord& record) {
    wire::MessageWrapper msg;
    auto* manifest = msg.mutable_file_manifest();
    manifest->set_file_id(record.file_id);
    manifest->set_filename(record.filename);
    manifest->set_mime_type(record.mime_type);
    manifest->set_size(record.size);
    fill_manifest(*record.manifest, manifest->mutable_manifest());
    manifest->set_manifest_signature(*record.manifest_signature);
    return msg;
}

wire::MessageWrapper file_chunk(const std::string& file_id, const Chunk& chunk, const std::string& bytes) {
    wire::MessageWrapper msg;
    auto* out = msg.mutable_file_chunk();
    out->set_file_id(file_id);
    out->set_chunk_index(chunk.index);
    out->set_size(chunk.size);
    out->set_hash(chunk.hash);
    out->set_content(codec::base64_encode(bytes));
    return msg;
}

wire::MessageWrapper file_transfer_complete(const std::string& file_id) {
    wire::MessageWrapper msg;
    msg.mutable_file_transfer_complete()->set_file_id(file_id);
    return msg;
}

// --- Upload notifications ---

wire::MessageWrapper receiving_file(const std::string& filename, uint64_t size, const wire::DeviceInfo& device) {
    wire::MessageWrapper msg;
    auto* receiving = msg.mutable_receiving_file();
    receiving->set_filename(filename);
    receiving->set_size(size);
    *receiving->mutable_device_info() = device;
    receiving->set_progress(0);
    return msg;
}

wire::MessageWrapper receiving_progress(const std::string& filename, uint32_t progress, const wire::DeviceInfo& device) {
    wire::MessageWrapper msg;
    auto* receiving = msg.mutable_receiving_progress();
    receiving->set_filename(filename);
    receiving->set_progress(progress);
    *receiving->mutable_device_info() = device;
    return msg;
}

wire::MessageWrapper receiving_complete(const std::string& filename, const wire::DeviceInfo& device) {
    wire::MessageWrapper msg;
    auto* complete = msg.mutable_receiving_complete();
    complete->set_filename(filename);
    *complete->mutable_device_info() = device;
    return msg;
}

wire::MessageWrapper cancel_upload(const std::string& reason) {
    wire::MessageWrapper msg;
    msg.mutable_cancel_upload()->set_reason(reason);
    return msg;
}

wire::MessageWrapper error(ErrorKind kind, const std::string& message, const std::string& context) {
    wire::MessageWrapper msg;
    auto* err = msg.mutable_error();
    err->set_code(error_code(kind));
    err->set_message(message);
    err->set_status(http_status(kind));
    err->set_context(context);
    return msg;
}

} // namespace events
} // namespace roomcast
