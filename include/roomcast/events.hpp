#pragma once

#include "roomcast.pb.h"
#include "room_registry.hpp"
#include "roomcast/errors.hpp"
#include <string>
#include <vector>

namespace roomcast {
namespace events {

// Name of the populated oneof field, e.g. "file_chunk"; empty when no event is set
std::string event_name(const wire::MessageWrapper& msg);

// Local time, ISO-8601 with microseconds
std::string format_iso_time(SystemTime time);

// --- Conversions ---
void fill_device(const DeviceInfo& device, wire::DeviceInfo* out);
void fill_manifest(const Manifest& manifest, wire::Manifest* out);
Manifest from_proto(const wire::Manifest& manifest);

// --- Outbound events, one builder per event ---
wire::MessageWrapper connection_ready(const std::string& connection_id);
wire::MessageWrapper room_created(const std::string& room_code);
wire::MessageWrapper room_joined(const std::string& room_code, size_t file_count, size_t device_count);
wire::MessageWrapper devices_updated(const std::vector<DeviceInfo>& devices);

wire::MessageWrapper file_available(const FileRecord& record);
wire::MessageWrapper file_uploaded(const FileRecord& record);
wire::MessageWrapper file_deleted(const FileRecord& record, const std::string& device_label);
wire::MessageWrapper files_cleared();
wire::MessageWrapper file_details(const FileRecord& record);

// Records passed here have already been validated by RoomRegistry::resolve_file
wire::MessageWrapper file_manifest(const FileRecord& record);
wire::MessageWrapper file_chunk(const std::string& file_id, const Chunk& chunk, const std::string& bytes);
wire::MessageWrapper file_transfer_complete(const std::string& file_id);

wire::MessageWrapper receiving_file(const std::string& filename, uint64_t size, const wire::DeviceInfo& device);
wire::MessageWrapper receiving_progress(const std::string& filename, uint32_t progress, const wire::DeviceInfo& device);
wire::MessageWrapper receiving_complete(const std::string& filename, const wire::DeviceInfo& device);
wire::MessageWrapper cancel_upload(const std::string& reason);

wire::MessageWrapper error(ErrorKind kind, const std::string& message, const std::string& context);

} // namespace events
} // namespace roomcast
