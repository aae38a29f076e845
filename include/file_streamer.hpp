#pragma once

#include "broadcast_gateway.hpp"
#include "chunk_codec.hpp"
#include "room_registry.hpp"
#include "roomcast/errors.hpp"
#include <memory>
#include <string>

namespace roomcast {

// Streams one resolved file to one connection: file_manifest, then every
// file_chunk in ascending index order, then file_transfer_complete.
// Each chunk is emitted from its own scheduled task, and only once the
// connection has drained below MAX_QUEUED_FRAMES.
class FileStreamer : public std::enable_shared_from_this<FileStreamer> {
public:
    FileStreamer(BroadcastGateway& gateway, Scheduler scheduler,
                 std::string connection_id, FileRecord record);

    // Validates the record and emits the manifest. Throws CorruptRecordError
    // before anything is emitted when the record cannot be streamed.
    void start();

    bool finished() const { return finished_; }
    size_t chunks_sent() const { return next_index_; }

private:
    void check_record() const;
    // Queues emit_next behind the connection's outbound backlog
    void schedule_next();
    void emit_next();
    void abandon(const Error& e);

    BroadcastGateway& gateway_;
    Scheduler scheduler_;
    std::string connection_id_;
    FileRecord record_;
    ChunkCodec codec_;
    size_t next_index_ = 0;
    bool finished_ = false;
};

} // namespace roomcast
