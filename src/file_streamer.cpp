#include "file_streamer.hpp"
#include "manifest_signer.hpp"
#include "roomcast/events.hpp"
#include <iostream>

namespace roomcast {

FileStreamer::FileStreamer(BroadcastGateway& gateway, Scheduler scheduler,
                           std::string connection_id, FileRecord record)
    : gateway_(gateway),
      scheduler_(std::move(scheduler)),
      connection_id_(std::move(connection_id)),
      record_(std::move(record)) {}

void FileStreamer::check_record() const {
    if (!record_.content || !record_.manifest || !record_.manifest_signature) {
        throw CorruptRecordError("Missing manifest data");
    }
    const Manifest& manifest = *record_.manifest;
    if (record_.content->size() != manifest.total_size || !codec_.is_well_formed(manifest)) {
        throw CorruptRecordError("Stored content does not match its manifest");
    }
    if (!ManifestSigner().verify(manifest, *record_.manifest_signature)) {
        throw CorruptRecordError("Stored manifest signature does not verify");
    }
}

void FileStreamer::start() {
    check_record();

    std::cout << "[Stream] Sending " << record_.file_id << " (" << record_.manifest->chunks.size()
              << " chunks) to " << connection_id_ << std::endl;

    if (!gateway_.emit_to(connection_id_, events::file_manifest(record_))) {
        finished_ = true;
        return;
    }
    schedule_next();
}

void FileStreamer::schedule_next() {
    auto self = shared_from_this();
    bool connected = gateway_.when_writable(connection_id_, [self]() {
        self->scheduler_([self]() { self->emit_next(); });
    });
    if (!connected) {
        finished_ = true;
    }
}

void FileStreamer::emit_next() {
    if (finished_) {
        return;
    }
    const auto& chunks = record_.manifest->chunks;

    if (next_index_ >= chunks.size()) {
        gateway_.emit_to(connection_id_, events::file_transfer_complete(record_.file_id));
        finished_ = true;
        std::cout << "[Stream] Completed " << record_.file_id << " to " << connection_id_ << std::endl;
        return;
    }

    const Chunk& chunk = chunks[next_index_];
    try {
        std::string bytes = codec_.read_chunk(*record_.content, chunk);
        if (!gateway_.emit_to(connection_id_, events::file_chunk(record_.file_id, chunk, bytes))) {
            std::cout << "[Stream] " << connection_id_ << " went away, dropping " << record_.file_id << std::endl;
            finished_ = true;
            return;
        }
    } catch (const Error& e) {
        abandon(e);
        return;
    }

    ++next_index_;
    schedule_next();
}

void FileStreamer::abandon(const Error& e) {
    std::cerr << "[Stream] Abandoning " << record_.file_id << ": " << e.what() << std::endl;
    finished_ = true;
    gateway_.emit_to(connection_id_, events::error(e.kind(), e.what(), "request_file"));
}

} // namespace roomcast
