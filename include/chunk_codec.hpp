#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace roomcast {

// Chunk size is fixed process-wide so sender and receiver hash the same slices (64 KB)
const uint32_t CHUNK_SIZE = 64 * 1024;

struct Chunk {
    uint32_t index = 0;
    uint64_t offset = 0;
    uint32_t size = 0;
    std::string hash; // SHA-256, lowercase hex
};

struct Manifest {
    std::string file_id;
    uint32_t chunk_size = CHUNK_SIZE;
    uint64_t total_size = 0;
    std::vector<Chunk> chunks;
};

class ChunkCodec {
public:
    // Splits the buffer into CHUNK_SIZE slices and hashes each one.
    // An empty buffer yields a manifest with no chunks; callers reject empty files first.
    Manifest split(const std::string& file_id, const std::string& bytes) const;

    // SHA-256 hex of the whole buffer
    std::string content_hash(const std::string& bytes) const;

    // Returns the bytes described by the chunk. Throws CorruptRecordError when the
    // chunk does not fit inside the buffer.
    std::string read_chunk(const std::string& bytes, const Chunk& chunk) const;

    // Receiver-side check of one chunk against its manifest entry
    bool verify_chunk(const Chunk& chunk, const std::string& data) const;

    // Chunks are contiguous from offset 0, indices ascend from 0 and sizes add up to total_size
    bool is_well_formed(const Manifest& manifest) const;
};

} // namespace roomcast
