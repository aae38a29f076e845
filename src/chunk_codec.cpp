#include "chunk_codec.hpp"
#include "roomcast/codec_utils.hpp"
#include "roomcast/errors.hpp"

namespace roomcast {

Manifest ChunkCodec::split(const std::string& file_id, const std::string& bytes) const {
    Manifest manifest;
    manifest.file_id = file_id;
    manifest.chunk_size = CHUNK_SIZE;
    manifest.total_size = bytes.size();
    manifest.chunks.reserve((bytes.size() + CHUNK_SIZE - 1) / CHUNK_SIZE);

    uint64_t offset = 0;
    uint32_t index = 0;
    while (offset < bytes.size()) {
        uint64_t remaining = bytes.size() - offset;
        uint32_t size = remaining < CHUNK_SIZE ? static_cast<uint32_t>(remaining) : CHUNK_SIZE;

        Chunk chunk;
        chunk.index = index++;
        chunk.offset = offset;
        chunk.size = size;
        chunk.hash = codec::sha256_hex(bytes.data() + offset, size);
        manifest.chunks.push_back(std::move(chunk));

        offset += size;
    }
    return manifest;
}

std::string ChunkCodec::content_hash(const std::string& bytes) const {
    return codec::sha256_hex(bytes);
}

std::string ChunkCodec::read_chunk(const std::string& bytes, const Chunk& chunk) const {
    if (chunk.offset > bytes.size() || chunk.size > bytes.size() - chunk.offset) {
        throw CorruptRecordError("Chunk " + std::to_string(chunk.index) +
                                 " lies outside the stored content");
    }
    return bytes.substr(chunk.offset, chunk.size);
}

bool ChunkCodec::verify_chunk(const Chunk& chunk, const std::string& data) const {
    return data.size() == chunk.size && codec::sha256_hex(data) == chunk.hash;
}

bool ChunkCodec::is_well_formed(const Manifest& manifest) const {
    uint64_t expected_offset = 0;
    for (size_t i = 0; i < manifest.chunks.size(); ++i) {
        const Chunk& chunk = manifest.chunks[i];
        if (chunk.index != i || chunk.offset != expected_offset ||
            chunk.size == 0 || chunk.size > manifest.chunk_size) {
            return false;
        }
        expected_offset += chunk.size;
    }
    return expected_offset == manifest.total_size;
}

} // namespace roomcast
