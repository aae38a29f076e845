#include "manifest_signer.hpp"
#include "roomcast/codec_utils.hpp"

namespace roomcast {

std::string ManifestSigner::signing_payload(const Manifest& manifest) const {
    std::string chunk_hashes;
    for (size_t i = 0; i < manifest.chunks.size(); ++i) {
        if (i > 0) {
            chunk_hashes += '|';
        }
        chunk_hashes += manifest.chunks[i].hash;
    }
    return manifest.file_id + ":" + std::to_string(manifest.total_size) + ":" +
           std::to_string(manifest.chunks.size()) + ":" + chunk_hashes;
}

std::string ManifestSigner::sign(const Manifest& manifest) const {
    return codec::sha256_hex(signing_payload(manifest));
}

bool ManifestSigner::verify(const Manifest& manifest, const std::string& signature) const {
    return !signature.empty() && sign(manifest) == signature;
}

} // namespace roomcast
