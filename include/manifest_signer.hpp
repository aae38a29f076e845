#pragma once

#include "chunk_codec.hpp"
#include <string>

namespace roomcast {

// Deterministic SHA-256 signature over a manifest. The payload is the plain string
//   file_id:total_size:chunk_count:hash1|hash2|...|hashN
// so any receiver can rebuild the exact bytes without a serialization library.
class ManifestSigner {
public:
    std::string signing_payload(const Manifest& manifest) const;
    std::string sign(const Manifest& manifest) const;
    bool verify(const Manifest& manifest, const std::string& signature) const;
};

} // namespace roomcast
