#pragma once

#include <string>
#include <cstdint>

namespace roomcast {
namespace catalog {

// Category from the extension: image, video, audio, document, code, text,
// archive, executable or other
std::string classify_file_type(const std::string& filename);

// MIME type from the extension, "application/octet-stream" when unknown
std::string guess_mime_type(const std::string& filename);

// "146.48 KB" style, base 1024
std::string format_file_size(uint64_t bytes);

// Reduces a peer-supplied path to a logical relative path for display.
// Drops empty, "." and ".." segments. Throws ValidationError on control characters.
std::string sanitize_relative_path(const std::string& path);

// Last path segment of a filename, accepting either separator
std::string base_name(const std::string& filename);

// Trims and uppercases; throws ValidationError unless 6 characters of [A-Z0-9]
std::string normalize_room_code(const std::string& code);

// Throws ValidationError unless 1..64 characters of [0-9a-fA-F-]
void validate_file_id(const std::string& file_id);

} // namespace catalog
} // namespace roomcast
