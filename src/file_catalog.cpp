#include "roomcast/file_catalog.hpp"
#include "roomcast/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <vector>

namespace roomcast {
namespace catalog {

namespace {

struct TypeEntry {
    const char* extension;
    const char* category;
    const char* mime;
};

// Extension table shared by classification and MIME guessing
const std::vector<TypeEntry>& type_table() {
    static const std::vector<TypeEntry> table = {
        {".jpg", "image", "image/jpeg"},
        {".jpeg", "image", "image/jpeg"},
        {".png", "image", "image/png"},
        {".gif", "image", "image/gif"},
        {".bmp", "image", "image/bmp"},
        {".webp", "image", "image/webp"},
        {".svg", "image", "image/svg+xml"},
        {".ico", "image", "image/x-icon"},

        {".mp4", "video", "video/mp4"},
        {".webm", "video", "video/webm"},
        {".avi", "video", "video/x-msvideo"},
        {".mov", "video", "video/quicktime"},
        {".mkv", "video", "video/x-matroska"},
        {".flv", "video", "video/x-flv"},
        {".wmv", "video", "video/x-ms-wmv"},

        {".mp3", "audio", "audio/mpeg"},
        {".wav", "audio", "audio/wav"},
        {".ogg", "audio", "audio/ogg"},
        {".m4a", "audio", "audio/mp4"},
        {".flac", "audio", "audio/flac"},
        {".aac", "audio", "audio/aac"},

        {".pdf", "document", "application/pdf"},
        {".doc", "document", "application/msword"},
        {".docx", "document", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".xls", "document", "application/vnd.ms-excel"},
        {".xlsx", "document", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".ppt", "document", "application/vnd.ms-powerpoint"},
        {".pptx", "document", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},

        {".py", "code", "text/x-python"},
        {".js", "code", "text/javascript"},
        {".html", "code", "text/html"},
        {".css", "code", "text/css"},
        {".json", "code", "application/json"},
        {".xml", "code", "text/xml"},
        {".java", "code", "text/x-java"},
        {".cpp", "code", "text/x-c++"},
        {".c", "code", "text/x-c"},
        {".cs", "code", "text/x-csharp"},
        {".php", "code", "text/x-php"},
        {".rb", "code", "text/x-ruby"},
        {".go", "code", "text/x-go"},
        {".ts", "code", "text/typescript"},
        {".jsx", "code", "text/javascript"},
        {".tsx", "code", "text/typescript"},

        {".txt", "text", "text/plain"},
        {".md", "text", "text/markdown"},
        {".csv", "text", "text/csv"},
        {".log", "text", "text/plain"},
        {".ini", "text", "text/plain"},
        {".conf", "text", "text/plain"},
        {".yml", "text", "text/plain"},
        {".yaml", "text", "text/plain"},

        {".zip", "archive", "application/zip"},
        {".rar", "archive", "application/x-rar-compressed"},
        {".7z", "archive", "application/x-7z-compressed"},
        {".tar", "archive", "application/x-tar"},
        {".gz", "archive", "application/gzip"},
        {".bz2", "archive", "application/x-bzip2"},

        {".exe", "executable", "application/x-msdownload"},
        {".msi", "executable", "application/x-msi"},
        {".app", "executable", "application/x-executable"},
        {".dmg", "executable", "application/x-apple-diskimage"},
        {".deb", "executable", "application/vnd.debian.binary-package"},
        {".rpm", "executable", "application/x-rpm"},
    };
    return table;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string extension_of(const std::string& filename) {
    std::string name = base_name(filename);
    size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return "";
    }
    return to_lower(name.substr(dot));
}

const TypeEntry* find_entry(const std::string& filename) {
    std::string ext = extension_of(filename);
    if (ext.empty()) {
        return nullptr;
    }
    for (const auto& entry : type_table()) {
        if (ext == entry.extension) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace

std::string classify_file_type(const std::string& filename) {
    const TypeEntry* entry = find_entry(filename);
    return entry ? entry->category : "other";
}

std::string guess_mime_type(const std::string& filename) {
    const TypeEntry* entry = find_entry(filename);
    return entry ? entry->mime : "application/octet-stream";
}

std::string format_file_size(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        ++unit;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f %s", size, units[unit]);
    return std::string(buf);
}

std::string sanitize_relative_path(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;

    auto flush = [&]() {
        if (!current.empty() && current != "." && current != "..") {
            parts.push_back(current);
        }
        current.clear();
    };

    for (char c : path) {
        if (std::iscntrl(static_cast<unsigned char>(c))) {
            throw ValidationError("Path contains control characters");
        }
        if (c == '/' || c == '\\') {
            flush();
        } else {
            current += c;
        }
    }
    flush();

    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += '/';
        }
        result += parts[i];
    }

    // Leading and trailing blanks around the whole path are not significant
    size_t first = result.find_first_not_of(' ');
    size_t last = result.find_last_not_of(' ');
    if (first == std::string::npos) {
        return "";
    }
    return result.substr(first, last - first + 1);
}

std::string base_name(const std::string& filename) {
    size_t sep = filename.find_last_of("/\\");
    return sep == std::string::npos ? filename : filename.substr(sep + 1);
}

std::string normalize_room_code(const std::string& code) {
    size_t first = code.find_first_not_of(" \t\r\n");
    size_t last = code.find_last_not_of(" \t\r\n");
    std::string normalized = first == std::string::npos ? "" : code.substr(first, last - first + 1);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    bool valid = normalized.size() == 6 &&
                 std::all_of(normalized.begin(), normalized.end(), [](unsigned char c) {
                     return std::isdigit(c) || (c >= 'A' && c <= 'Z');
                 });
    if (!valid) {
        throw ValidationError("Room code must be 6 characters from A-Z and 0-9");
    }
    return normalized;
}

void validate_file_id(const std::string& file_id) {
    bool valid = !file_id.empty() && file_id.size() <= 64 &&
                 std::all_of(file_id.begin(), file_id.end(), [](unsigned char c) {
                     return std::isxdigit(c) || c == '-';
                 });
    if (!valid) {
        throw ValidationError("Invalid file_id");
    }
}

} // namespace catalog
} // namespace roomcast
