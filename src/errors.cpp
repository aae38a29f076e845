#include "roomcast/errors.hpp"

namespace roomcast {

const char* error_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:          return "not_found";
        case ErrorKind::Full:              return "room_full";
        case ErrorKind::CorruptRecord:     return "corrupt_record";
        case ErrorKind::DecodeFailure:     return "decode_failure";
        case ErrorKind::ValidationFailure: return "validation_failure";
        case ErrorKind::Internal:          return "internal_error";
    }
    return "unknown";
}

unsigned int http_status(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:          return 404;
        case ErrorKind::Full:              return 403;
        case ErrorKind::ValidationFailure: return 400;
        case ErrorKind::CorruptRecord:
        case ErrorKind::DecodeFailure:
        case ErrorKind::Internal:          return 500;
    }
    return 500;
}

} // namespace roomcast
