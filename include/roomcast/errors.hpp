#pragma once

#include <stdexcept>
#include <string>

namespace roomcast {

enum class ErrorKind {
    NotFound,
    Full,
    CorruptRecord,
    DecodeFailure,
    ValidationFailure,
    Internal
};

// Wire code carried in the "error" event
const char* error_code(ErrorKind kind);

// HTTP-equivalent status for the error kind (4xx caller error, 5xx server fault)
unsigned int http_status(ErrorKind kind);

// Base for faults the room service reports back to the requesting connection.
// Expected absence (unknown room, unknown file, full room) is never thrown.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class CorruptRecordError : public Error {
public:
    explicit CorruptRecordError(const std::string& message)
        : Error(ErrorKind::CorruptRecord, message) {}
};

class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& message)
        : Error(ErrorKind::DecodeFailure, message) {}
};

class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message)
        : Error(ErrorKind::ValidationFailure, message) {}
};

} // namespace roomcast
