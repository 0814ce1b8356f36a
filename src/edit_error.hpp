#pragma once
#include <stdexcept>
#include <string>

namespace collab {

enum class ErrorKind {
    Conflict,        // hash or range-hash mismatch, caller should re-read and retry
    OutOfRange,      // invalid line bounds
    NotFound,        // missing file for a non-create operation
    AlreadyExists,   // create without overwrite on an existing path
    EncodingError,   // content not decodable as text in the requested encoding
    IOFailure,       // disk or permission failure during read or commit
    InvalidArgument, // request failed argument validation
};

// Stable snake_case name used in tool error payloads
const char* error_kind_name(ErrorKind kind);

// Conflict and OutOfRange are ordinary user-facing errors the caller can
// recover from by re-reading or correcting the request.
bool is_retryable(ErrorKind kind);

class EditError : public std::runtime_error {
public:
    EditError(ErrorKind kind, const std::string& message, bool stale_range = false)
        : std::runtime_error(message), kind_(kind), stale_range_(stale_range) {}

    ErrorKind kind() const { return kind_; }

    // True for a Conflict raised by a range hash that no longer matches
    // the lines currently at that position.
    bool stale_range() const { return stale_range_; }

private:
    ErrorKind kind_;
    bool stale_range_;
};

} // namespace collab
