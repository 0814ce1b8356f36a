#include "edit_error.hpp"

namespace collab {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Conflict:        return "conflict";
        case ErrorKind::OutOfRange:      return "out_of_range";
        case ErrorKind::NotFound:        return "not_found";
        case ErrorKind::AlreadyExists:   return "already_exists";
        case ErrorKind::EncodingError:   return "encoding_error";
        case ErrorKind::IOFailure:       return "io_failure";
        case ErrorKind::InvalidArgument: return "invalid_argument";
    }
    return "unknown";
}

bool is_retryable(ErrorKind kind) {
    return kind == ErrorKind::Conflict || kind == ErrorKind::OutOfRange;
}

} // namespace collab
