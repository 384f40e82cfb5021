#pragma once

#include <stdexcept>
#include <string>

namespace fastmarc {

enum class ErrorKind {
    kAllocationFailure,
    kShortRead,
    kIndexOutOfRange,
    kClosed,
    kMalformedRecord,
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kAllocationFailure: return "allocation failure";
        case ErrorKind::kShortRead:         return "short read";
        case ErrorKind::kIndexOutOfRange:   return "index out of range";
        case ErrorKind::kClosed:            return "reader closed";
        case ErrorKind::kMalformedRecord:   return "malformed record";
    }
    return "unknown error";
}

// Raised for caller misuse and unrecoverable I/O. Malformed data past the
// last good record boundary is never reported through this type.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& what)
        : std::runtime_error(std::string(error_kind_name(kind)) + ": " + what),
          kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace fastmarc
