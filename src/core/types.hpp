#pragma once

#include <cstdint>

namespace fastmarc {

// Location of one record inside the byte source.
struct IndexEntry {
    uint64_t offset;
    uint32_t length;  // 1..99999, prefix included
};

inline bool operator==(const IndexEntry& a, const IndexEntry& b) {
    return a.offset == b.offset && a.length == b.length;
}

enum class SourceKind : uint8_t {
    kMapped = 0,
    kStreaming = 1,
    kBuffered = 2,  // non-seekable handle drained into memory
};

inline const char* source_kind_name(SourceKind kind) {
    switch (kind) {
        case SourceKind::kMapped:    return "mapped";
        case SourceKind::kStreaming: return "streaming";
        case SourceKind::kBuffered:  return "buffered";
    }
    return "unknown";
}

} // namespace fastmarc
