#pragma once

#include <cstddef>
#include <cstdint>

#include "index/record_index.hpp"

namespace fastmarc {

class ByteSource;
class StreamSource;

// Why the scan stopped. Only kEndOfData means the source was consumed
// exactly; the others leave trailing bytes that are ignored.
enum class ScanStop : uint8_t {
    kEndOfData,        // cursor == size
    kTruncatedPrefix,  // 1-4 bytes left, too few for a length prefix
    kNonDigit,         // a prefix byte is not '0'..'9'
    kZeroLength,       // prefix decodes to 0
    kOverrun,          // declared length runs past the end of the source
};

const char* scan_stop_name(ScanStop stop);

struct ScanReport {
    ScanStop stop = ScanStop::kEndOfData;
    uint64_t stop_offset = 0;     // cursor position where scanning ended
    uint64_t trailing_bytes = 0;  // size - stop_offset
    size_t records = 0;
};

// Scan a contiguous in-memory view (mapped or buffered), reading prefixes
// in place.
ScanReport scan_mapped(const uint8_t* data, uint64_t size, RecordIndex& index);

// Scan through the stream cursor: read each prefix, then seek over the
// record body without reading it. The cursor is rewound to 0 afterwards.
ScanReport scan_stream(StreamSource& source, RecordIndex& index);

// Dispatch on the source kind. Index storage is pre-sized from the source
// size. Throws Error(kAllocationFailure) if the index cannot grow.
ScanReport scan_boundaries(ByteSource& source, RecordIndex& index);

} // namespace fastmarc
