#include "index/boundary_scanner.hpp"
#include "core/config.hpp"
#include "core/length_prefix.hpp"
#include "io/byte_source.hpp"

namespace fastmarc {

const char* scan_stop_name(ScanStop stop) {
    switch (stop) {
        case ScanStop::kEndOfData:       return "end_of_data";
        case ScanStop::kTruncatedPrefix: return "truncated_prefix";
        case ScanStop::kNonDigit:        return "non_digit";
        case ScanStop::kZeroLength:      return "zero_length";
        case ScanStop::kOverrun:         return "overrun";
    }
    return "unknown";
}

// Classify a decoded prefix at cursor i. Returns true if a record of
// length len may be appended.
static bool accept_length(int64_t len, uint64_t i, uint64_t size,
                          ScanStop& stop) {
    if (len < 0) {
        stop = ScanStop::kNonDigit;
        return false;
    }
    if (len == 0) {
        stop = ScanStop::kZeroLength;
        return false;
    }
    if (i + static_cast<uint64_t>(len) > size) {
        stop = ScanStop::kOverrun;
        return false;
    }
    return true;
}

static ScanReport finish(ScanStop stop, uint64_t i, uint64_t size,
                         const RecordIndex& index) {
    ScanReport report;
    if (stop == ScanStop::kEndOfData && i < size)
        stop = ScanStop::kTruncatedPrefix;
    report.stop = stop;
    report.stop_offset = i;
    report.trailing_bytes = size - i;
    report.records = index.size();
    return report;
}

ScanReport scan_mapped(const uint8_t* data, uint64_t size, RecordIndex& index) {
    ScanStop stop = ScanStop::kEndOfData;
    uint64_t i = 0;
    while (i + kLengthPrefixDigits <= size) {
        int64_t len = decode_length_prefix(data + i);
        if (!accept_length(len, i, size, stop)) break;
        index.append(i, static_cast<uint32_t>(len));
        i += static_cast<uint64_t>(len);
    }
    return finish(stop, i, size, index);
}

ScanReport scan_stream(StreamSource& source, RecordIndex& index) {
    const uint64_t size = source.size();
    ScanStop stop = ScanStop::kEndOfData;
    uint8_t prefix[kLengthPrefixDigits];

    source.seek(0);
    uint64_t i = 0;
    while (i + kLengthPrefixDigits <= size) {
        if (source.read(prefix, kLengthPrefixDigits) < kLengthPrefixDigits) {
            // File shrank under us; nothing more can be trusted.
            stop = ScanStop::kTruncatedPrefix;
            break;
        }
        int64_t len = decode_length_prefix(prefix);
        if (!accept_length(len, i, size, stop)) break;
        index.append(i, static_cast<uint32_t>(len));
        // Jump over the body; lengths below the prefix width move backwards
        i += static_cast<uint64_t>(len);
        source.seek(i);
    }
    source.seek(0);
    return finish(stop, i, size, index);
}

ScanReport scan_boundaries(ByteSource& source, RecordIndex& index) {
    index.reserve_for(source.size());
    if (source.kind() == SourceKind::kMapped) {
        auto& mapped = static_cast<MappedSource&>(source);
        return scan_mapped(mapped.data(), mapped.size(), index);
    }
    if (source.kind() == SourceKind::kBuffered) {
        auto& buffered = static_cast<BufferedSource&>(source);
        return scan_mapped(buffered.data(), buffered.size(), index);
    }
    return scan_stream(static_cast<StreamSource&>(source), index);
}

} // namespace fastmarc
