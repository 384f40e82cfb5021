#include "io/info_report.hpp"
#include "io/marc_reader.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>

namespace fastmarc {

namespace {

struct LengthStats {
    uint32_t min_length = 0;
    uint32_t max_length = 0;
    double mean_length = 0.0;
    uint64_t indexed_bytes = 0;
};

LengthStats compute_length_stats(const MarcReader& reader) {
    LengthStats st;
    const size_t n = reader.size();
    if (n == 0) return st;

    st.min_length = UINT32_MAX;
    for (size_t i = 0; i < n; i++) {
        uint32_t len = reader.entry(i).length;
        st.min_length = std::min(st.min_length, len);
        st.max_length = std::max(st.max_length, len);
        st.indexed_bytes += len;
    }
    st.mean_length = static_cast<double>(st.indexed_bytes) / static_cast<double>(n);
    return st;
}

} // namespace

Json::Value build_info_json(const MarcReader& reader, bool include_seek_map) {
    LengthStats st = compute_length_stats(reader);
    const ScanReport& scan = reader.scan_report();

    Json::Value result;
    result["records"] = static_cast<Json::UInt64>(reader.size());
    result["backend"] = source_kind_name(reader.backend());
    result["source_size"] = static_cast<Json::UInt64>(reader.source_size());
    result["indexed_bytes"] = static_cast<Json::UInt64>(st.indexed_bytes);
    result["trailing_bytes"] = static_cast<Json::UInt64>(scan.trailing_bytes);
    result["stop_reason"] = scan_stop_name(scan.stop);
    result["stop_offset"] = static_cast<Json::UInt64>(scan.stop_offset);
    result["min_record_length"] = st.min_length;
    result["max_record_length"] = st.max_length;
    result["mean_record_length"] = st.mean_length;

    if (include_seek_map) {
        Json::Value offsets(Json::arrayValue);
        for (uint64_t off : reader.seek_map())
            offsets.append(static_cast<Json::UInt64>(off));
        result["seek_map"] = offsets;
    }
    return result;
}

std::string format_info_text(const MarcReader& reader) {
    LengthStats st = compute_length_stats(reader);
    const ScanReport& scan = reader.scan_report();

    char buf[512];
    std::snprintf(buf, sizeof(buf),
        "Records:         %zu\n"
        "Backend:         %s\n"
        "Source size:     %llu bytes\n"
        "Indexed bytes:   %llu\n"
        "Trailing bytes:  %llu (%s at offset %llu)\n"
        "Record length:   min %u, max %u, mean %.1f\n",
        reader.size(),
        source_kind_name(reader.backend()),
        static_cast<unsigned long long>(reader.source_size()),
        static_cast<unsigned long long>(st.indexed_bytes),
        static_cast<unsigned long long>(scan.trailing_bytes),
        scan_stop_name(scan.stop),
        static_cast<unsigned long long>(scan.stop_offset),
        st.min_length, st.max_length, st.mean_length);
    return buf;
}

} // namespace fastmarc
