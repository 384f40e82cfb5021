#include "test_util.hpp"
#include "marc_test_fixture.hpp"
#include "core/config.hpp"
#include "index/boundary_scanner.hpp"
#include "index/record_index.hpp"
#include "io/byte_source.hpp"

#include <filesystem>
#include <string>
#include <vector>

using namespace fastmarc;
using namespace marc_fixture;

static std::string g_test_dir;

static const uint8_t* u8(const std::string& s) {
    return reinterpret_cast<const uint8_t*>(s.data());
}

// 3 x ("00025" + 20 filler bytes)
static std::string scenario_a() {
    std::string s;
    for (int i = 0; i < 3; i++)
        s += "00025" + std::string(20, static_cast<char>('a' + i));
    return s;
}

static void check_contiguous(const RecordIndex& idx, uint64_t size) {
    for (size_t i = 0; i + 1 < idx.size(); i++)
        CHECK_EQ(idx[i].offset + idx[i].length, idx[i + 1].offset);
    CHECK(idx.end_offset() <= size);
    if (!idx.empty()) CHECK_EQ(idx[0].offset, 0u);
}

// Run the scan on both backends and check they agree.
static ScanReport scan_both(const std::string& name, const std::string& data,
                            RecordIndex& out) {
    ScanReport mapped = scan_mapped(u8(data), data.size(), out);
    check_contiguous(out, data.size());

    std::string path = g_test_dir + "/" + name;
    write_file(path, data);
    int fd = open_read(path);
    CHECK(fd >= 0);

    StreamSource stream(fd);
    RecordIndex sidx;
    ScanReport streamed = scan_stream(stream, sidx);
    CHECK_EQ(stream.position(), 0u);
    ::close(fd);

    CHECK_EQ(sidx.size(), out.size());
    for (size_t i = 0; i < sidx.size() && i < out.size(); i++)
        CHECK(sidx[i] == out[i]);
    CHECK(streamed.stop == mapped.stop);
    CHECK_EQ(streamed.stop_offset, mapped.stop_offset);
    CHECK_EQ(streamed.trailing_bytes, mapped.trailing_bytes);
    return mapped;
}

static void test_scenario_a() {
    std::fprintf(stderr, "-- test_scenario_a\n");
    RecordIndex idx;
    ScanReport r = scan_both("a.mrc", scenario_a(), idx);
    CHECK_EQ(idx.size(), 3u);
    CHECK(idx.offsets() == (std::vector<uint64_t>{0, 25, 50}));
    CHECK_EQ(idx[1].length, 25u);
    CHECK(r.stop == ScanStop::kEndOfData);
    CHECK_EQ(r.trailing_bytes, 0u);
    CHECK_EQ(r.records, 3u);
}

static void test_scenario_b_overrun() {
    std::fprintf(stderr, "-- test_scenario_b_overrun\n");
    RecordIndex idx;
    ScanReport r = scan_both("b.mrc", "00010AB", idx);
    CHECK_EQ(idx.size(), 0u);
    CHECK(r.stop == ScanStop::kOverrun);
    CHECK_EQ(r.stop_offset, 0u);
    CHECK_EQ(r.trailing_bytes, 7u);
}

static void test_scenario_c_non_digit() {
    std::fprintf(stderr, "-- test_scenario_c_non_digit\n");
    RecordIndex idx;
    ScanReport r = scan_both("c.mrc", "0002X" + std::string(20, 'q'), idx);
    CHECK_EQ(idx.size(), 0u);
    CHECK(r.stop == ScanStop::kNonDigit);
    CHECK_EQ(r.stop_offset, 0u);
}

static void test_empty_input() {
    std::fprintf(stderr, "-- test_empty_input\n");
    RecordIndex idx;
    ScanReport r = scan_both("empty.mrc", "", idx);
    CHECK_EQ(idx.size(), 0u);
    CHECK(r.stop == ScanStop::kEndOfData);
    CHECK_EQ(r.trailing_bytes, 0u);
}

static void test_trailing_bytes_ignored() {
    std::fprintf(stderr, "-- test_trailing_bytes_ignored\n");
    const char* tails[] = {"\n", "\r\n", "000", "0002"};
    for (const char* tail : tails) {
        RecordIndex idx;
        std::string data = scenario_a() + tail;
        ScanReport r = scan_both("tail.mrc", data, idx);
        CHECK_EQ(idx.size(), 3u);
        CHECK(r.stop == ScanStop::kTruncatedPrefix);
        CHECK_EQ(r.stop_offset, 75u);
        CHECK_EQ(r.trailing_bytes, std::string(tail).size());
    }
}

static void test_garbage_mid_file() {
    std::fprintf(stderr, "-- test_garbage_mid_file\n");
    // Two good records, then a non-numeric prefix, then another good record
    std::string data = scenario_a().substr(0, 50) + "ABCDE" + std::string(20, 'x') +
                       "00025" + std::string(20, 'y');
    RecordIndex idx;
    ScanReport r = scan_both("mid.mrc", data, idx);
    CHECK_EQ(idx.size(), 2u);
    CHECK(r.stop == ScanStop::kNonDigit);
    CHECK_EQ(r.stop_offset, 50u);
    CHECK_EQ(r.trailing_bytes, data.size() - 50);
}

static void test_zero_length() {
    std::fprintf(stderr, "-- test_zero_length\n");
    std::string data = "00010abcde" + std::string("00000") + std::string(10, 'z');
    RecordIndex idx;
    ScanReport r = scan_both("zero.mrc", data, idx);
    CHECK_EQ(idx.size(), 1u);
    CHECK(r.stop == ScanStop::kZeroLength);
    CHECK_EQ(r.stop_offset, 10u);
}

static void test_minimal_lengths() {
    std::fprintf(stderr, "-- test_minimal_lengths\n");
    // Declared length 5 is the prefix alone
    std::string data = "00005" "00005" "00007xy";
    RecordIndex idx;
    ScanReport r = scan_both("min.mrc", data, idx);
    CHECK_EQ(idx.size(), 3u);
    CHECK(idx.offsets() == (std::vector<uint64_t>{0, 5, 10}));
    CHECK(r.stop == ScanStop::kEndOfData);

    // Length 3 overlaps its own prefix; the next prefix starts at offset 3
    std::string overlap = "00003010" + std::string(3005, 'x');
    RecordIndex oidx;
    ScanReport o = scan_both("overlap.mrc", overlap, oidx);
    CHECK_EQ(oidx.size(), 2u);
    CHECK(oidx.offsets() == (std::vector<uint64_t>{0, 3}));
    CHECK_EQ(oidx[1].length, 3010u);
    CHECK(o.stop == ScanStop::kEndOfData);
}

static void test_real_records() {
    std::fprintf(stderr, "-- test_real_records\n");
    std::string data;
    std::vector<size_t> lengths;
    for (int i = 0; i < 50; i++) {
        std::string rec = sample_record(i);
        lengths.push_back(rec.size());
        data += rec;
    }
    RecordIndex idx;
    scan_both("real.mrc", data, idx);
    CHECK_EQ(idx.size(), 50u);
    uint64_t off = 0;
    for (size_t i = 0; i < idx.size(); i++) {
        CHECK_EQ(idx[i].offset, off);
        CHECK_EQ(idx[i].length, lengths[i]);
        off += lengths[i];
    }
}

static void test_scan_boundaries_dispatch() {
    std::fprintf(stderr, "-- test_scan_boundaries_dispatch\n");
    std::string path = g_test_dir + "/dispatch.mrc";
    write_file(path, scenario_a());
    int fd = open_read(path);
    CHECK(fd >= 0);

    auto mapped = make_byte_source(fd, true, nullptr);
    CHECK(mapped->kind() == SourceKind::kMapped);
    RecordIndex midx;
    scan_boundaries(*mapped, midx);
    CHECK_EQ(midx.size(), 3u);
    CHECK(midx.capacity() >= kMinIndexCapacity);

    auto streamed = make_byte_source(fd, false, nullptr);
    CHECK(streamed->kind() == SourceKind::kStreaming);
    RecordIndex sidx;
    scan_boundaries(*streamed, sidx);
    CHECK_EQ(sidx.size(), 3u);

    ::close(fd);
}

int main() {
    g_test_dir = "/tmp/fastmarc_scanner_test";
    std::filesystem::create_directories(g_test_dir);

    test_scenario_a();
    test_scenario_b_overrun();
    test_scenario_c_non_digit();
    test_empty_input();
    test_trailing_bytes_ignored();
    test_garbage_mid_file();
    test_zero_length();
    test_minimal_lengths();
    test_real_records();
    test_scan_boundaries_dispatch();

    std::filesystem::remove_all(g_test_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
