#include "test_util.hpp"
#include "marc_test_fixture.hpp"
#include "io/byte_source.hpp"
#include "io/mmap_file.hpp"

#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>

#include <filesystem>
#include <string>

using namespace fastmarc;
using namespace marc_fixture;

static std::string g_test_dir;
static const std::string kContent = "0001234567890001098765";

static void test_mmap_regular_file() {
    std::fprintf(stderr, "-- test_mmap_regular_file\n");
    std::string path = g_test_dir + "/plain.bin";
    write_file(path, kContent);

    int fd = open_read(path);
    CHECK(fd >= 0);
    {
        MmapFile m;
        CHECK(m.open(fd));
        CHECK(m.is_open());
        CHECK_EQ(m.size(), kContent.size());
        CHECK(std::string(reinterpret_cast<const char*>(m.data()), m.size()) == kContent);
        CHECK(m.advise(MADV_RANDOM));
        CHECK(m.advise(MADV_SEQUENTIAL));

        MmapFile moved(std::move(m));
        CHECK(!m.is_open());
        CHECK(moved.is_open());
        moved.close();
        CHECK(!moved.is_open());
        moved.close();
    }
    // The descriptor still belongs to us
    CHECK(::fcntl(fd, F_GETFD) != -1);
    ::close(fd);
}

static void test_mmap_rejects() {
    std::fprintf(stderr, "-- test_mmap_rejects\n");

    std::string path = g_test_dir + "/empty.bin";
    write_file(path, "");
    int fd = open_read(path);
    MmapFile m;
    std::string reason;
    CHECK(!m.open(fd, &reason));
    CHECK(!reason.empty());
    ::close(fd);

    int fds[2];
    CHECK(::pipe(fds) == 0);
    reason.clear();
    CHECK(!m.open(fds[0], &reason));
    CHECK(reason == "not a regular file");
    ::close(fds[0]);
    ::close(fds[1]);

    CHECK(!m.open(-1));
}

static void test_fallback_selection() {
    std::fprintf(stderr, "-- test_fallback_selection\n");

    std::string path = g_test_dir + "/plain.bin";
    write_file(path, kContent);
    int fd = open_read(path);

    auto mapped = make_byte_source(fd, true, nullptr);
    CHECK(mapped->kind() == SourceKind::kMapped);
    CHECK_EQ(mapped->size(), kContent.size());

    auto forced = make_byte_source(fd, false, nullptr);
    CHECK(forced->kind() == SourceKind::kStreaming);
    CHECK_EQ(forced->size(), kContent.size());
    ::close(fd);

    std::string empty = g_test_dir + "/empty.bin";
    write_file(empty, "");
    fd = open_read(empty);
    auto from_empty = make_byte_source(fd, true, nullptr);
    CHECK(from_empty->kind() == SourceKind::kStreaming);
    CHECK_EQ(from_empty->size(), 0u);
    ::close(fd);

    int fds[2];
    CHECK(::pipe(fds) == 0);
    CHECK(is_unseekable(fds[0]));
    CHECK(::write(fds[1], kContent.data(), kContent.size()) ==
          static_cast<ssize_t>(kContent.size()));
    ::close(fds[1]);
    auto from_pipe = make_byte_source(fds[0], true, nullptr);
    CHECK(from_pipe->kind() == SourceKind::kBuffered);
    CHECK_EQ(from_pipe->size(), kContent.size());
    std::string buf;
    CHECK(from_pipe->slice(12, 10, buf) == kContent.substr(12, 10));
    CHECK(buf.empty());
    CHECK_THROWS_KIND(from_pipe->slice(20, 5, buf), ErrorKind::kShortRead);
    ::close(fds[0]);

    // Draining a pipe with no data and a closed writer gives an empty source
    CHECK(::pipe(fds) == 0);
    ::close(fds[1]);
    auto drained = make_byte_source(fds[0], false, nullptr);
    CHECK(drained->kind() == SourceKind::kBuffered);
    CHECK_EQ(drained->size(), 0u);
    ::close(fds[0]);

    CHECK(!is_unseekable(-1));
}

static void test_slices_agree() {
    std::fprintf(stderr, "-- test_slices_agree\n");

    std::string path = g_test_dir + "/plain.bin";
    write_file(path, kContent);
    int fd = open_read(path);

    MappedSource mapped;
    CHECK(mapped.open(fd));
    StreamSource stream(fd);

    std::string mbuf, sbuf;
    CHECK(mapped.slice(5, 10, mbuf) == kContent.substr(5, 10));
    CHECK(mbuf.empty());
    CHECK(stream.slice(5, 10, sbuf) == kContent.substr(5, 10));
    CHECK_EQ(sbuf.size(), 10u);
    CHECK(mapped.slice(0, static_cast<uint32_t>(kContent.size()), mbuf) == kContent);
    CHECK(stream.slice(0, static_cast<uint32_t>(kContent.size()), sbuf) == kContent);

    // Slicing never moves the descriptor offset
    off_t before = ::lseek(fd, 0, SEEK_CUR);
    stream.slice(12, 5, sbuf);
    CHECK_EQ(::lseek(fd, 0, SEEK_CUR), before);
    CHECK_EQ(stream.position(), 0u);

    ::close(fd);
}

static void test_short_read() {
    std::fprintf(stderr, "-- test_short_read\n");

    std::string path = g_test_dir + "/plain.bin";
    write_file(path, kContent);
    int fd = open_read(path);

    MappedSource mapped;
    CHECK(mapped.open(fd));
    StreamSource stream(fd);
    std::string buf;
    uint32_t n = static_cast<uint32_t>(kContent.size());

    CHECK_THROWS_KIND(mapped.slice(n - 2, 5, buf), ErrorKind::kShortRead);
    CHECK_THROWS_KIND(mapped.slice(n + 10, 1, buf), ErrorKind::kShortRead);
    CHECK_THROWS_KIND(stream.slice(n - 2, 5, buf), ErrorKind::kShortRead);
    CHECK_THROWS_KIND(stream.slice(n + 10, 1, buf), ErrorKind::kShortRead);

    ::close(fd);
}

static void test_stream_cursor() {
    std::fprintf(stderr, "-- test_stream_cursor\n");

    std::string path = g_test_dir + "/plain.bin";
    write_file(path, kContent);
    int fd = open_read(path);

    StreamSource stream(fd);
    uint8_t buf[5];
    CHECK_EQ(stream.read(buf, 5), 5u);
    CHECK(std::string(reinterpret_cast<char*>(buf), 5) == "00012");
    CHECK_EQ(stream.position(), 5u);

    stream.seek(12);
    CHECK_EQ(stream.read(buf, 5), 5u);
    CHECK(std::string(reinterpret_cast<char*>(buf), 5) == "00010");

    stream.seek(kContent.size() - 2);
    CHECK_EQ(stream.read(buf, 5), 2u);
    CHECK_EQ(stream.position(), kContent.size());

    ::close(fd);
}

int main() {
    g_test_dir = "/tmp/fastmarc_byte_source_test";
    std::filesystem::create_directories(g_test_dir);

    test_mmap_regular_file();
    test_mmap_rejects();
    test_fallback_selection();
    test_slices_agree();
    test_short_read();
    test_stream_cursor();

    std::filesystem::remove_all(g_test_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
