#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "core/types.hpp"
#include "io/mmap_file.hpp"

namespace fastmarc {

class Logger;

// Raw byte access to the records file. slice() is stateless on both
// variants, so concurrent slices against one source are safe.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual SourceKind kind() const = 0;
    virtual uint64_t size() const = 0;

    // Bytes [offset, offset + length). Mapped sources return a view into the
    // mapping and leave buffer untouched; streaming sources fill buffer.
    // Throws Error(kShortRead) if fewer than length bytes are available.
    virtual std::string_view slice(uint64_t offset, uint32_t length,
                                   std::string& buffer) const = 0;
};

// Zero-copy view over a private read-only mapping.
class MappedSource : public ByteSource {
public:
    bool open(int fd, std::string* error = nullptr);

    SourceKind kind() const override { return SourceKind::kMapped; }
    uint64_t size() const override { return mmap_.size(); }
    std::string_view slice(uint64_t offset, uint32_t length,
                           std::string& buffer) const override;

    const uint8_t* data() const { return mmap_.data(); }
    MmapFile& mapping() { return mmap_; }

private:
    MmapFile mmap_;
};

// Seek-and-read access through a descriptor the caller keeps owning.
// The scan cursor (seek/read) is private to this object; slice() uses
// positioned reads and never moves it, nor the descriptor's file offset.
class StreamSource : public ByteSource {
public:
    explicit StreamSource(int fd);

    SourceKind kind() const override { return SourceKind::kStreaming; }
    uint64_t size() const override { return size_; }
    std::string_view slice(uint64_t offset, uint32_t length,
                           std::string& buffer) const override;

    uint64_t position() const { return pos_; }
    void seek(uint64_t pos) { pos_ = pos; }

    // Read up to n bytes at the cursor and advance it. Returns bytes read.
    size_t read(uint8_t* dst, size_t n);

private:
    size_t read_at(uint64_t offset, uint8_t* dst, size_t n) const;

    int fd_;
    uint64_t size_ = 0;
    uint64_t pos_ = 0;
};

// Pipes, sockets and character devices can be neither mapped nor seeked.
// Their contents are read to end of input once and served from memory.
class BufferedSource : public ByteSource {
public:
    // Drain fd. Throws Error(kShortRead) on a read error and
    // Error(kAllocationFailure) if the contents do not fit in memory.
    explicit BufferedSource(int fd);

    SourceKind kind() const override { return SourceKind::kBuffered; }
    uint64_t size() const override { return data_.size(); }
    std::string_view slice(uint64_t offset, uint32_t length,
                           std::string& buffer) const override;

    const uint8_t* data() const {
        return reinterpret_cast<const uint8_t*>(data_.data());
    }

private:
    std::string data_;
};

// True if fd refers to a pipe, socket or character device.
bool is_unseekable(int fd);

// Try a mapped source first; on any mapping failure fall back to streaming.
// Unseekable handles are buffered instead. The choice is logged at debug
// level and otherwise invisible.
std::unique_ptr<ByteSource> make_byte_source(int fd, bool try_mmap,
                                             const Logger* logger);

} // namespace fastmarc
