#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "core/types.hpp"
#include "index/boundary_scanner.hpp"
#include "index/record_index.hpp"
#include "io/byte_source.hpp"
#include "marc/marc_record.hpp"

namespace fastmarc {

class Logger;

struct ReaderOptions {
    bool use_mmap = true;  // false forces streaming reads
};

// Indexed random access over a file of length-prefixed records.
//
// The constructor maps (or, failing that, streams) the caller's descriptor
// and scans it once. Pipes and sockets are read to end of input and served
// from memory. The descriptor is never closed here. After close(),
// entry(), get_raw(), get() and iterate() throw Error(kClosed); size() and
// seek_map() keep describing the index that was built.
//
// get() and get_raw() may be called concurrently. Each iterate() call
// returns a range whose iterators carry their own position, so several
// passes over one reader never interfere.
class MarcReader {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = MarcRecord;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = MarcRecord;

        Iterator() = default;
        Iterator(const MarcReader* reader, size_t pos)
            : reader_(reader), pos_(pos) {}

        // One slice and one materialization per dereference.
        MarcRecord operator*() const { return reader_->get(pos_); }
        Iterator& operator++() { ++pos_; return *this; }
        Iterator operator++(int) { Iterator tmp = *this; ++pos_; return tmp; }

        size_t position() const { return pos_; }

        bool operator==(const Iterator& o) const { return pos_ == o.pos_; }
        bool operator!=(const Iterator& o) const { return pos_ != o.pos_; }

    private:
        const MarcReader* reader_ = nullptr;
        size_t pos_ = 0;
    };

    class RecordRange {
    public:
        explicit RecordRange(const MarcReader* reader) : reader_(reader) {}
        Iterator begin() const { return Iterator(reader_, 0); }
        Iterator end() const { return Iterator(reader_, reader_->size()); }

    private:
        const MarcReader* reader_;
    };

    // Throws Error(kAllocationFailure) if the index cannot be built, and
    // Error(kShortRead) if an unseekable input fails while being buffered.
    explicit MarcReader(int fd, const ReaderOptions& options = ReaderOptions(),
                        const Logger* logger = nullptr);

    MarcReader(const MarcReader&) = delete;
    MarcReader& operator=(const MarcReader&) = delete;

    size_t size() const { return index_.size(); }
    bool is_open() const { return source_ != nullptr; }

    SourceKind backend() const { return kind_; }
    uint64_t source_size() const { return source_size_; }
    const ScanReport& scan_report() const { return report_; }

    // Record start offsets in file order.
    std::vector<uint64_t> seek_map() const { return index_.offsets(); }

    const IndexEntry& entry(size_t i) const;

    // Raw record bytes. Zero-copy on the mapped backend; the view is valid
    // until close() or until buffer is reused.
    std::string_view get_raw(size_t i, std::string& buffer) const;

    // Materialized record. Throws Error(kMalformedRecord) if the record
    // body does not decode.
    MarcRecord get(size_t i) const;

    RecordRange iterate() const;

    // Release the mapping or drop the stream cursor. Idempotent.
    void close();

private:
    void check_open() const;

    std::unique_ptr<ByteSource> source_;
    RecordIndex index_;
    ScanReport report_;
    SourceKind kind_ = SourceKind::kStreaming;
    uint64_t source_size_ = 0;
    const Logger* logger_ = nullptr;
};

} // namespace fastmarc
