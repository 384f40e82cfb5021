#include "io/marc_reader.hpp"
#include "core/error.hpp"
#include "util/logger.hpp"

#include <sys/mman.h>

namespace fastmarc {

MarcReader::MarcReader(int fd, const ReaderOptions& options,
                       const Logger* logger)
    : logger_(logger) {
    std::unique_ptr<ByteSource> source =
        make_byte_source(fd, options.use_mmap, logger_);

    // One forward pass over the prefixes, then random access by index
    MmapFile* mapping = nullptr;
    if (source->kind() == SourceKind::kMapped) {
        mapping = &static_cast<MappedSource&>(*source).mapping();
        mapping->advise(MADV_SEQUENTIAL);
    }

    report_ = scan_boundaries(*source, index_);

    if (mapping) mapping->advise(MADV_RANDOM);

    kind_ = source->kind();
    source_size_ = source->size();
    source_ = std::move(source);

    if (logger_) {
        logger_->debug("Indexed %zu record(s) from %llu bytes (%s backend)",
                       index_.size(),
                       static_cast<unsigned long long>(source_size_),
                       source_kind_name(kind_));
        if (report_.trailing_bytes > 0) {
            logger_->debug("Scan stopped at offset %llu (%s); ignoring %llu trailing byte(s)",
                           static_cast<unsigned long long>(report_.stop_offset),
                           scan_stop_name(report_.stop),
                           static_cast<unsigned long long>(report_.trailing_bytes));
        }
    }
}

void MarcReader::check_open() const {
    if (!source_)
        throw Error(ErrorKind::kClosed, "access after close()");
}

const IndexEntry& MarcReader::entry(size_t i) const {
    check_open();
    return index_.at(i);
}

std::string_view MarcReader::get_raw(size_t i, std::string& buffer) const {
    check_open();
    const IndexEntry& e = index_.at(i);
    return source_->slice(e.offset, e.length, buffer);
}

MarcRecord MarcReader::get(size_t i) const {
    std::string buffer;
    return parse_marc_record(get_raw(i, buffer));
}

MarcReader::RecordRange MarcReader::iterate() const {
    check_open();
    return RecordRange(this);
}

void MarcReader::close() {
    source_.reset();
}

} // namespace fastmarc
