#include "index/record_index.hpp"
#include "core/error.hpp"

#include <new>
#include <string>

namespace fastmarc {

void RecordIndex::grow_to(size_t new_capacity) {
    try {
        entries_.reserve(new_capacity);
    } catch (const std::bad_alloc&) {
        throw Error(ErrorKind::kAllocationFailure,
                    "cannot grow record index to " +
                    std::to_string(new_capacity) + " entries");
    } catch (const std::length_error&) {
        throw Error(ErrorKind::kAllocationFailure,
                    "record index capacity limit reached at " +
                    std::to_string(entries_.size()) + " entries");
    }
}

void RecordIndex::reserve(size_t entries) {
    if (entries > entries_.capacity())
        grow_to(entries);
}

void RecordIndex::append(uint64_t offset, uint32_t length) {
    if (entries_.size() == entries_.capacity()) {
        size_t cap = entries_.capacity();
        grow_to(cap < kMinIndexCapacity ? kMinIndexCapacity : cap * 2);
    }
    entries_.push_back(IndexEntry{offset, length});
}

const IndexEntry& RecordIndex::at(size_t i) const {
    if (i >= entries_.size()) {
        throw Error(ErrorKind::kIndexOutOfRange,
                    "record " + std::to_string(i) + " requested, index holds " +
                    std::to_string(entries_.size()));
    }
    return entries_[i];
}

uint64_t RecordIndex::end_offset() const {
    if (entries_.empty()) return 0;
    const IndexEntry& last = entries_.back();
    return last.offset + last.length;
}

std::vector<uint64_t> RecordIndex::offsets() const {
    std::vector<uint64_t> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_)
        out.push_back(e.offset);
    return out;
}

} // namespace fastmarc
