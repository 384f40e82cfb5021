#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/config.hpp"
#include "core/types.hpp"

namespace fastmarc {

// Ordered (offset, length) entries in file order. Filled once by the
// boundary scanner, read-only afterwards.
class RecordIndex {
public:
    using const_iterator = std::vector<IndexEntry>::const_iterator;

    // Ensure room for at least `entries` entries.
    // Throws Error(kAllocationFailure) if the storage cannot be obtained.
    void reserve(size_t entries);

    // Pre-size storage for a source of source_size bytes.
    void reserve_for(uint64_t source_size) {
        reserve(initial_index_capacity(source_size));
    }

    // Append the entry that starts where the previous one ended.
    // Storage doubles when full. Throws Error(kAllocationFailure).
    void append(uint64_t offset, uint32_t length);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    size_t capacity() const { return entries_.capacity(); }

    const IndexEntry& operator[](size_t i) const { return entries_[i]; }

    // Bounds-checked access. Throws Error(kIndexOutOfRange).
    const IndexEntry& at(size_t i) const;

    // First byte past the last indexed record (0 when empty).
    uint64_t end_offset() const;

    // Copy of every entry's offset, in file order.
    std::vector<uint64_t> offsets() const;

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    void grow_to(size_t new_capacity);

    std::vector<IndexEntry> entries_;
};

} // namespace fastmarc
