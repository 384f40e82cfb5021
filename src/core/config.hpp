#pragma once

#include <cstdint>
#include <cstddef>

namespace fastmarc {

// Record framing: every record starts with a zero-padded decimal length
// that counts the whole record, prefix included.
inline constexpr size_t kLengthPrefixDigits = 5;

// Index capacity heuristic: one slot per KiB of source, never below the floor.
inline constexpr size_t kMinIndexCapacity = 4096;
inline constexpr uint64_t kBytesPerIndexSlot = 1024;

// ISO 2709 delimiters
inline constexpr char kSubfieldDelimiter = '\x1F';
inline constexpr char kFieldTerminator = '\x1E';
inline constexpr char kRecordTerminator = '\x1D';

inline constexpr size_t kLeaderLength = 24;
inline constexpr size_t kDirectoryEntryLength = 12;

inline constexpr size_t initial_index_capacity(uint64_t source_size) {
    uint64_t slots = source_size / kBytesPerIndexSlot;
    return slots < kMinIndexCapacity ? kMinIndexCapacity
                                     : static_cast<size_t>(slots);
}

} // namespace fastmarc
