#pragma once

#include <cstdint>
#include <cstddef>

#include "core/config.hpp"

namespace fastmarc {

// Decode an ASCII decimal field of n digits, most significant first.
// Returns -1 if any byte is not '0'..'9'.
inline int64_t decode_decimal(const uint8_t* p, size_t n) {
    int64_t value = 0;
    for (size_t i = 0; i < n; i++) {
        uint8_t c = p[i];
        if (c < '0' || c > '9') return -1;
        value = value * 10 + (c - '0');
    }
    return value;
}

// Decode the 5-digit record length prefix at p.
inline int64_t decode_length_prefix(const uint8_t* p) {
    return decode_decimal(p, kLengthPrefixDigits);
}

} // namespace fastmarc
