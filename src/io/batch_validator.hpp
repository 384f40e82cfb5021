#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace fastmarc {

class MarcReader;
class Logger;

struct ValidationSummary {
    size_t valid_records = 0;
    size_t malformed_records = 0;
    uint64_t total_bytes = 0;
    std::vector<size_t> malformed_indices;  // ascending, at most max_reported
};

// Materialize every indexed record on up to `threads` workers and tally
// the ones the record model rejects. Requires an open reader.
ValidationSummary validate_records(const MarcReader& reader, int threads,
                                   size_t max_reported = 100,
                                   const Logger* logger = nullptr);

} // namespace fastmarc
