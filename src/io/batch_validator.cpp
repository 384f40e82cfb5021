#include "io/batch_validator.hpp"
#include "io/marc_reader.hpp"
#include "core/error.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <string>

#include <tbb/blocked_range.h>
#include <tbb/combinable.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

namespace fastmarc {

namespace {

struct LocalTally {
    size_t valid = 0;
    uint64_t bytes = 0;
    std::vector<size_t> malformed;
};

} // namespace

ValidationSummary validate_records(const MarcReader& reader, int threads,
                                   size_t max_reported, const Logger* logger) {
    if (!reader.is_open())
        throw Error(ErrorKind::kClosed, "validate_records on a closed reader");

    const size_t n = reader.size();
    tbb::combinable<LocalTally> tls_tally;

    tbb::task_arena arena(threads > 0 ? threads : tbb::task_arena::automatic);
    arena.execute([&] {
        tbb::parallel_for(
            tbb::blocked_range<size_t>(0, n, 256),
            [&](const tbb::blocked_range<size_t>& range) {
                auto& tally = tls_tally.local();
                std::string buffer;
                for (size_t i = range.begin(); i != range.end(); ++i) {
                    std::string_view raw = reader.get_raw(i, buffer);
                    tally.bytes += raw.size();
                    try {
                        parse_marc_record(raw);
                        tally.valid++;
                    } catch (const Error& e) {
                        if (e.kind() != ErrorKind::kMalformedRecord) throw;
                        tally.malformed.push_back(i);
                        if (logger)
                            logger->debug("record %zu: %s", i, e.what());
                    }
                }
            });
    });

    ValidationSummary summary;
    std::vector<size_t> all_malformed;
    tls_tally.combine_each([&](const LocalTally& t) {
        summary.valid_records += t.valid;
        summary.total_bytes += t.bytes;
        all_malformed.insert(all_malformed.end(),
                             t.malformed.begin(), t.malformed.end());
    });

    summary.malformed_records = all_malformed.size();
    std::sort(all_malformed.begin(), all_malformed.end());
    if (all_malformed.size() > max_reported)
        all_malformed.resize(max_reported);
    summary.malformed_indices = std::move(all_malformed);
    return summary;
}

} // namespace fastmarc
