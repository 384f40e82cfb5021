#include "core/error.hpp"
#include "core/version.hpp"
#include "io/batch_validator.hpp"
#include "io/info_report.hpp"
#include "io/marc_reader.hpp"
#include "marc/marc_record.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>

#include <json/json.h>
#include <tbb/global_control.h>

using namespace fastmarc;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options] <file.mrc>\n"
        "\n"
        "Options:\n"
        "  -json                    Print the summary as JSON\n"
        "  -seekmap                 Include record start offsets\n"
        "  -dump <index>            Print one record's fields\n"
        "  -validate                Decode every record and report malformed ones\n"
        "  -threads <int>           Threads for -validate (default: all cores)\n"
        "  -no_mmap                 Force streaming reads\n"
        "  -v, --verbose            Verbose output\n"
        "  -q, --quiet              Errors only\n"
        "  -h, --help               Show this help\n"
        "  --version                Print version\n",
        prog);
}

static void dump_record(const MarcRecord& rec, size_t index) {
    std::printf("=== record %zu (%u bytes)\n", index, rec.record_length());
    std::printf("LDR  %s\n", rec.leader.c_str());
    for (const auto& f : rec.fields) {
        if (f.is_control_field()) {
            std::printf("%s  %s\n", f.tag.c_str(), f.data.c_str());
            continue;
        }
        std::string line = f.tag + " " + f.indicator1 + f.indicator2;
        for (const auto& sf : f.subfields) {
            line += " $";
            line += sf.code;
            line += sf.value;
        }
        std::printf("%s\n", line.c_str());
    }
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "fastmarcinfo")) return 0;

    if (cli.has("-h") || cli.has("--help") || argc < 2) {
        print_usage(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    if (cli.positional().size() != 1) {
        std::fprintf(stderr, "Error: exactly one input file is required\n");
        print_usage(argv[0]);
        return 1;
    }
    const std::string path = cli.positional()[0];

    Logger logger = make_logger(cli);

    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        std::fprintf(stderr, "Error: cannot open '%s': %s\n",
                     path.c_str(), std::strerror(errno));
        return 1;
    }

    int rc = 0;
    try {
        ReaderOptions opts;
        opts.use_mmap = !cli.has("-no_mmap");
        MarcReader reader(fd, opts, &logger);

        if (cli.has("-json")) {
            Json::StreamWriterBuilder wb;
            wb["indentation"] = "  ";
            std::cout << Json::writeString(wb, build_info_json(reader, cli.has("-seekmap")))
                      << "\n";
        } else {
            std::fputs(format_info_text(reader).c_str(), stdout);
            if (cli.has("-seekmap")) {
                for (uint64_t off : reader.seek_map())
                    std::printf("%llu\n", static_cast<unsigned long long>(off));
            }
        }

        if (cli.has("-dump")) {
            int idx = cli.get_int("-dump", -1);
            if (idx < 0) {
                std::fprintf(stderr, "Error: -dump requires a non-negative index\n");
                rc = 1;
            } else {
                dump_record(reader.get(static_cast<size_t>(idx)),
                            static_cast<size_t>(idx));
            }
        }

        if (rc == 0 && cli.has("-validate")) {
            int threads = resolve_threads(cli);
            tbb::global_control gc(tbb::global_control::max_allowed_parallelism, threads);
            logger.info("Validating %zu record(s) (threads=%d)", reader.size(), threads);

            ValidationSummary vs = validate_records(reader, threads, 20, &logger);
            logger.info("Valid: %zu, malformed: %zu, bytes: %llu",
                        vs.valid_records, vs.malformed_records,
                        static_cast<unsigned long long>(vs.total_bytes));
            for (size_t i : vs.malformed_indices)
                logger.warn("Malformed record at index %zu (offset %llu)", i,
                            static_cast<unsigned long long>(reader.entry(i).offset));
            if (vs.malformed_records > 0) rc = 2;
        }

        reader.close();
    } catch (const Error& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        rc = 1;
    }

    ::close(fd);
    return rc;
}
