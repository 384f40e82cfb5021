#include "core/error.hpp"
#include "core/version.hpp"
#include "io/marc_reader.hpp"
#include "marc/marc_record.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <numeric>
#include <string>
#include <vector>

using namespace fastmarc;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options] <file.mrc>\n"
        "\n"
        "Measures index construction and iteration over an existing index.\n"
        "\n"
        "Options:\n"
        "  -repeats <int>           Runs per measurement (default: 3)\n"
        "  -no_mmap                 Force streaming reads\n"
        "  -v, --verbose            Verbose output\n"
        "  -q, --quiet              Errors only\n"
        "  -h, --help               Show this help\n",
        prog);
}

static double seconds_since(std::chrono::steady_clock::time_point t0) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
}

static void report(const char* title, const std::vector<double>& times) {
    std::printf("\n--- %s ---\nruns:", title);
    for (double t : times) std::printf(" %.4fs", t);
    double best = *std::min_element(times.begin(), times.end());
    double mean = std::accumulate(times.begin(), times.end(), 0.0) /
                  static_cast<double>(times.size());
    std::printf("\nbest: %.4fs   mean: %.4fs\n", best, mean);
}

static int open_or_report(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0)
        std::fprintf(stderr, "Error: cannot open '%s': %s\n",
                     path.c_str(), std::strerror(errno));
    return fd;
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "fastmarcbench")) return 0;

    if (cli.has("-h") || cli.has("--help") || cli.positional().size() != 1) {
        print_usage(argv[0]);
        return cli.positional().size() != 1 ? 1 : 0;
    }
    const std::string path = cli.positional()[0];

    int repeats = cli.get_int("-repeats", 3);
    if (repeats < 1) {
        std::fprintf(stderr, "Error: -repeats must be >= 1\n");
        return 1;
    }

    Logger logger = make_logger(cli);
    ReaderOptions opts;
    opts.use_mmap = !cli.has("-no_mmap");

    try {
        // Index build: open + count, fresh descriptor per run
        std::vector<double> build_times;
        size_t count = 0;
        for (int r = 0; r < repeats; r++) {
            auto t0 = std::chrono::steady_clock::now();
            int fd = open_or_report(path);
            if (fd < 0) return 1;
            {
                MarcReader reader(fd, opts, &logger);
                count = reader.size();
            }
            ::close(fd);
            build_times.push_back(seconds_since(t0));
        }

        // Iteration only, over an index built once
        std::vector<double> iter_times;
        int fd = open_or_report(path);
        if (fd < 0) return 1;
        {
            MarcReader reader(fd, opts, &logger);
            logger.debug("Backend: %s", source_kind_name(reader.backend()));
            for (int r = 0; r < repeats; r++) {
                auto t0 = std::chrono::steady_clock::now();
                size_t seen = 0;
                size_t fields = 0;
                auto range = reader.iterate();
                for (auto it = range.begin(); it != range.end(); ++it) {
                    try {
                        MarcRecord rec = *it;
                        fields += rec.fields.size();
                    } catch (const Error& e) {
                        if (e.kind() != ErrorKind::kMalformedRecord) throw;
                        logger.debug("record %zu: %s", it.position(), e.what());
                    }
                    seen++;
                }
                iter_times.push_back(seconds_since(t0));
                logger.debug("iteration %d visited %zu record(s), %zu field(s)",
                             r, seen, fields);
            }
        }
        ::close(fd);

        std::printf("Records: %zu\n", count);
        report("index build (open + record count)", build_times);
        report("iteration only (index already built)", iter_times);
    } catch (const Error& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
    return 0;
}
