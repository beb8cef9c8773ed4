#include "geoteams/bench_utils.hpp"
#include "geoteams/errors.hpp"
#include "geoteams/orchestrator.hpp"
#include "geoteams/point_generator.hpp"
#include "geoteams/team_names.hpp"

#include <omp.h>

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <vector>

using namespace geoteams;

static constexpr unsigned DATA_SEED = 42;
static constexpr int NUM_RUNS = 3;

// Unbuffered progress log to stderr so output appears immediately
// even when stdout is piped or redirected.
static void log_progress(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::fprintf(stderr, "[BENCH] ");
    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
    va_end(args);
}

// Usage: bench_partition [n_points] [k] [capacity]
int main(int argc, char** argv) {
    size_t n = 2000;
    int k = 40;
    size_t capacity = 0;
    if (argc >= 2) n = static_cast<size_t>(std::atoi(argv[1]));
    if (argc >= 3) k = std::atoi(argv[2]);
    if (argc >= 4) capacity = static_cast<size_t>(std::atoi(argv[3]));
    if (capacity == 0 && k > 0)
        capacity = (n + static_cast<size_t>(k) - 1) / static_cast<size_t>(k) + 2;

    std::printf("Threads: %d\n", omp_get_max_threads());
    std::printf("N=%zu K=%d capacity=%zu\n\n", n, k, capacity);

    auto points = generate_geo_clusters(n, std::max(1, k / 2),
                                        Coordinate{47.6, -122.2}, 1.5, DATA_SEED);

    PartitionRequest req;
    req.points = std::move(points);
    req.k = k;
    req.capacity = capacity;
    req.names = generate_team_names(static_cast<size_t>(std::max(k, 0)));
    req.seed = DATA_SEED;

    ClusteringOrchestrator orchestrator;

    print_run_stats_header();
    std::vector<RunStats> runs;
    for (int run = 0; run < NUM_RUNS; ++run) {
        log_progress("run %d starting", run);
        ScopedTimer t;
        PartitionResult res;
        try {
            res = orchestrator.run(req);
        } catch (const CapacityError& e) {
            std::fprintf(stderr, "capacity error (%s): %s\n", to_string(e.reason()), e.what());
            return 1;
        } catch (const InputError& e) {
            std::fprintf(stderr, "input error: %s\n", e.what());
            return 1;
        }
        runs.push_back(collect_run_stats(res, t.elapsed_ms()));
        log_progress("run %d done in %.1fms", run, runs.back().time_ms);
        print_run_stats(run, runs.back());
    }

    auto fastest = std::min_element(runs.begin(), runs.end(),
                                     [](const RunStats& a, const RunStats& b) {
                                         return a.time_ms < b.time_ms;
                                     });
    std::printf("\nbest: %.2f ms (%.1f points/ms)\n", fastest->time_ms,
                static_cast<double>(n) / std::max(fastest->time_ms, 1e-9));
    return 0;
}
