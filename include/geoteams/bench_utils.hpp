#ifndef GEOTEAMS_BENCH_UTILS_HPP
#define GEOTEAMS_BENCH_UTILS_HPP

#include "metrics.hpp"
#include "types.hpp"

#include <sys/resource.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <vector>

namespace geoteams {

// Wall-clock milliseconds since construction.
class ScopedTimer {
public:
    ScopedTimer() : start_(std::chrono::steady_clock::now()) {}
    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(
                   std::chrono::steady_clock::now() - start_).count();
    }
private:
    std::chrono::steady_clock::time_point start_;
};

// Peak resident set size in MB (ru_maxrss is in kB on Linux).
inline double peak_rss_mb() {
    struct rusage ru {};
    if (getrusage(RUSAGE_SELF, &ru) != 0) return 0.0;
    return static_cast<double>(ru.ru_maxrss) / 1024.0;
}

// One orchestrator run as reported by the benchmark.
struct RunStats {
    double time_ms = 0.0;
    double inertia = 0.0;
    int kmeans_iterations = 0;
    size_t redistribution_moves = 0;
    size_t outliers = 0;
    size_t warnings = 0;
    size_t group_size_min = 0;
    size_t group_size_max = 0;
    double group_size_stddev = 0.0;
    int empty_groups = 0;
    double memory_mb = 0.0;
};

inline RunStats collect_run_stats(const PartitionResult& res, double time_ms) {
    RunStats s;
    s.time_ms = time_ms;
    s.inertia = res.inertia;
    s.kmeans_iterations = res.kmeans_iterations;
    s.redistribution_moves = res.redistribution_moves;
    s.outliers = res.outliers.size();
    s.warnings = res.warnings.size();
    for (const auto& g : res.groups) s.warnings += g.warnings.size();

    std::vector<size_t> sizes;
    sizes.reserve(res.groups.size());
    for (const auto& g : res.groups) sizes.push_back(g.size());
    if (!sizes.empty()) {
        auto [lo, hi] = std::minmax_element(sizes.begin(), sizes.end());
        s.group_size_min = *lo;
        s.group_size_max = *hi;
    }
    s.group_size_stddev = compute_group_size_stddev(sizes);
    s.empty_groups = count_empty_groups(sizes);
    s.memory_mb = peak_rss_mb();
    return s;
}

inline void print_run_stats_header() {
    std::printf("%-5s %10s %12s %6s %6s %5s %5s %5s %5s %8s %6s %8s\n",
                "run", "time_ms", "inertia", "iters", "moves", "outl", "warn",
                "min", "max", "size_sd", "empty", "rss_mb");
}

inline void print_run_stats(int run, const RunStats& s) {
    std::printf("%-5d %10.2f %12.6g %6d %6zu %5zu %5zu %5zu %5zu %8.3f %6d %8.1f\n",
                run, s.time_ms, s.inertia, s.kmeans_iterations,
                s.redistribution_moves, s.outliers, s.warnings,
                s.group_size_min, s.group_size_max, s.group_size_stddev,
                s.empty_groups, s.memory_mb);
}

}  // namespace geoteams

#endif  // GEOTEAMS_BENCH_UTILS_HPP
