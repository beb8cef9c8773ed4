#include "geoteams/metrics.hpp"
#include "geoteams/partitioner.hpp"

#include <cmath>

namespace geoteams {

double compute_inertia(const double* data, size_t n, const int* labels,
                       const double* centroids, int k) {
    // Sequential on purpose: the sum must not depend on thread count.
    double total = 0.0;
    for (size_t i = 0; i < n; ++i) {
        int l = labels[i];
        if (l < 0 || l >= k) continue;
        const double* x = data + i * kCoordDim;
        const double* c = centroids + static_cast<size_t>(l) * kCoordDim;
        double s = 0.0;
        for (int j = 0; j < kCoordDim; ++j) {
            double d = x[j] - c[j];
            s += d * d;
        }
        total += s;
    }
    return total;
}

std::vector<size_t> compute_group_sizes(const int* labels, size_t n, int k) {
    std::vector<size_t> sizes(static_cast<size_t>(k), 0);
    for (size_t i = 0; i < n; ++i) {
        int l = labels[i];
        if (l >= 0 && l < k)
            sizes[static_cast<size_t>(l)]++;
    }
    return sizes;
}

double compute_group_size_stddev(const std::vector<size_t>& sizes) {
    if (sizes.empty()) return 0.0;
    double sum = 0.0;
    for (size_t s : sizes) sum += static_cast<double>(s);
    double mean = sum / static_cast<double>(sizes.size());
    double var = 0.0;
    for (size_t s : sizes) {
        double d = static_cast<double>(s) - mean;
        var += d * d;
    }
    return std::sqrt(var / static_cast<double>(sizes.size()));
}

int count_empty_groups(const std::vector<size_t>& sizes) {
    int cnt = 0;
    for (size_t s : sizes)
        if (s == 0) ++cnt;
    return cnt;
}

}  // namespace geoteams
