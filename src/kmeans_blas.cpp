#include "geoteams/kmeans_blas.hpp"
#include "geoteams/errors.hpp"
#include "geoteams/log.hpp"
#include "geoteams/metrics.hpp"

#include <absl/strings/str_format.h>
#include <cblas.h>
#include <omp.h>

#include <algorithm>
#include <cstring>
#include <limits>

namespace geoteams {

namespace {

inline double sqnorm(const double* x) {
    double s = 0.0;
    for (int j = 0; j < kCoordDim; ++j) s += x[j] * x[j];
    return s;
}

inline double l2sq(const double* a, const double* b) {
    double s = 0.0;
    for (int j = 0; j < kCoordDim; ++j) {
        double t = a[j] - b[j];
        s += t * t;
    }
    return s;
}

}  // namespace

std::vector<double> flatten_coordinates(const std::vector<Coordinate>& coords) {
    std::vector<double> data(coords.size() * kCoordDim);
    for (size_t i = 0; i < coords.size(); ++i) {
        data[i * kCoordDim] = coords[i].latitude;
        data[i * kCoordDim + 1] = coords[i].longitude;
    }
    return data;
}

BlasKMeans::BlasKMeans(const KMeansConfig& cfg) : cfg_(cfg) {
    if (cfg_.max_iter == 0)
        throw InputError("KMeansConfig: max_iter must be > 0");
    if (cfg_.n_init < kMinRestarts)
        throw InputError(absl::StrFormat(
            "KMeansConfig: n_init must be at least %zu (got %zu)",
            kMinRestarts, cfg_.n_init));
}

std::string BlasKMeans::name() const { return "BLAS"; }

void BlasKMeans::kmeanspp_init(const double* data, size_t n, int k,
                               std::mt19937& rng,
                               std::vector<double>& centroids) const {
    centroids.assign(static_cast<size_t>(k) * kCoordDim, 0.0);

    std::uniform_int_distribution<size_t> uidx(0, n - 1);
    size_t first = uidx(rng);
    std::memcpy(centroids.data(), data + first * kCoordDim,
                kCoordDim * sizeof(double));

    std::vector<double> min_dist(n);
    for (size_t i = 0; i < n; ++i)
        min_dist[i] = l2sq(data + i * kCoordDim, centroids.data());

    for (int cc = 1; cc < k; ++cc) {
        double total = 0.0;
        for (size_t i = 0; i < n; ++i) total += min_dist[i];

        size_t chosen;
        if (total <= 0.0) {
            // Every point already coincides with a centre.
            chosen = uidx(rng);
        } else {
            std::uniform_real_distribution<double> u(0.0, total);
            double r = u(rng);
            chosen = 0;
            for (; chosen < n; ++chosen) {
                r -= min_dist[chosen];
                if (r < 0.0) break;
            }
            chosen = std::min(chosen, n - 1);
        }

        double* c_new = centroids.data() + static_cast<size_t>(cc) * kCoordDim;
        std::memcpy(c_new, data + chosen * kCoordDim, kCoordDim * sizeof(double));

        for (size_t i = 0; i < n; ++i) {
            double d = l2sq(data + i * kCoordDim, c_new);
            if (d < min_dist[i]) min_dist[i] = d;
        }
    }
}

long BlasKMeans::assign(const double* data, const double* data_norms,
                        size_t n, int k, const std::vector<double>& centroids,
                        std::vector<double>& dist_buf,
                        std::vector<double>& centroid_norms, int* labels) const {
    for (int c = 0; c < k; ++c)
        centroid_norms[c] =
            sqnorm(centroids.data() + static_cast<size_t>(c) * kCoordDim);

    // dist_buf[i,c] = -2 * x_i . c_c
    cblas_dgemm(CblasRowMajor, CblasNoTrans, CblasTrans,
                static_cast<int>(n), k, kCoordDim,
                -2.0,
                data, kCoordDim,
                centroids.data(), kCoordDim,
                0.0,
                dist_buf.data(), k);

    // ||x-c||^2 = ||x||^2 - 2 x.c + ||c||^2, argmin with lowest index on ties.
    long changed = 0;
    #pragma omp parallel for reduction(+:changed) schedule(static)
    for (size_t i = 0; i < n; ++i) {
        const double* row = dist_buf.data() + i * static_cast<size_t>(k);
        double dn = data_norms[i];
        int best = 0;
        double best_val = row[0] + dn + centroid_norms[0];
        for (int c = 1; c < k; ++c) {
            double v = row[c] + dn + centroid_norms[c];
            if (v < best_val) { best_val = v; best = c; }
        }
        if (labels[i] != best) {
            labels[i] = best;
            ++changed;
        }
    }
    return changed;
}

PartitionLabels BlasKMeans::run_once(const double* data,
                                     const double* data_norms, size_t n,
                                     int k, std::mt19937& rng) const {
    PartitionLabels out;
    kmeanspp_init(data, n, k, rng, out.centroids);
    out.labels.assign(n, -1);

    std::vector<double> centroid_norms(static_cast<size_t>(k));
    std::vector<double> dist_buf(n * static_cast<size_t>(k));
    std::vector<double> sums(static_cast<size_t>(k) * kCoordDim);
    std::vector<size_t> counts(static_cast<size_t>(k));
    int* labels = out.labels.data();

    bool converged = false;
    for (size_t iter = 0; iter < cfg_.max_iter; ++iter) {
        long changed = assign(data, data_norms, n, k, out.centroids, dist_buf,
                              centroid_norms, labels);
        out.iterations = static_cast<int>(iter + 1);
        if (changed == 0) {
            converged = true;
            break;
        }

        std::fill(sums.begin(), sums.end(), 0.0);
        std::fill(counts.begin(), counts.end(), 0);
        for (size_t i = 0; i < n; ++i) {
            int l = labels[i];
            const double* x = data + i * kCoordDim;
            double* s = sums.data() + static_cast<size_t>(l) * kCoordDim;
            for (int j = 0; j < kCoordDim; ++j) s[j] += x[j];
            counts[l]++;
        }
        for (int c = 0; c < k; ++c) {
            if (counts[c] == 0) continue;  // empty cluster keeps its centre
            double inv = 1.0 / static_cast<double>(counts[c]);
            double* cv = out.centroids.data() + static_cast<size_t>(c) * kCoordDim;
            for (int j = 0; j < kCoordDim; ++j)
                cv[j] = sums[static_cast<size_t>(c) * kCoordDim + j] * inv;
        }
    }
    // Hitting max_iter leaves labels one update behind the centroids.
    if (!converged)
        assign(data, data_norms, n, k, out.centroids, dist_buf, centroid_norms,
               labels);

    out.inertia = compute_inertia(data, n, out.labels.data(),
                                  out.centroids.data(), k);
    return out;
}

PartitionLabels BlasKMeans::partition(const double* data, size_t n, int k,
                                      unsigned seed) const {
    if (k < 1)
        throw InputError(absl::StrFormat(
            "Number of groups must be at least 1 (got %d)", k));
    if (static_cast<size_t>(k) > n)
        throw InputError(absl::StrFormat(
            "Cannot create %d groups with only %zu points", k, n));
    if (!data)
        throw InputError("BlasKMeans::partition: null data");

    double mean[kCoordDim] = {};
    for (size_t i = 0; i < n; ++i)
        for (int j = 0; j < kCoordDim; ++j) mean[j] += data[i * kCoordDim + j];
    for (int j = 0; j < kCoordDim; ++j) mean[j] /= static_cast<double>(n);

    std::vector<double> centred(n * kCoordDim);
    std::vector<double> data_norms(n);
    #pragma omp parallel for schedule(static)
    for (size_t i = 0; i < n; ++i) {
        for (int j = 0; j < kCoordDim; ++j)
            centred[i * kCoordDim + j] = data[i * kCoordDim + j] - mean[j];
        data_norms[i] = sqnorm(centred.data() + i * kCoordDim);
    }

    PartitionLabels best;
    best.inertia = std::numeric_limits<double>::infinity();
    for (size_t r = 0; r < cfg_.n_init; ++r) {
        std::seed_seq seq{seed, static_cast<unsigned>(r)};
        std::mt19937 rng(seq);
        PartitionLabels run = run_once(centred.data(), data_norms.data(), n, k, rng);
        GEOTEAMS_LOG("kmeans", "restart=%zu inertia=%.9g iters=%d",
                     r, run.inertia, run.iterations);
        if (run.inertia < best.inertia) {
            run.restart = static_cast<int>(r);
            best = std::move(run);
        }
    }

    for (int c = 0; c < k; ++c)
        for (int j = 0; j < kCoordDim; ++j)
            best.centroids[static_cast<size_t>(c) * kCoordDim + j] += mean[j];
    best.inertia = compute_inertia(data, n, best.labels.data(),
                                   best.centroids.data(), k);
    GEOTEAMS_LOG("kmeans", "best restart=%d inertia=%.9g n=%zu k=%d",
                 best.restart, best.inertia, n, k);
    return best;
}

}  // namespace geoteams
