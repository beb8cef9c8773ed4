#ifndef GEOTEAMS_KMEANS_BLAS_HPP
#define GEOTEAMS_KMEANS_BLAS_HPP

#include "partitioner.hpp"

#include <cstddef>
#include <random>
#include <string>
#include <vector>

namespace geoteams {

// Fewest seeded restarts a partition may use.
constexpr size_t kMinRestarts = 10;

struct KMeansConfig {
    size_t max_iter = 300;
    size_t n_init = 10;
};

/**
 * BLAS-backed K-Means over planar (lat, lon): cblas_dgemm for distances,
 * KMeans++ init, OpenMP for the assignment argmin. Runs n_init seeded
 * restarts and keeps the lowest-inertia one. Iterates until no point
 * changes cluster or max_iter is reached.
 *
 * Coordinates are shifted by their mean before the GEMM expansion so the
 * ||x||^2 and ||c||^2 terms stay small relative to the spread; the returned
 * centroids and inertia are in the caller's frame.
 */
class BlasKMeans : public Partitioner {
public:
    explicit BlasKMeans(const KMeansConfig& cfg = {});

    PartitionLabels partition(const double* data, size_t n, int k,
                              unsigned seed) const override;
    std::string name() const override;

    const KMeansConfig& config() const { return cfg_; }

private:
    KMeansConfig cfg_;

    PartitionLabels run_once(const double* data, const double* data_norms,
                             size_t n, int k, std::mt19937& rng) const;

    // Returns the number of labels that changed.
    long assign(const double* data, const double* data_norms, size_t n, int k,
                const std::vector<double>& centroids, std::vector<double>& dist_buf,
                std::vector<double>& centroid_norms, int* labels) const;

    void kmeanspp_init(const double* data, size_t n, int k, std::mt19937& rng,
                       std::vector<double>& centroids) const;
};

}  // namespace geoteams

#endif  // GEOTEAMS_KMEANS_BLAS_HPP
