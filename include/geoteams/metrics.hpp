#ifndef GEOTEAMS_METRICS_HPP
#define GEOTEAMS_METRICS_HPP

#include <cstddef>
#include <vector>

namespace geoteams {

// Sum of squared planar distances from each point to its labelled centroid.
double compute_inertia(const double* data, size_t n, const int* labels,
                       const double* centroids, int k);

std::vector<size_t> compute_group_sizes(const int* labels, size_t n, int k);

double compute_group_size_stddev(const std::vector<size_t>& sizes);

int count_empty_groups(const std::vector<size_t>& sizes);

}  // namespace geoteams

#endif  // GEOTEAMS_METRICS_HPP
