#ifndef GEOTEAMS_PARTITIONER_HPP
#define GEOTEAMS_PARTITIONER_HPP

#include "types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace geoteams {

// Points are stored contiguous row-major as (latitude, longitude) pairs:
// data[i * 2] = latitude of point i, data[i * 2 + 1] = its longitude.
constexpr int kCoordDim = 2;

struct PartitionLabels {
    std::vector<int> labels;         // one per point, in [0, k)
    std::vector<double> centroids;   // k * kCoordDim, row-major
    double inertia = 0.0;
    int iterations = 0;
    int restart = 0;                 // index of the winning initialization
};

/**
 * Abstract interface for unconstrained partitioners.
 * Implementations are stateless across calls so one instance can serve
 * concurrent requests.
 */
class Partitioner {
public:
    virtual PartitionLabels partition(const double* data, size_t n, int k,
                                      unsigned seed) const = 0;

    virtual std::string name() const = 0;

    virtual ~Partitioner() = default;
};

std::vector<double> flatten_coordinates(const std::vector<Coordinate>& coords);

}  // namespace geoteams

#endif  // GEOTEAMS_PARTITIONER_HPP
