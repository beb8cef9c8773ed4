#ifndef GEOTEAMS_POINT_GENERATOR_HPP
#define GEOTEAMS_POINT_GENERATOR_HPP

#include "types.hpp"

#include <cstddef>
#include <vector>

namespace geoteams {

// Synthetic neighbourhoods for tests and benchmarks.
// Cluster centres are scattered uniformly within 3 * spread_km * num_clusters
// of `center`; points are assigned round-robin and jittered with a Gaussian
// of sigma spread_km. Ids are "p0".."p{n-1}". Reproducible per seed.
std::vector<Point> generate_geo_clusters(size_t n, int num_clusters,
                                         Coordinate center, double spread_km,
                                         unsigned seed);

}  // namespace geoteams

#endif  // GEOTEAMS_POINT_GENERATOR_HPP
