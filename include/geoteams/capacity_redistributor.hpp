#ifndef GEOTEAMS_CAPACITY_REDISTRIBUTOR_HPP
#define GEOTEAMS_CAPACITY_REDISTRIBUTOR_HPP

#include "partition.hpp"

#include <cstddef>

namespace geoteams {

struct RedistributionConfig {
    size_t max_iterations = 1000;
};

/**
 * Greedy repair of capacity violations. Each step takes the largest group
 * above capacity and moves the one point that lies closest to the centroid
 * of a group with spare room (an empty group counts as distance 0).
 * Ties order by distance, then point id, then target group index.
 */
class CapacityRedistributor {
public:
    explicit CapacityRedistributor(const RedistributionConfig& cfg = {});

    // Mutates `partition` in place. Returns the number of points moved.
    // Throws CapacityError when the bound cannot be met.
    size_t redistribute(Partition& partition, size_t capacity) const;

private:
    RedistributionConfig cfg_;
};

}  // namespace geoteams

#endif  // GEOTEAMS_CAPACITY_REDISTRIBUTOR_HPP
