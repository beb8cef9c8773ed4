#ifndef GEOTEAMS_VALIDATION_HPP
#define GEOTEAMS_VALIDATION_HPP

#include <cstddef>

namespace geoteams {

// Fraction of the total group capacity a request may fill before K-Means
// size variance makes the capacity bound likely to be unreachable.
constexpr double kSafeCapacityRatio = 0.8;

// Throws InputError when k < 1 or k > num_points.
void validate_team_count(size_t num_points, int k);

// Throws CapacityError (UnsafeLoad) when num_points >= 0.8 * k * capacity,
// InputError when capacity is 0.
void validate_safe_capacity(size_t num_points, int k, size_t capacity);

}  // namespace geoteams

#endif  // GEOTEAMS_VALIDATION_HPP
