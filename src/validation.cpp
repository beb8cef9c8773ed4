#include "geoteams/validation.hpp"
#include "geoteams/errors.hpp"

#include <absl/strings/str_format.h>

namespace geoteams {

void validate_team_count(size_t num_points, int k) {
    if (k < 1)
        throw InputError(absl::StrFormat(
            "Number of groups must be at least 1 (got %d)", k));
    if (static_cast<size_t>(k) > num_points)
        throw InputError(absl::StrFormat(
            "Cannot create %d groups with only %zu points. Reduce the group "
            "count or add more points.", k, num_points));
}

void validate_safe_capacity(size_t num_points, int k, size_t capacity) {
    if (capacity == 0)
        throw InputError("Capacity bound must be at least 1");
    if (k < 1)
        throw InputError(absl::StrFormat(
            "Number of groups must be at least 1 (got %d)", k));

    double threshold = static_cast<double>(k) * static_cast<double>(capacity) *
                       kSafeCapacityRatio;
    if (static_cast<double>(num_points) >= threshold)
        throw CapacityError(
            CapacityError::Reason::UnsafeLoad,
            absl::StrFormat(
                "Capacity exceeded: %zu points with %d groups at %zu per group "
                "exceeds safe capacity (%.1f). Increase the capacity or the "
                "group count.",
                num_points, k, capacity, threshold),
            static_cast<size_t>(k), capacity, num_points);
}

}  // namespace geoteams
