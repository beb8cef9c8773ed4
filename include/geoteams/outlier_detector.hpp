#ifndef GEOTEAMS_OUTLIER_DETECTOR_HPP
#define GEOTEAMS_OUTLIER_DETECTOR_HPP

#include "types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace geoteams {

struct OutlierConfig {
    double pair_threshold_km = 16.0;      // ~10 miles
    double centroid_threshold_km = 50.0;
    double mst_warning_km = 80.0;
};

// At most one warning: the scan stops at the first pair farther apart than
// the threshold.
std::vector<std::string> detect_pairwise_outliers(
    const std::vector<Coordinate>& coords, double threshold_km = 16.0);

// Indices of points farther than threshold_km from the centroid of the
// whole set. Empty for sets of two points or fewer.
std::vector<size_t> detect_global_outliers(
    const std::vector<Coordinate>& coords, double threshold_km = 50.0);

std::optional<std::string> mst_distance_warning(double mst_km,
                                                double threshold_km = 80.0);

}  // namespace geoteams

#endif  // GEOTEAMS_OUTLIER_DETECTOR_HPP
