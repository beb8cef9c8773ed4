#include "geoteams/outlier_detector.hpp"
#include "geoteams/geo_distance.hpp"

#include <absl/strings/str_format.h>

namespace geoteams {

std::vector<std::string> detect_pairwise_outliers(
    const std::vector<Coordinate>& coords, double threshold_km) {
    std::vector<std::string> warnings;
    const size_t n = coords.size();
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            if (geo_distance(coords[i], coords[j]) > threshold_km) {
                warnings.push_back(absl::StrFormat(
                    "Points more than %.1f km (%.1f miles) apart detected",
                    threshold_km, threshold_km * kKmToMiles));
                return warnings;
            }
        }
    }
    return warnings;
}

std::vector<size_t> detect_global_outliers(
    const std::vector<Coordinate>& coords, double threshold_km) {
    std::vector<size_t> out;
    if (coords.size() <= 2) return out;

    Coordinate c = centroid(coords);
    for (size_t i = 0; i < coords.size(); ++i)
        if (geo_distance(coords[i], c) > threshold_km) out.push_back(i);
    return out;
}

std::optional<std::string> mst_distance_warning(double mst_km,
                                                double threshold_km) {
    if (mst_km <= threshold_km) return std::nullopt;
    return absl::StrFormat(
        "Estimated distance is %.2f km (%.2f miles) - verify locations are correct",
        mst_km, mst_km * kKmToMiles);
}

}  // namespace geoteams
