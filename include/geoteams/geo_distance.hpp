#ifndef GEOTEAMS_GEO_DISTANCE_HPP
#define GEOTEAMS_GEO_DISTANCE_HPP

#include "types.hpp"

#include <vector>

namespace geoteams {

constexpr double kEarthRadiusKm = 6371.0;
constexpr double kKmToMiles = 0.621371;

// Haversine great-circle distance in kilometres. Exactly 0 for identical
// coordinates.
double geo_distance(const Coordinate& a, const Coordinate& b);

// Mean latitude / mean longitude. Caller guarantees a non-empty input.
Coordinate centroid(const std::vector<Coordinate>& coords);

}  // namespace geoteams

#endif  // GEOTEAMS_GEO_DISTANCE_HPP
