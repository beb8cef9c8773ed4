#ifndef GEOTEAMS_MST_HPP
#define GEOTEAMS_MST_HPP

#include "types.hpp"

#include <vector>

namespace geoteams {

// Total weight (km) of a minimum spanning tree over the complete
// great-circle graph of the points. 0 for fewer than two points.
double mst_distance_km(const std::vector<Coordinate>& coords);

// Same, over Points. Throws InputError if any point of a set of two or
// more lacks a coordinate.
double mst_distance_km(const std::vector<Point>& points);

}  // namespace geoteams

#endif  // GEOTEAMS_MST_HPP
