#ifndef GEOTEAMS_TYPES_HPP
#define GEOTEAMS_TYPES_HPP

#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace geoteams {

struct Coordinate {
    double latitude = 0.0;
    double longitude = 0.0;

    bool valid() const {
        return std::isfinite(latitude) && std::isfinite(longitude) &&
               latitude >= -90.0 && latitude <= 90.0 &&
               longitude >= -180.0 && longitude <= 180.0;
    }

    bool operator==(const Coordinate& o) const {
        return latitude == o.latitude && longitude == o.longitude;
    }
};

// A location to be grouped. `coordinate` stays empty until the geocoder
// resolves it; `payload` is carried through untouched.
struct Point {
    std::string id;
    std::optional<Coordinate> coordinate;
    std::string payload;
};

struct Group {
    std::string name;
    std::string color;
    std::vector<size_t> members;      // indices into PartitionResult::points
    double mst_distance_km = 0.0;
    std::vector<std::string> warnings;

    size_t size() const { return members.size(); }
};

struct PartitionRequest {
    std::vector<Point> points;
    int k = 0;
    std::optional<size_t> capacity;
    std::vector<std::string> names;
    unsigned seed = 42;
};

struct PartitionResult {
    std::vector<Point> points;
    std::vector<Group> groups;
    std::vector<size_t> outliers;     // global centroid outliers, input order
    std::vector<std::string> warnings;

    double inertia = 0.0;
    int kmeans_iterations = 0;
    size_t redistribution_moves = 0;

    const Point& point(size_t i) const { return points[i]; }
};

}  // namespace geoteams

#endif  // GEOTEAMS_TYPES_HPP
