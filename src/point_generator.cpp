#include "geoteams/point_generator.hpp"
#include "geoteams/errors.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <random>
#include <string>

namespace geoteams {

namespace {

constexpr double kKmPerDegLat = 111.32;

Coordinate offset_km(Coordinate origin, double north_km, double east_km) {
    double lat = origin.latitude + north_km / kKmPerDegLat;
    double cos_lat = std::cos(origin.latitude * std::numbers::pi / 180.0);
    double lon = origin.longitude +
                 east_km / (kKmPerDegLat * std::max(cos_lat, 1e-6));
    lat = std::clamp(lat, -90.0, 90.0);
    lon = std::clamp(lon, -180.0, 180.0);
    return Coordinate{lat, lon};
}

}  // namespace

std::vector<Point> generate_geo_clusters(size_t n, int num_clusters,
                                         Coordinate center, double spread_km,
                                         unsigned seed) {
    if (n == 0 || num_clusters <= 0 || spread_km < 0.0 || !center.valid())
        throw InputError("generate_geo_clusters: invalid parameters");

    std::mt19937 rng(seed);
    double radius = 3.0 * spread_km * num_clusters;
    std::uniform_real_distribution<double> centre_dist(-radius, radius);

    std::vector<Coordinate> centres(static_cast<size_t>(num_clusters));
    for (auto& c : centres) {
        double north = centre_dist(rng);
        double east = centre_dist(rng);
        c = offset_km(center, north, east);
    }

    std::normal_distribution<double> noise(0.0, 1.0);
    std::vector<Point> points(n);
    for (size_t i = 0; i < n; ++i) {
        const Coordinate& c = centres[i % centres.size()];
        double dn = spread_km * noise(rng);
        double de = spread_km * noise(rng);
        points[i].id = "p" + std::to_string(i);
        points[i].coordinate = offset_km(c, dn, de);
    }
    return points;
}

}  // namespace geoteams
