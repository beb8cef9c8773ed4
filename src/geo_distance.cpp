#include "geoteams/geo_distance.hpp"

#include <cmath>
#include <numbers>
#include <stdexcept>

namespace geoteams {

namespace {

inline double radians(double deg) { return deg * std::numbers::pi / 180.0; }

}  // namespace

double geo_distance(const Coordinate& a, const Coordinate& b) {
    if (a == b) return 0.0;

    double phi1 = radians(a.latitude);
    double phi2 = radians(b.latitude);
    double dphi = radians(b.latitude - a.latitude);
    double dlambda = radians(b.longitude - a.longitude);

    double s1 = std::sin(dphi / 2.0);
    double s2 = std::sin(dlambda / 2.0);
    double h = s1 * s1 + std::cos(phi1) * std::cos(phi2) * s2 * s2;
    double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
    return kEarthRadiusKm * c;
}

Coordinate centroid(const std::vector<Coordinate>& coords) {
    if (coords.empty())
        throw std::invalid_argument("centroid: empty coordinate set");
    double lat = 0.0, lon = 0.0;
    for (const auto& c : coords) {
        lat += c.latitude;
        lon += c.longitude;
    }
    double inv = 1.0 / static_cast<double>(coords.size());
    return Coordinate{lat * inv, lon * inv};
}

}  // namespace geoteams
