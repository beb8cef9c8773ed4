#include "geoteams/mst.hpp"
#include "geoteams/errors.hpp"
#include "geoteams/geo_distance.hpp"

#include <absl/strings/str_format.h>

#include <limits>

namespace geoteams {

double mst_distance_km(const std::vector<Coordinate>& coords) {
    const size_t n = coords.size();
    if (n <= 1) return 0.0;
    if (n == 2) return geo_distance(coords[0], coords[1]);

    // Dense Prim: the graph is complete, so O(n^2) beats any heap.
    std::vector<double> key(n, std::numeric_limits<double>::infinity());
    std::vector<char> in_tree(n, 0);
    key[0] = 0.0;

    double total = 0.0;
    for (size_t it = 0; it < n; ++it) {
        size_t u = n;
        double best = std::numeric_limits<double>::infinity();
        for (size_t i = 0; i < n; ++i) {
            if (!in_tree[i] && (u == n || key[i] < best)) {
                best = key[i];
                u = i;
            }
        }
        in_tree[u] = 1;
        total += key[u];

        for (size_t v = 0; v < n; ++v) {
            if (in_tree[v]) continue;
            double w = geo_distance(coords[u], coords[v]);
            if (w < key[v]) key[v] = w;
        }
    }
    return total;
}

double mst_distance_km(const std::vector<Point>& points) {
    if (points.size() <= 1) return 0.0;

    std::vector<Coordinate> coords;
    coords.reserve(points.size());
    for (const auto& p : points) {
        if (!p.coordinate)
            throw InputError(absl::StrFormat(
                "Point '%s' is missing coordinates. All points must be "
                "geocoded before MST calculation.", p.id));
        coords.push_back(*p.coordinate);
    }
    return mst_distance_km(coords);
}

}  // namespace geoteams
