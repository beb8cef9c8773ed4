#include "geoteams/partition.hpp"
#include "geoteams/errors.hpp"

#include <absl/strings/str_format.h>

namespace geoteams {

Partition::Partition(const std::vector<Point>& points, std::vector<int> labels,
                     int k)
    : points_(points), labels_(std::move(labels)), k_(k) {
    if (k_ < 1)
        throw InputError(absl::StrFormat("Partition: k must be >= 1 (got %d)", k_));
    if (labels_.size() != points_.size())
        throw InputError(absl::StrFormat(
            "Partition: %zu labels for %zu points", labels_.size(), points_.size()));

    sizes_.assign(static_cast<size_t>(k_), 0);
    for (size_t i = 0; i < labels_.size(); ++i) {
        int l = labels_[i];
        if (l < 0 || l >= k_)
            throw InputError(absl::StrFormat(
                "Partition: point %zu has group %d outside [0, %d)", i, l, k_));
        if (!points_[i].coordinate)
            throw InputError(absl::StrFormat(
                "Point '%s' is missing coordinates", points_[i].id));
        sizes_[static_cast<size_t>(l)]++;
    }
}

void Partition::move(size_t i, int to) {
    int from = labels_[i];
    if (from == to) return;
    sizes_[static_cast<size_t>(from)]--;
    sizes_[static_cast<size_t>(to)]++;
    labels_[i] = to;
}

std::vector<size_t> Partition::members(int g) const {
    std::vector<size_t> out;
    out.reserve(sizes_[static_cast<size_t>(g)]);
    for (size_t i = 0; i < labels_.size(); ++i)
        if (labels_[i] == g) out.push_back(i);
    return out;
}

std::vector<std::vector<size_t>> Partition::all_members() const {
    std::vector<std::vector<size_t>> out(static_cast<size_t>(k_));
    for (int g = 0; g < k_; ++g)
        out[static_cast<size_t>(g)].reserve(sizes_[static_cast<size_t>(g)]);
    for (size_t i = 0; i < labels_.size(); ++i)
        out[static_cast<size_t>(labels_[i])].push_back(i);
    return out;
}

std::vector<std::optional<Coordinate>> Partition::centroids() const {
    std::vector<double> lat(static_cast<size_t>(k_), 0.0);
    std::vector<double> lon(static_cast<size_t>(k_), 0.0);
    for (size_t i = 0; i < labels_.size(); ++i) {
        const Coordinate& c = *points_[i].coordinate;
        lat[static_cast<size_t>(labels_[i])] += c.latitude;
        lon[static_cast<size_t>(labels_[i])] += c.longitude;
    }

    std::vector<std::optional<Coordinate>> out(static_cast<size_t>(k_));
    for (size_t g = 0; g < out.size(); ++g) {
        if (sizes_[g] == 0) continue;
        double inv = 1.0 / static_cast<double>(sizes_[g]);
        out[g] = Coordinate{lat[g] * inv, lon[g] * inv};
    }
    return out;
}

}  // namespace geoteams
