#include "geoteams/capacity_redistributor.hpp"
#include "geoteams/errors.hpp"
#include "geoteams/geo_distance.hpp"
#include "geoteams/log.hpp"

#include <absl/strings/str_format.h>

#include <algorithm>
#include <limits>

namespace geoteams {

namespace {

// Largest group above capacity (lowest index on ties), or -1.
int most_overloaded(const Partition& p, size_t capacity) {
    int src = -1;
    size_t src_size = capacity;
    for (int g = 0; g < p.k(); ++g) {
        if (p.group_size(g) > src_size) {
            src = g;
            src_size = p.group_size(g);
        }
    }
    return src;
}

size_t largest_size(const Partition& p) {
    const auto& sizes = p.group_sizes();
    return *std::max_element(sizes.begin(), sizes.end());
}

struct Move {
    double dist = std::numeric_limits<double>::infinity();
    size_t point = 0;
    int target = -1;
};

bool better(const Partition& p, double dist, size_t point, int target,
            const Move& cur) {
    if (cur.target < 0) return true;
    if (dist != cur.dist) return dist < cur.dist;
    const std::string& a = p.point(point).id;
    const std::string& b = p.point(cur.point).id;
    if (a != b) return a < b;
    if (target != cur.target) return target < cur.target;
    return point < cur.point;
}

}  // namespace

CapacityRedistributor::CapacityRedistributor(const RedistributionConfig& cfg)
    : cfg_(cfg) {
    if (cfg_.max_iterations == 0)
        throw InputError("RedistributionConfig: max_iterations must be > 0");
}

size_t CapacityRedistributor::redistribute(Partition& partition,
                                           size_t capacity) const {
    if (capacity == 0)
        throw InputError("Capacity bound must be at least 1");

    const int k = partition.k();
    if (most_overloaded(partition, capacity) < 0) return 0;

    if (k == 1)
        throw CapacityError(
            CapacityError::Reason::SingleGroupOverload,
            absl::StrFormat(
                "Single group holds %zu points but capacity is %zu; no other "
                "group can receive the excess. Increase the group count or "
                "the capacity.",
                partition.group_size(0), capacity),
            1, capacity, partition.group_size(0));

    bool has_room = false;
    for (int g = 0; g < k; ++g)
        if (partition.group_size(g) < capacity) has_room = true;
    if (!has_room)
        throw CapacityError(
            CapacityError::Reason::Saturated,
            absl::StrFormat(
                "All %d groups are at or above capacity %zu (%zu points total); "
                "no group can receive a point",
                k, capacity, partition.size()),
            static_cast<size_t>(k), capacity, largest_size(partition));

    size_t moves = 0;
    for (;;) {
        int src = most_overloaded(partition, capacity);
        if (src < 0) break;

        if (moves == cfg_.max_iterations)
            throw CapacityError(
                CapacityError::Reason::IterationCap,
                absl::StrFormat(
                    "Capacity redistribution did not converge within %zu "
                    "iterations (group %d still holds %zu > %zu points)",
                    cfg_.max_iterations, src, partition.group_size(src), capacity),
                static_cast<size_t>(k), capacity, largest_size(partition));

        auto centroids = partition.centroids();

        Move best;
        for (size_t i : partition.members(src)) {
            const Coordinate& c = partition.coordinate(i);
            for (int t = 0; t < k; ++t) {
                if (t == src || partition.group_size(t) >= capacity) continue;
                const auto& tc = centroids[static_cast<size_t>(t)];
                double d = tc ? geo_distance(c, *tc) : 0.0;
                if (better(partition, d, i, t, best)) {
                    best.dist = d;
                    best.point = i;
                    best.target = t;
                }
            }
        }

        if (best.target < 0)
            throw CapacityError(
                CapacityError::Reason::NoCandidate,
                absl::StrFormat(
                    "No group has room for a point from group %d (%zu points, "
                    "capacity %zu) after %zu moves",
                    src, partition.group_size(src), capacity, moves),
                static_cast<size_t>(k), capacity, largest_size(partition));

        GEOTEAMS_LOG("redistribute", "move point=%s group %d -> %d dist=%.3fkm",
                     partition.point(best.point).id.c_str(), src, best.target,
                     best.dist);
        partition.move(best.point, best.target);
        ++moves;
    }

    GEOTEAMS_LOG("redistribute", "done moves=%zu capacity=%zu", moves, capacity);
    return moves;
}

}  // namespace geoteams
