#ifndef GEOTEAMS_PARTITION_HPP
#define GEOTEAMS_PARTITION_HPP

#include "types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace geoteams {

/**
 * Group membership over a fixed point arena. Each point carries an index
 * group id; group sizes are cached so a single-point move is O(1).
 * The point vector is borrowed and must outlive the Partition.
 */
class Partition {
public:
    Partition(const std::vector<Point>& points, std::vector<int> labels, int k);

    Partition(const Partition&) = delete;
    Partition& operator=(const Partition&) = delete;

    size_t size() const { return labels_.size(); }
    int    k()    const { return k_; }

    int    group_of(size_t i)  const { return labels_[i]; }
    size_t group_size(int g)   const { return sizes_[static_cast<size_t>(g)]; }
    const std::vector<size_t>& group_sizes() const { return sizes_; }
    const std::vector<int>&    labels()      const { return labels_; }

    const Point&      point(size_t i)      const { return points_[i]; }
    const Coordinate& coordinate(size_t i) const { return *points_[i].coordinate; }

    void move(size_t i, int to);

    std::vector<size_t> members(int g) const;
    std::vector<std::vector<size_t>> all_members() const;

    // Mean coordinate per group; empty groups have none.
    std::vector<std::optional<Coordinate>> centroids() const;

private:
    const std::vector<Point>& points_;
    std::vector<int> labels_;
    std::vector<size_t> sizes_;
    int k_;
};

}  // namespace geoteams

#endif  // GEOTEAMS_PARTITION_HPP
