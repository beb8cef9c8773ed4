#ifndef GEOTEAMS_COLOR_ASSIGNER_HPP
#define GEOTEAMS_COLOR_ASSIGNER_HPP

#include "types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace geoteams {

// Twelve terminal color names, in assignment order.
const std::vector<std::string>& default_palette();

struct ColorAssignment {
    std::vector<std::string> colors;     // one per group, group-index order
    std::vector<std::string> warnings;   // at most one: palette exhausted
};

/**
 * Labels groups from an ordered palette. With more groups than labels,
 * each extra group takes the label whose nearest existing holder is
 * farthest from the group's centroid.
 */
class ColorAssigner {
public:
    explicit ColorAssigner(std::vector<std::string> palette = default_palette());

    // centroids: one per group; std::nullopt for an empty group.
    ColorAssignment assign(
        const std::vector<std::optional<Coordinate>>& centroids) const;

    const std::vector<std::string>& palette() const { return palette_; }

private:
    std::vector<std::string> palette_;
};

}  // namespace geoteams

#endif  // GEOTEAMS_COLOR_ASSIGNER_HPP
