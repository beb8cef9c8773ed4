#include "geoteams/color_assigner.hpp"
#include "geoteams/errors.hpp"
#include "geoteams/geo_distance.hpp"
#include "geoteams/log.hpp"

#include <absl/strings/str_format.h>

#include <limits>

namespace geoteams {

const std::vector<std::string>& default_palette() {
    static const std::vector<std::string> palette = {
        "red",        "green",        "blue",        "magenta",
        "cyan",       "yellow",       "bright_red",  "bright_green",
        "bright_blue", "bright_magenta", "bright_cyan", "bright_yellow",
    };
    return palette;
}

ColorAssigner::ColorAssigner(std::vector<std::string> palette)
    : palette_(std::move(palette)) {
    if (palette_.empty())
        throw InputError("ColorAssigner: palette must not be empty");
}

ColorAssignment ColorAssigner::assign(
    const std::vector<std::optional<Coordinate>>& centroids) const {
    const size_t k = centroids.size();
    const size_t p = palette_.size();

    ColorAssignment out;
    std::vector<size_t> label(k);
    for (size_t i = 0; i < k && i < p; ++i) label[i] = i;

    for (size_t i = p; i < k; ++i) {
        if (!centroids[i]) {
            label[i] = i % p;
            continue;
        }
        size_t best = 0;
        double best_min = -1.0;
        for (size_t l = 0; l < p; ++l) {
            double min_d = std::numeric_limits<double>::infinity();
            for (size_t j = 0; j < i; ++j) {
                if (label[j] != l || !centroids[j]) continue;
                double d = geo_distance(*centroids[i], *centroids[j]);
                if (d < min_d) min_d = d;
            }
            if (min_d > best_min) {
                best_min = min_d;
                best = l;
            }
        }
        label[i] = best;
        GEOTEAMS_LOG("color", "group=%zu reuses %s (nearest holder %.2fkm)",
                     i, palette_[best].c_str(), best_min);
    }

    out.colors.reserve(k);
    for (size_t i = 0; i < k; ++i) out.colors.push_back(palette_[label[i]]);

    if (k > p)
        out.warnings.push_back(absl::StrFormat(
            "%zu groups but only %zu distinct colors; colors are reused for "
            "geographically distant groups",
            k, p));
    return out;
}

}  // namespace geoteams
