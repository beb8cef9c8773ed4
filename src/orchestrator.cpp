#include "geoteams/orchestrator.hpp"
#include "geoteams/errors.hpp"
#include "geoteams/geo_distance.hpp"
#include "geoteams/log.hpp"
#include "geoteams/mst.hpp"
#include "geoteams/partition.hpp"
#include "geoteams/validation.hpp"

#include <absl/container/flat_hash_set.h>
#include <absl/strings/str_format.h>
#include <omp.h>

#include <cmath>
#include <exception>

namespace geoteams {

namespace {

void check_threshold(double v, const char* name) {
    if (!std::isfinite(v) || v < 0.0)
        throw InputError(absl::StrFormat(
            "OutlierConfig: %s must be a finite non-negative distance", name));
}

}  // namespace

ClusteringOrchestrator::ClusteringOrchestrator(const ClusteringConfig& cfg,
                                               const Partitioner* partitioner)
    : cfg_(cfg),
      partitioner_(partitioner),
      redistributor_(cfg.redistribution),
      colors_(cfg.palette) {
    check_threshold(cfg_.outliers.pair_threshold_km, "pair_threshold_km");
    check_threshold(cfg_.outliers.centroid_threshold_km, "centroid_threshold_km");
    check_threshold(cfg_.outliers.mst_warning_km, "mst_warning_km");

    if (!partitioner_) {
        owned_partitioner_ = std::make_unique<BlasKMeans>(cfg_.kmeans);
        partitioner_ = owned_partitioner_.get();
    }
}

void ClusteringOrchestrator::validate(const PartitionRequest& request) const {
    const size_t n = request.points.size();
    validate_team_count(n, request.k);

    if (request.names.size() < static_cast<size_t>(request.k))
        throw InputError(absl::StrFormat(
            "Not enough group names: expected at least %d but got %zu",
            request.k, request.names.size()));

    if (request.capacity && *request.capacity == 0)
        throw InputError("Capacity bound must be at least 1");

    absl::flat_hash_set<std::string> seen;
    seen.reserve(n);
    for (const auto& p : request.points) {
        if (!p.coordinate)
            throw InputError(absl::StrFormat(
                "Point '%s' is missing coordinates", p.id));
        if (!p.coordinate->valid())
            throw InputError(absl::StrFormat(
                "Point '%s' has out-of-range coordinate (%f, %f)", p.id,
                p.coordinate->latitude, p.coordinate->longitude));
        if (!seen.insert(p.id).second)
            throw InputError(absl::StrFormat(
                "Duplicate point identifier '%s'", p.id));
    }

    if (cfg_.enforce_safe_capacity && request.capacity)
        validate_safe_capacity(n, request.k, *request.capacity);
}

PartitionResult ClusteringOrchestrator::run(const PartitionRequest& request) const {
    validate(request);

    const size_t n = request.points.size();
    const int k = request.k;

    PartitionResult result;
    result.points = request.points;

    std::vector<Coordinate> coords;
    coords.reserve(n);
    for (const auto& p : result.points) coords.push_back(*p.coordinate);

    result.outliers = detect_global_outliers(
        coords, cfg_.outliers.centroid_threshold_km);
    if (!result.outliers.empty()) {
        Coordinate overall = centroid(coords);
        for (size_t i : result.outliers)
            result.warnings.push_back(absl::StrFormat(
                "Point '%s' is %.2f km from the center of all points - verify "
                "its location", result.points[i].id,
                geo_distance(coords[i], overall)));
    }

    std::vector<double> data = flatten_coordinates(coords);
    PartitionLabels labels = partitioner_->partition(data.data(), n, k, request.seed);
    result.inertia = labels.inertia;
    result.kmeans_iterations = labels.iterations;

    Partition partition(result.points, std::move(labels.labels), k);

    if (request.capacity) {
        result.redistribution_moves =
            redistributor_.redistribute(partition, *request.capacity);
        if (result.redistribution_moves > 0)
            result.warnings.push_back(absl::StrFormat(
                "Capacity redistribution moved %zu points to keep every group "
                "at or below %zu; some groups may be less compact",
                result.redistribution_moves, *request.capacity));
    }

    std::vector<std::vector<size_t>> members = partition.all_members();
    result.groups.resize(static_cast<size_t>(k));
    std::vector<std::exception_ptr> errors(static_cast<size_t>(k));

    #pragma omp parallel for schedule(dynamic)
    for (int g = 0; g < k; ++g) {
        try {
            Group& group = result.groups[static_cast<size_t>(g)];
            std::vector<Coordinate> gc;
            gc.reserve(members[g].size());
            for (size_t i : members[g]) gc.push_back(coords[i]);

            group.mst_distance_km = mst_distance_km(gc);
            group.warnings = detect_pairwise_outliers(
                gc, cfg_.outliers.pair_threshold_km);
            if (auto w = mst_distance_warning(group.mst_distance_km,
                                              cfg_.outliers.mst_warning_km))
                group.warnings.push_back(*w);
        } catch (...) {
            errors[static_cast<size_t>(g)] = std::current_exception();
        }
    }
    for (const auto& e : errors)
        if (e) std::rethrow_exception(e);

    ColorAssignment colors = colors_.assign(partition.centroids());
    for (auto& w : colors.warnings) result.warnings.push_back(std::move(w));

    for (int g = 0; g < k; ++g) {
        Group& group = result.groups[static_cast<size_t>(g)];
        group.name = request.names[static_cast<size_t>(g)];
        group.color = colors.colors[static_cast<size_t>(g)];
        group.members = std::move(members[static_cast<size_t>(g)]);
    }

    GEOTEAMS_LOG("cluster", "n=%zu k=%d seed=%u inertia=%.9g moves=%zu warnings=%zu",
                 n, k, request.seed, result.inertia,
                 result.redistribution_moves, result.warnings.size());
    return result;
}

}  // namespace geoteams
