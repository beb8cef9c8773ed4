#ifndef GEOTEAMS_ORCHESTRATOR_HPP
#define GEOTEAMS_ORCHESTRATOR_HPP

#include "capacity_redistributor.hpp"
#include "color_assigner.hpp"
#include "kmeans_blas.hpp"
#include "outlier_detector.hpp"
#include "partitioner.hpp"
#include "types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace geoteams {

struct ClusteringConfig {
    KMeansConfig kmeans;
    RedistributionConfig redistribution;
    OutlierConfig outliers;
    std::vector<std::string> palette = default_palette();
    bool enforce_safe_capacity = false;   // reject loads >= 80% of total capacity
};

// Runs one request through partition -> capacity repair -> per-group
// metrics -> colors. Holds no per-request state; run() is safe to call
// concurrently.
class ClusteringOrchestrator {
public:
    // partitioner: used instead of the built-in BlasKMeans when non-null.
    //   Ownership is NOT transferred.
    explicit ClusteringOrchestrator(const ClusteringConfig& cfg = {},
                                    const Partitioner* partitioner = nullptr);

    PartitionResult run(const PartitionRequest& request) const;

    const ClusteringConfig& config() const { return cfg_; }

private:
    ClusteringConfig cfg_;
    std::unique_ptr<BlasKMeans> owned_partitioner_;
    const Partitioner* partitioner_;
    CapacityRedistributor redistributor_;
    ColorAssigner colors_;

    void validate(const PartitionRequest& request) const;
};

}  // namespace geoteams

#endif  // GEOTEAMS_ORCHESTRATOR_HPP
