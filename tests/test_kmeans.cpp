#include <gtest/gtest.h>
#include "geoteams/errors.hpp"
#include "geoteams/kmeans_blas.hpp"
#include "geoteams/metrics.hpp"
#include "geoteams/point_generator.hpp"

#include <algorithm>
#include <set>
#include <vector>

using namespace geoteams;

namespace {

std::vector<double> flatten_points(const std::vector<Point>& pts) {
    std::vector<Coordinate> coords;
    for (const auto& p : pts) coords.push_back(*p.coordinate);
    return flatten_coordinates(coords);
}

// Seattle and Spokane neighbourhoods, n_per points each.
std::vector<double> make_two_city_data(size_t n_per, std::vector<int>& truth) {
    auto seattle = generate_geo_clusters(n_per, 1, {47.61, -122.33}, 1.0, 7);
    auto spokane = generate_geo_clusters(n_per, 1, {47.66, -117.43}, 1.0, 8);
    std::vector<Point> all = seattle;
    all.insert(all.end(), spokane.begin(), spokane.end());
    truth.assign(n_per, 0);
    truth.insert(truth.end(), n_per, 1);
    return flatten_points(all);
}

// Number of points whose label is not an exact nearest centroid, measured
// by direct differences (no norm expansion).
size_t count_not_nearest(const std::vector<double>& data, size_t n, int k,
                         const PartitionLabels& res) {
    auto sq = [&](size_t i, int c) {
        double dlat = data[i * kCoordDim] - res.centroids[c * kCoordDim];
        double dlon = data[i * kCoordDim + 1] - res.centroids[c * kCoordDim + 1];
        return dlat * dlat + dlon * dlon;
    };
    size_t bad = 0;
    for (size_t i = 0; i < n; ++i) {
        double best = sq(i, 0);
        for (int c = 1; c < k; ++c) best = std::min(best, sq(i, c));
        double own = sq(i, res.labels[i]);
        if (own > best * (1.0 + 1e-6) + 1e-24) ++bad;
    }
    return bad;
}

}  // namespace

// 1. Well-separated cities end up in separate groups.
TEST(BlasKMeans, TwoCitiesArePure) {
    std::vector<int> truth;
    auto data = make_two_city_data(50, truth);
    size_t n = truth.size();

    BlasKMeans km;
    auto res = km.partition(data.data(), n, 2, 42);
    ASSERT_EQ(res.labels.size(), n);

    std::set<int> first(res.labels.begin(), res.labels.begin() + 50);
    std::set<int> second(res.labels.begin() + 50, res.labels.end());
    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_NE(*first.begin(), *second.begin());
}

// 2. Same seed, same input -> identical partition.
TEST(BlasKMeans, Determinism) {
    auto pts = generate_geo_clusters(300, 6, {47.6, -122.2}, 2.0, 55);
    auto data = flatten_points(pts);

    BlasKMeans km;
    auto a = km.partition(data.data(), pts.size(), 8, 42);
    auto b = km.partition(data.data(), pts.size(), 8, 42);

    EXPECT_EQ(a.labels, b.labels);
    EXPECT_EQ(a.centroids, b.centroids);
    EXPECT_EQ(a.inertia, b.inertia);
    EXPECT_EQ(a.restart, b.restart);
}

// 3. Different seeds on an asymmetric input can give different memberships.
TEST(BlasKMeans, SeedsCanDiffer) {
    auto pts = generate_geo_clusters(200, 1, {47.6, -122.2}, 10.0, 99);
    auto data = flatten_points(pts);

    BlasKMeans km;
    auto base = km.partition(data.data(), pts.size(), 8, 0);
    bool any_differs = false;
    for (unsigned seed = 1; seed <= 20 && !any_differs; ++seed) {
        auto other = km.partition(data.data(), pts.size(), 8, seed);
        any_differs = other.labels != base.labels;
    }
    EXPECT_TRUE(any_differs);
}

// 4. Inertia must not increase with more Lloyd iterations.
TEST(BlasKMeans, InertiaMonotonicallyDecreases) {
    auto pts = generate_geo_clusters(500, 5, {47.6, -122.2}, 3.0, 77);
    auto data = flatten_points(pts);

    std::vector<double> inertias;
    for (size_t max_it = 1; max_it <= 15; ++max_it) {
        KMeansConfig cfg;
        cfg.max_iter = max_it;
        BlasKMeans km(cfg);
        inertias.push_back(km.partition(data.data(), pts.size(), 10, 42).inertia);
    }
    for (size_t i = 1; i < inertias.size(); ++i) {
        EXPECT_LE(inertias[i], inertias[i - 1] * (1.0 + 1e-9))
            << "Inertia should not increase at iteration " << i;
    }
}

// 5. Reported inertia matches a recomputation from labels and centroids.
TEST(BlasKMeans, InertiaMatchesLabels) {
    auto pts = generate_geo_clusters(120, 3, {47.6, -122.2}, 2.0, 5);
    auto data = flatten_points(pts);

    BlasKMeans km;
    auto res = km.partition(data.data(), pts.size(), 3, 42);
    double recomputed = compute_inertia(data.data(), pts.size(), res.labels.data(),
                                        res.centroids.data(), 3);
    EXPECT_DOUBLE_EQ(res.inertia, recomputed);
    EXPECT_GE(res.iterations, 1);
    EXPECT_LE(res.iterations, 300);
}

// 6. More groups than distinct locations leaves empty groups, not an error.
TEST(BlasKMeans, EmptyGroupsAllowed) {
    std::vector<Coordinate> coords(10, Coordinate{47.6, -122.3});
    auto data = flatten_coordinates(coords);

    BlasKMeans km;
    auto res = km.partition(data.data(), coords.size(), 3, 42);
    auto sizes = compute_group_sizes(res.labels.data(), coords.size(), 3);
    EXPECT_EQ(count_empty_groups(sizes), 2);
    EXPECT_EQ(sizes[0] + sizes[1] + sizes[2], 10u);
    EXPECT_NEAR(res.inertia, 0.0, 1e-12);
}

// 7. K equal to N puts every point in its own group.
TEST(BlasKMeans, KEqualsN) {
    std::vector<Coordinate> coords = {
        {47.5400, -122.0326}, {47.5410, -122.0330}, {47.6062, -122.2000},
        {47.6070, -122.2010}, {47.6097, -122.3331}};
    auto data = flatten_coordinates(coords);

    BlasKMeans km;
    auto res = km.partition(data.data(), coords.size(), 5, 42);
    auto sizes = compute_group_sizes(res.labels.data(), coords.size(), 5);
    for (size_t s : sizes) EXPECT_EQ(s, 1u);
}

// 8. Points a few metres apart still land on their nearest centroid.
TEST(BlasKMeans, TightClustersAssignToNearestCentroid) {
    BlasKMeans km;
    for (unsigned seed = 0; seed < 20; ++seed) {
        auto pts = generate_geo_clusters(400, 4, {47.6062, -122.3321}, 0.005, seed);
        auto data = flatten_points(pts);
        auto res = km.partition(data.data(), pts.size(), 8, seed);
        EXPECT_EQ(count_not_nearest(data, pts.size(), 8, res), 0u)
            << "seed " << seed << " iters=" << res.iterations;
    }
}

// 9. Stopping at max_iter still reports nearest-centroid labels.
TEST(BlasKMeans, IterationCapKeepsNearestLabels) {
    auto pts = generate_geo_clusters(300, 5, {47.6, -122.2}, 3.0, 13);
    auto data = flatten_points(pts);

    KMeansConfig cfg;
    cfg.max_iter = 1;
    BlasKMeans km(cfg);
    auto res = km.partition(data.data(), pts.size(), 6, 42);
    EXPECT_EQ(count_not_nearest(data, pts.size(), 6, res), 0u);
}

TEST(BlasKMeans, RejectsBadK) {
    std::vector<Coordinate> coords = {{47.5, -122.0}, {47.6, -122.0}};
    auto data = flatten_coordinates(coords);

    BlasKMeans km;
    EXPECT_THROW(km.partition(data.data(), 2, 0, 42), InputError);
    EXPECT_THROW(km.partition(data.data(), 2, -1, 42), InputError);
    EXPECT_THROW(km.partition(data.data(), 2, 3, 42), InputError);
}

TEST(BlasKMeans, RejectsBadConfig) {
    KMeansConfig cfg;
    cfg.n_init = 0;
    EXPECT_THROW(BlasKMeans{cfg}, InputError);
    cfg.n_init = kMinRestarts - 1;
    EXPECT_THROW(BlasKMeans{cfg}, InputError);
    cfg.n_init = kMinRestarts;
    EXPECT_NO_THROW(BlasKMeans{cfg});
    cfg.max_iter = 0;
    EXPECT_THROW(BlasKMeans{cfg}, InputError);
}

TEST(GroupMetrics, SizesAndStddev) {
    std::vector<int> labels = {0, 0, 1, 1, 1, 3};
    auto sizes = compute_group_sizes(labels.data(), labels.size(), 4);
    EXPECT_EQ(sizes, (std::vector<size_t>{2, 3, 0, 1}));
    EXPECT_EQ(count_empty_groups(sizes), 1);
    EXPECT_NEAR(compute_group_size_stddev(sizes), 1.118034, 1e-6);
}
