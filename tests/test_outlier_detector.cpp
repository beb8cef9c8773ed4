#include <gtest/gtest.h>
#include "geoteams/outlier_detector.hpp"

#include <vector>

using namespace geoteams;

TEST(PairwiseOutliers, NoneForCloseGroup) {
    std::vector<Coordinate> coords = {
        {47.5400, -122.0326}, {47.5410, -122.0330}, {47.5420, -122.0340}};
    EXPECT_TRUE(detect_pairwise_outliers(coords).empty());
}

TEST(PairwiseOutliers, SingleWarningEvenWithManyFarPairs) {
    std::vector<Coordinate> coords = {
        {47.0, -122.0}, {47.6, -122.0}, {48.2, -122.0}, {48.8, -122.0}};
    auto w = detect_pairwise_outliers(coords);
    ASSERT_EQ(w.size(), 1u);
    EXPECT_NE(w[0].find("apart"), std::string::npos);
}

TEST(PairwiseOutliers, SingleOrNoPointNeverWarns) {
    EXPECT_TRUE(detect_pairwise_outliers({}).empty());
    EXPECT_TRUE(detect_pairwise_outliers({{47.5, -122.0}}).empty());
}

TEST(PairwiseOutliers, ThresholdBoundary) {
    // ~15.6 km apart along a meridian.
    std::vector<Coordinate> coords = {{47.5, -122.0}, {47.64, -122.0}};
    EXPECT_TRUE(detect_pairwise_outliers(coords, 16.0).empty());
    EXPECT_EQ(detect_pairwise_outliers(coords, 15.0).size(), 1u);
}

TEST(GlobalOutliers, FlagsDistantPoint) {
    std::vector<Coordinate> coords;
    for (int i = 0; i < 10; ++i)
        coords.push_back({47.60 + 0.005 * i, -122.33});
    coords.push_back({45.52, -122.68});  // Portland
    auto out = detect_global_outliers(coords);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], 10u);
}

TEST(GlobalOutliers, TwoPointsOrFewerNeverFlagged) {
    std::vector<Coordinate> coords = {{47.6, -122.33}, {45.52, -122.68}};
    EXPECT_TRUE(detect_global_outliers(coords).empty());
}

TEST(GlobalOutliers, ThresholdIsConfigurable) {
    std::vector<Coordinate> coords = {{47.5, -122.0}, {47.6, -122.0}, {47.7, -122.0}};
    EXPECT_TRUE(detect_global_outliers(coords, 50.0).empty());
    auto out = detect_global_outliers(coords, 5.0);
    EXPECT_EQ(out, (std::vector<size_t>{0, 2}));
}

TEST(MstWarning, OnlyAboveThreshold) {
    EXPECT_FALSE(mst_distance_warning(80.0).has_value());
    auto w = mst_distance_warning(100.0);
    ASSERT_TRUE(w.has_value());
    EXPECT_NE(w->find("100.00 km"), std::string::npos);
    EXPECT_NE(w->find("62.14 miles"), std::string::npos);
    EXPECT_TRUE(mst_distance_warning(30.0, 20.0).has_value());
}
