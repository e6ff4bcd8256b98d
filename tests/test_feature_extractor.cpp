#include <gtest/gtest.h>

#include "fallwatch/feature_extractor.hpp"
#include "test_helpers.hpp"

using namespace fallwatch;
using fallwatch::test_support::lying_person;
using fallwatch::test_support::upright_person;

TEST(AngleTest, FoldsIntoZeroToNinety) {
    const cv::Point2f o(100.0f, 100.0f);
    EXPECT_NEAR(angle_from_vertical_deg(o, {100.0f, 0.0f}), 0.0, 1e-9);    // straight up
    EXPECT_NEAR(angle_from_vertical_deg(o, {100.0f, 200.0f}), 0.0, 1e-9);  // straight down
    EXPECT_NEAR(angle_from_vertical_deg(o, {200.0f, 100.0f}), 90.0, 1e-9);
    EXPECT_NEAR(angle_from_vertical_deg(o, {0.0f, 100.0f}), 90.0, 1e-9);
    EXPECT_NEAR(angle_from_vertical_deg(o, {200.0f, 0.0f}), 45.0, 1e-9);
    EXPECT_NEAR(angle_from_vertical_deg(o, {0.0f, 200.0f}), 45.0, 1e-9);
}

TEST(AngleTest, DegenerateVectorIsFinite) {
    const double a = angle_from_vertical_deg({5.0f, 5.0f}, {5.0f, 5.0f});
    EXPECT_GE(a, 0.0);
    EXPECT_LE(a, 90.0);
}

TEST(AspectRatioTest, BoxOverDetectedPoints) {
    KeypointSet kps(kNumKeypoints, cv::Point2f(50.0f, 50.0f));
    kps[0] = {10.0f, 20.0f};
    kps[1] = {110.0f, 70.0f};
    // undetected points are ignored even when far away
    kps[2] = {0.0f, 900.0f};
    kps[3] = {-5.0f, -900.0f};
    EXPECT_DOUBLE_EQ(keypoint_aspect_ratio(kps), 100.0 / 50.0);
}

TEST(AspectRatioTest, ZeroForIncompleteOrFlatSets) {
    EXPECT_DOUBLE_EQ(keypoint_aspect_ratio(KeypointSet(16, cv::Point2f(10.0f, 10.0f))), 0.0);
    EXPECT_DOUBLE_EQ(keypoint_aspect_ratio(KeypointSet{}), 0.0);

    KeypointSet flat(kNumKeypoints);
    for (int i = 0; i < kNumKeypoints; ++i) flat[i] = {10.0f + i, 40.0f};
    EXPECT_DOUBLE_EQ(keypoint_aspect_ratio(flat), 0.0);

    EXPECT_DOUBLE_EQ(keypoint_aspect_ratio(KeypointSet(kNumKeypoints, cv::Point2f(0.0f, 0.0f))), 0.0);
}

TEST(AspectRatioTest, NeverNegative) {
    EXPECT_GE(keypoint_aspect_ratio(upright_person(200.0f)), 0.0);
    EXPECT_GE(keypoint_aspect_ratio(lying_person(200.0f)), 0.0);
}

TEST(FeatureExtractorTest, UprightPerson) {
    FeatureExtractor fx;
    const RawFeatures f = fx.extract(upright_person(200.0f));
    ASSERT_TRUE(f.torso_angle && f.hip_y && f.aspect_ratio && f.hip_knee_diff);
    EXPECT_NEAR(*f.torso_angle, 0.0, 1e-6);
    EXPECT_DOUBLE_EQ(*f.hip_y, 200.0);
    EXPECT_NEAR(*f.aspect_ratio, 30.0 / 285.0, 1e-9);
    EXPECT_DOUBLE_EQ(*f.hip_knee_diff, 80.0);
}

TEST(FeatureExtractorTest, LyingPerson) {
    FeatureExtractor fx;
    const RawFeatures f = fx.extract(lying_person(300.0f));
    ASSERT_FALSE(f.empty());
    EXPECT_NEAR(*f.torso_angle, 90.0, 1e-6);
    EXPECT_NEAR(*f.aspect_ratio, 315.0 / 60.0, 1e-9);
    EXPECT_NEAR(*f.hip_knee_diff, 0.0, 1e-9);
}

TEST(FeatureExtractorTest, InvalidInputYieldsNoFeatures) {
    FeatureExtractor fx;
    EXPECT_TRUE(fx.extract(std::optional<KeypointSet>{}).empty());
    EXPECT_TRUE(fx.extract(KeypointSet(10, cv::Point2f(1.0f, 1.0f))).empty());
}
