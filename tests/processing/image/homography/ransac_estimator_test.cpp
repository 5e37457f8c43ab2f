// File: tests/processing/image/homography/ransac_estimator_test.cpp

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <numeric>
#include <opencv2/core.hpp>
#include <vector>

#include "common/errors.hpp"
#include "config/configuration.hpp"
#include "processing/image/homography/ransac_estimator.hpp"

using namespace processing::image;
using types::ProjectiveTransform;

class RansacHomographyEstimatorTest : public ::testing::Test {
protected:
    const ProjectiveTransform warp{1.1f, 0.05f, 20.0f, -0.03f, 0.95f, 10.0f, 1e-4f, 2e-4f};
    std::vector<cv::Point2f> points1{{12, 7},   {150, 21},  {81, 95},   {33, 140},  {171, 163}, {61, 58},
                                     {122, 77}, {5, 103},   {143, 131}, {97, 11},   {44, 66},   {188, 92},
                                     {18, 179}, {109, 188}, {72, 124},  {159, 49}};
    std::vector<cv::Point2f> points2;
    RansacHomographyEstimator::Options options;

    void SetUp() override {
        points2 = warp.transformPoints(points1);
        options.seed = 42;

        // Four gross mismatches at the end.
        const std::vector<cv::Point2f> outliers{{30, 30}, {120, 160}, {175, 15}, {60, 110}};
        for (const auto &p: outliers) {
            points1.push_back(p);
            points2.push_back(warp.transform(p) + cv::Point2f(40.0f, -35.0f));
        }
    }

    static std::vector<int> range(const int n) {
        std::vector<int> indices(n);
        std::iota(indices.begin(), indices.end(), 0);
        return indices;
    }
};

TEST_F(RansacHomographyEstimatorTest, RecoversModelAndRejectsOutliers) {
    const auto estimate = RansacHomographyEstimator(options).estimate(points1, points2);

    ASSERT_TRUE(estimate.success());
    EXPECT_EQ(estimate.status, EstimationStatus::Success);
    EXPECT_THAT(estimate.inliers, ::testing::ElementsAreArray(range(16)));
    EXPECT_GT(estimate.trials, 0);
    EXPECT_LE(estimate.trials, options.max_evaluations);

    for (int i = 0; i < 16; ++i) {
        const auto projected = estimate.homography->transform(points1[i]);
        EXPECT_NEAR(projected.x, points2[i].x, 0.05f) << "point " << i;
        EXPECT_NEAR(projected.y, points2[i].y, 0.05f) << "point " << i;
    }
}

TEST_F(RansacHomographyEstimatorTest, SameSeedSameResult) {
    const RansacHomographyEstimator estimator(options);
    const auto first = estimator.estimate(points1, points2);
    const auto second = estimator.estimate(points1, points2);

    ASSERT_TRUE(first.success());
    ASSERT_TRUE(second.success());
    EXPECT_EQ(first.trials, second.trials);
    EXPECT_EQ(first.inliers, second.inliers);
    EXPECT_EQ(*first.homography, *second.homography);
}

TEST_F(RansacHomographyEstimatorTest, UnseededRunStillConverges) {
    options.seed.reset();
    const auto estimate = RansacHomographyEstimator(options).estimate(points1, points2);
    ASSERT_TRUE(estimate.success());
    EXPECT_EQ(estimate.inliers.size(), 16u);
}

TEST_F(RansacHomographyEstimatorTest, IntegerPixelOverload) {
    std::vector<cv::Point> from, to;
    for (int i = 0; i < 16; ++i) {
        const cv::Point p(cvRound(points1[i].x), cvRound(points1[i].y));
        from.push_back(p);
        to.push_back(p + cv::Point(5, 3));
    }

    const auto estimate = RansacHomographyEstimator(options).estimate(from, to);
    ASSERT_TRUE(estimate.success());
    EXPECT_EQ(estimate.inliers.size(), from.size());
    EXPECT_TRUE(estimate.homography->isApprox(ProjectiveTransform(1, 0, 5, 0, 1, 3, 0, 0), 1e-3f))
            << estimate.homography->toString();
}

TEST_F(RansacHomographyEstimatorTest, TooFewPointsIsNotAnError) {
    const std::vector<cv::Point2f> three(points1.begin(), points1.begin() + 3);
    const auto estimate = RansacHomographyEstimator(options).estimate(three, three);

    EXPECT_FALSE(estimate.success());
    EXPECT_EQ(estimate.status, EstimationStatus::InsufficientConsensus);
    EXPECT_FALSE(estimate.homography.has_value());
    EXPECT_TRUE(estimate.inliers.empty());

    EXPECT_FALSE(RansacHomographyEstimator(options).estimate(std::vector<cv::Point2f>{}, {}).success());
}

TEST_F(RansacHomographyEstimatorTest, CollinearPointsHaveNoConsensus) {
    std::vector<cv::Point2f> line1, line2;
    for (int i = 0; i < 10; ++i) {
        line1.emplace_back(static_cast<float>(i), 0.0f);
        line2.emplace_back(static_cast<float>(3 * i + 2), 0.0f);
    }

    const auto estimate = RansacHomographyEstimator(options).estimate(line1, line2);
    EXPECT_EQ(estimate.status, EstimationStatus::InsufficientConsensus);
    EXPECT_FALSE(estimate.homography.has_value());
}

TEST_F(RansacHomographyEstimatorTest, CoincidentPointsHaveNoConsensus) {
    const std::vector<cv::Point2f> same(6, cv::Point2f(10, 10));
    const std::vector<cv::Point2f> spread(points1.begin(), points1.begin() + 6);
    EXPECT_FALSE(RansacHomographyEstimator(options).estimate(same, spread).success());
}

TEST_F(RansacHomographyEstimatorTest, MismatchedSizesThrow) {
    const RansacHomographyEstimator estimator(options);
    points2.pop_back();
    EXPECT_THROW((void) estimator.estimate(points1, points2), common::ArgumentMismatchError);
    EXPECT_THROW((void) estimator.estimate(std::vector<cv::Point>(5), std::vector<cv::Point>(4)),
                 common::ArgumentMismatchError);
}

TEST_F(RansacHomographyEstimatorTest, InvalidOptionsAreRejected) {
    auto certain = options;
    certain.probability = 1.0;
    EXPECT_THROW(RansacHomographyEstimator{certain}, common::ArgumentMismatchError);

    auto no_trials = options;
    no_trials.max_evaluations = 0;
    EXPECT_THROW(RansacHomographyEstimator{no_trials}, common::ArgumentMismatchError);
}

TEST(RansacHomographyConfigurationTest, OptionsAreReadFromConfiguration) {
    config::Configuration::initializeFromString(R"(
homography:
  ransac:
    threshold: 0.002
    max_evaluations: 500
    seed: 7
)");
    const auto estimator = RansacHomographyEstimator::fromConfiguration();
    EXPECT_DOUBLE_EQ(estimator.options().threshold, 0.002);
    EXPECT_EQ(estimator.options().max_evaluations, 500);
    EXPECT_EQ(estimator.options().max_samplings, 100);
    EXPECT_DOUBLE_EQ(estimator.options().probability, 0.99);
    ASSERT_TRUE(estimator.options().seed.has_value());
    EXPECT_EQ(*estimator.options().seed, 7u);

    config::Configuration::initializeFromString("{}");
    EXPECT_FALSE(RansacHomographyEstimator::fromConfiguration().options().seed.has_value());
}

TEST(CollinearityTest, SignedAreaBelowEpsilon) {
    EXPECT_TRUE(collinear({0, 0}, {1, 1}, {2, 2}));
    EXPECT_TRUE(collinear({3, 4}, {3, 4}, {7, -1}));
    EXPECT_TRUE(collinear({0.5f, 1.0f}, {0.5f, 2.0f}, {0.5f, -3.0f}));
    EXPECT_FALSE(collinear({0, 0}, {1, 0}, {0, 1}));
    EXPECT_FALSE(collinear({0, 0}, {1, 0}, {0.5f, 0.001f}));
}
