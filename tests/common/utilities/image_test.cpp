// File: tests/common/utilities/image_test.cpp

#include <cmath>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include "common/errors.hpp"
#include "common/utilities/image.hpp"
#include "common/utilities/visualizer.hpp"

using common::utilities::toGrayscale;

TEST(ImageUtilsTest, GrayscaleIsPassedThrough) {
    const cv::Mat gray(8, 8, CV_8UC1, cv::Scalar(42));
    const cv::Mat result = toGrayscale(gray);
    EXPECT_EQ(result.type(), CV_8UC1);
    EXPECT_EQ(result.data, gray.data);
}

TEST(ImageUtilsTest, ColorLayoutsAreReduced) {
    const cv::Mat bgr(4, 6, CV_8UC3, cv::Scalar(100, 100, 100));
    const cv::Mat bgra(4, 6, CV_8UC4, cv::Scalar(100, 100, 100, 255));

    for (const auto &image: {bgr, bgra}) {
        const cv::Mat gray = toGrayscale(image);
        EXPECT_EQ(gray.type(), CV_8UC1);
        EXPECT_EQ(gray.size(), image.size());
        EXPECT_EQ(gray.at<uchar>(2, 3), 100);
    }
}

TEST(ImageUtilsTest, UnsupportedLayoutsAreRejected) {
    EXPECT_THROW((void) toGrayscale(cv::Mat()), common::UnsupportedFormatError);
    EXPECT_THROW((void) toGrayscale(cv::Mat(4, 4, CV_8UC2, cv::Scalar(1, 2))), common::UnsupportedFormatError);
    EXPECT_THROW((void) toGrayscale(cv::Mat(4, 4, CV_16UC1, cv::Scalar(1))), common::UnsupportedFormatError);
    EXPECT_THROW((void) toGrayscale(cv::Mat(4, 4, CV_32FC3, cv::Scalar(1, 1, 1))), common::UnsupportedFormatError);
}

TEST(ImageUtilsTest, BlurIsSkippedWithoutSigma) {
    cv::Mat image = cv::Mat::zeros(9, 9, CV_8UC1);
    image.at<uchar>(4, 4) = 255;

    cv::Mat untouched = image.clone();
    common::utilities::gaussianBlurInPlace(untouched, 0.0, 5);
    EXPECT_EQ(cv::countNonZero(untouched != image), 0);

    common::utilities::gaussianBlurInPlace(image, 1.4, 5);
    EXPECT_LT(image.at<uchar>(4, 4), 255);
    EXPECT_GT(image.at<uchar>(4, 5), 0);
}

TEST(VisualizerTest, PairsAreDrawnSideBySide) {
    const cv::Mat left(20, 30, CV_8UC1, cv::Scalar(0));
    const cv::Mat right(25, 10, CV_8UC3, cv::Scalar(0, 0, 0));

    const cv::Mat overlay = common::utilities::Visualizer::drawPairs(left, right, {{5, 5}}, {{2, 2}});
    EXPECT_EQ(overlay.type(), CV_8UC3);
    EXPECT_EQ(overlay.rows, 25);
    EXPECT_EQ(overlay.cols, 40);
    EXPECT_GT(cv::countNonZero(overlay.reshape(1)), 0);

    EXPECT_THROW((void) common::utilities::Visualizer::drawPairs(left, right, {{5, 5}}, {}),
                 common::ArgumentMismatchError);
}

TEST(VisualizerTest, BlendCoversBothImages) {
    const cv::Mat first(40, 50, CV_8UC1, cv::Scalar(200));
    const cv::Mat second(40, 50, CV_8UC1, cv::Scalar(100));

    // Image 1 at (x, y) shows up in image 2 at (x - 10, y + 5).
    const types::ProjectiveTransform homography(1.0f, 0.0f, -10.0f, 0.0f, 1.0f, 5.0f, 0.0f, 0.0f);
    const cv::Mat panorama = common::utilities::Visualizer::blend(first, second, homography);

    EXPECT_EQ(panorama.cols, 60);
    EXPECT_EQ(panorama.rows, 45);
    // Image 1 is pasted at (0, 5) in the canvas, image 2 fills the strip to its right.
    EXPECT_EQ(panorama.at<cv::Vec3b>(20, 10)[0], 200);
    EXPECT_EQ(panorama.at<cv::Vec3b>(20, 55)[0], 100);
}

TEST(VisualizerTest, NearHorizonProjectionFallsBackToFirstFrame) {
    const cv::Mat first(40, 50, CV_8UC1, cv::Scalar(200));
    const cv::Mat second(40, 64, CV_8UC1, cv::Scalar(100));

    // The inverse is [4 0 0; 0 1 0; -4g 0 1] exactly, so the right edge of image 2 lands at w = 2^-24
    // and x = 2^32: finite, but far beyond any canvas size.
    const float g = std::ldexp(1.0f, -8) - std::ldexp(1.0f, -32);
    const types::ProjectiveTransform homography(0.25f, 0.0f, 0.0f, 0.0f, 1.0f, 0.0f, g, 0.0f);
    ASSERT_TRUE(std::isfinite(homography.invert().transform(cv::Point2f(64.0f, 0.0f)).x));

    cv::Mat panorama;
    ASSERT_NO_THROW(panorama = common::utilities::Visualizer::blend(first, second, homography));
    EXPECT_EQ(panorama.size(), first.size());
    EXPECT_EQ(panorama.type(), CV_8UC3);
    EXPECT_NEAR(panorama.at<cv::Vec3b>(20, 10)[0], 150, 1);
}

TEST(VisualizerTest, PointsAreMarkedOnACopy) {
    const cv::Mat image(16, 16, CV_8UC1, cv::Scalar(0));
    const cv::Mat marked = common::utilities::Visualizer::markPoints(image, {{8, 8}}, cv::Scalar(0, 0, 255));

    EXPECT_EQ(marked.type(), CV_8UC3);
    EXPECT_EQ(marked.at<cv::Vec3b>(8, 8), cv::Vec3b(0, 0, 255));
    EXPECT_EQ(marked.at<cv::Vec3b>(0, 0), cv::Vec3b(0, 0, 0));
    EXPECT_EQ(cv::countNonZero(image), 0);
}
