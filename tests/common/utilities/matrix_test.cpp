// File: tests/common/utilities/matrix_test.cpp

#include <Eigen/Dense>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include "common/utilities/matrix.hpp"

// Test successful conversion from Eigen to OpenCV
TEST(MatrixUtilsTest, toCV) {
    Eigen::MatrixXd eigen_matrix(2, 3);
    eigen_matrix << 1, 2, 3,
            4, 5, 6;

    const cv::Mat cv_matrix = common::utilities::toCV(eigen_matrix);

    EXPECT_EQ(eigen_matrix.rows(), cv_matrix.rows);
    EXPECT_EQ(eigen_matrix.cols(), cv_matrix.cols);
    EXPECT_EQ(cv_matrix.type(), CV_64F);
    EXPECT_DOUBLE_EQ(cv_matrix.at<double>(0, 2), 3.0);
    EXPECT_DOUBLE_EQ(cv_matrix.at<double>(1, 0), 4.0);
}

// Single precision stays single precision
TEST(MatrixUtilsTest, FloatMatrices) {
    Eigen::MatrixXf eigen_matrix(2, 2);
    eigen_matrix << 1.1f, 2.2f,
            3.3f, 4.4f;

    const cv::Mat cv_matrix = common::utilities::toCV(eigen_matrix);

    EXPECT_EQ(cv_matrix.type(), CV_32F);
    EXPECT_FLOAT_EQ(cv_matrix.at<float>(1, 1), 4.4f);
}

// Homographies go to OpenCV as 3x3 doubles with the implicit unit scale written out
TEST(MatrixUtilsTest, ProjectiveTransform) {
    const types::ProjectiveTransform transform(1.5f, 0.25f, 10.0f, -0.5f, 2.0f, -4.0f, 0.001f, 0.002f);

    const cv::Mat cv_matrix = common::utilities::toCV(transform);
    ASSERT_EQ(cv_matrix.type(), CV_64F);
    ASSERT_EQ(cv_matrix.rows, 3);
    ASSERT_EQ(cv_matrix.cols, 3);
    EXPECT_DOUBLE_EQ(cv_matrix.at<double>(2, 2), 1.0);
    EXPECT_DOUBLE_EQ(cv_matrix.at<double>(0, 2), 10.0);
    EXPECT_DOUBLE_EQ(cv_matrix.at<double>(1, 1), 2.0);
    EXPECT_FLOAT_EQ(static_cast<float>(cv_matrix.at<double>(2, 0)), 0.001f);
}
