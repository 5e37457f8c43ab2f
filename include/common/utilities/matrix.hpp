// File: common/utilities/matrix.hpp

#ifndef COMMON_UTILITIES_MATRIX_HPP
#define COMMON_UTILITIES_MATRIX_HPP

#include <Eigen/Core>
#include <opencv2/core.hpp>
#include <type_traits>

#include "types/projective_transform.hpp"

namespace common::utilities {

    /**
     * @brief Converts an Eigen matrix to an OpenCV matrix.
     *
     * @tparam Derived Eigen matrix type (float or double scalars).
     * @param eigen_matrix The input Eigen matrix.
     * @return The output OpenCV matrix (CV_32F or CV_64F).
     */
    template<typename Derived>
    cv::Mat toCV(const Eigen::MatrixBase<Derived> &eigen_matrix) {
        using Scalar = typename Derived::Scalar;
        static_assert(std::is_same_v<Scalar, float> || std::is_same_v<Scalar, double>,
                      "Only float and double matrices can be converted");
        constexpr int type = std::is_same_v<Scalar, float> ? CV_32F : CV_64F;

        cv::Mat cv_matrix(static_cast<int>(eigen_matrix.rows()), static_cast<int>(eigen_matrix.cols()), type);
        for (Eigen::Index i = 0; i < eigen_matrix.rows(); ++i) {
            for (Eigen::Index j = 0; j < eigen_matrix.cols(); ++j) {
                cv_matrix.at<Scalar>(static_cast<int>(i), static_cast<int>(j)) = eigen_matrix(i, j);
            }
        }
        return cv_matrix;
    }

    // 3x3 CV_64F matrix for cv::warpPerspective and friends.
    inline cv::Mat toCV(const types::ProjectiveTransform &transform) {
        cv::Mat matrix;
        toCV(transform.toMatrix()).convertTo(matrix, CV_64F);
        return matrix;
    }

} // namespace common::utilities

#endif // COMMON_UTILITIES_MATRIX_HPP
