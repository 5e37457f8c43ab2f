// File: processing/image/homography/homography_fitter.hpp

#ifndef PROCESSING_IMAGE_HOMOGRAPHY_FITTER_HPP
#define PROCESSING_IMAGE_HOMOGRAPHY_FITTER_HPP

#include <Eigen/Core>
#include <opencv2/core/types.hpp>
#include <utility>
#include <vector>

#include "types/homogeneous_point.hpp"
#include "types/projective_transform.hpp"

namespace processing::image {

    /**
     * @brief Normalized direct linear transform (DLT) homography estimation.
     *
     * Both point sets are conditioned (zero centroid, mean distance sqrt(2) from the origin), the
     * constraint x2 x (H * x1) = 0 is stacked into a linear system, and the null vector is taken from
     * the singular value decomposition. The result maps points1 onto points2.
     */
    class HomographyFitter {
    public:
        template<typename PointType>
        using Normalized = std::pair<std::vector<PointType>, types::ProjectiveTransform>;

        /**
         * @brief Fits a homography to perspective-divided correspondences (two equations per pair).
         *
         * @throws common::ArgumentMismatchError if the sets differ in size or hold fewer than 4 points.
         * @throws common::NumericSingularityError if a point set has no spread or the solution cannot be
         * denormalized.
         */
        [[nodiscard]] static types::ProjectiveTransform fit(const std::vector<cv::Point2f> &points1,
                                                            const std::vector<cv::Point2f> &points2);

        // Homogeneous variant, three (linearly dependent) equations per pair.
        [[nodiscard]] static types::ProjectiveTransform fit(const std::vector<types::HomogeneousPoint> &points1,
                                                            const std::vector<types::HomogeneousPoint> &points2);

        // @throws common::NumericSingularityError if the set is empty or has zero spread.
        [[nodiscard]] static Normalized<cv::Point2f> normalize(const std::vector<cv::Point2f> &points);

        // Points are perspective divided first. @throws common::NumericSingularityError at infinity.
        [[nodiscard]] static Normalized<types::HomogeneousPoint>
        normalize(const std::vector<types::HomogeneousPoint> &points);

        // 2N x 9 coefficient matrix.
        [[nodiscard]] static Eigen::MatrixXd buildConstraintMatrix(const std::vector<cv::Point2f> &points1,
                                                                   const std::vector<cv::Point2f> &points2);

        // 3N x 9 coefficient matrix.
        [[nodiscard]] static Eigen::MatrixXd buildConstraintMatrix(const std::vector<types::HomogeneousPoint> &points1,
                                                                   const std::vector<types::HomogeneousPoint> &points2);

    private:
        // Null vector of A, reshaped row-major, then H = T2^-1 * Hn * T1.
        [[nodiscard]] static types::ProjectiveTransform solve(const Eigen::MatrixXd &A,
                                                              const types::ProjectiveTransform &T1,
                                                              const types::ProjectiveTransform &T2);
    };

} // namespace processing::image

#endif // PROCESSING_IMAGE_HOMOGRAPHY_FITTER_HPP
