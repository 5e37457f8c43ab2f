// File: processing/image/homography/homography_fitter.cpp

#include "processing/image/homography/homography_fitter.hpp"

#include <Eigen/SVD>
#include <cmath>
#include <numbers>
#include <string>

#include "common/errors.hpp"
#include "common/logging/logger.hpp"

namespace processing::image {

    namespace {

        template<typename PointType>
        void checkCorrespondences(const std::vector<PointType> &points1, const std::vector<PointType> &points2) {
            if (points1.size() != points2.size()) {
                throw common::ArgumentMismatchError("The number of points should be equal (" +
                                                    std::to_string(points1.size()) + " vs " +
                                                    std::to_string(points2.size()) + ")");
            }
            if (points1.size() < 4) {
                throw common::ArgumentMismatchError("At least four points are required to fit a homography");
            }
        }

        // T = [s 0 -s*xm; 0 s -s*ym; 0 0 1] with s chosen so the mean distance to the centroid is sqrt(2).
        types::ProjectiveTransform conditioningTransform(const std::vector<cv::Point2f> &points) {
            if (points.empty()) {
                throw common::NumericSingularityError("Cannot normalize an empty point set");
            }

            const auto n = static_cast<float>(points.size());
            float xmean = 0.0f, ymean = 0.0f;
            for (const auto &p: points) {
                xmean += p.x;
                ymean += p.y;
            }
            xmean /= n;
            ymean /= n;

            float spread = 0.0f;
            for (const auto &p: points) {
                const float x = p.x - xmean;
                const float y = p.y - ymean;
                spread += std::sqrt(x * x + y * y);
            }
            if (!(spread > 0.0f) || !std::isfinite(spread)) {
                throw common::NumericSingularityError("Cannot normalize a point set without spread");
            }

            const auto scale = static_cast<float>(std::numbers::sqrt2 * n / spread);
            return {scale, 0.0f, -scale * xmean, 0.0f, scale, -scale * ymean, 0.0f, 0.0f};
        }

    } // namespace

    HomographyFitter::Normalized<cv::Point2f> HomographyFitter::normalize(const std::vector<cv::Point2f> &points) {
        auto T = conditioningTransform(points);
        return {T.transformPoints(points), T};
    }

    HomographyFitter::Normalized<types::HomogeneousPoint>
    HomographyFitter::normalize(const std::vector<types::HomogeneousPoint> &points) {
        std::vector<cv::Point2f> divided;
        divided.reserve(points.size());
        for (const auto &p: points) {
            const auto affine = types::toAffine(p);
            if (!affine) {
                throw common::NumericSingularityError("Cannot normalize a point at infinity");
            }
            divided.push_back(*affine);
        }

        auto T = conditioningTransform(divided);
        std::vector<types::HomogeneousPoint> normalized;
        normalized.reserve(divided.size());
        for (const auto &p: divided) {
            normalized.push_back(T.transform(types::toHomogeneous(p)));
        }
        return {std::move(normalized), T};
    }

    Eigen::MatrixXd HomographyFitter::buildConstraintMatrix(const std::vector<cv::Point2f> &points1,
                                                            const std::vector<cv::Point2f> &points2) {
        checkCorrespondences(points1, points2);

        const auto N = static_cast<Eigen::Index>(points1.size());
        Eigen::MatrixXd A = Eigen::MatrixXd::Zero(2 * N, 9);
        for (Eigen::Index i = 0; i < N; ++i) {
            const double X = points1[i].x, Y = points1[i].y;
            const double x = points2[i].x, y = points2[i].y;
            const Eigen::Index r = 2 * i;

            A.row(r) << 0, 0, 0, -X, -Y, -1, y * X, y * Y, y;
            A.row(r + 1) << X, Y, 1, 0, 0, 0, -x * X, -x * Y, -x;
        }
        return A;
    }

    Eigen::MatrixXd HomographyFitter::buildConstraintMatrix(const std::vector<types::HomogeneousPoint> &points1,
                                                            const std::vector<types::HomogeneousPoint> &points2) {
        checkCorrespondences(points1, points2);

        const auto N = static_cast<Eigen::Index>(points1.size());
        Eigen::MatrixXd A = Eigen::MatrixXd::Zero(3 * N, 9);
        for (Eigen::Index i = 0; i < N; ++i) {
            const double X = points1[i].x, Y = points1[i].y, W = points1[i].w;
            const double x = points2[i].x, y = points2[i].y, w = points2[i].w;
            const Eigen::Index r = 3 * i;

            A.row(r) << 0, 0, 0, -w * X, -w * Y, -w * W, y * X, y * Y, y * W;
            A.row(r + 1) << w * X, w * Y, w * W, 0, 0, 0, -x * X, -x * Y, -x * W;
            A.row(r + 2) << -y * X, -y * Y, -y * W, x * X, x * Y, x * W, 0, 0, 0;
        }
        return A;
    }

    types::ProjectiveTransform HomographyFitter::fit(const std::vector<cv::Point2f> &points1,
                                                     const std::vector<cv::Point2f> &points2) {
        checkCorrespondences(points1, points2);

        const auto [normalized1, T1] = normalize(points1);
        const auto [normalized2, T2] = normalize(points2);
        return solve(buildConstraintMatrix(normalized1, normalized2), T1, T2);
    }

    types::ProjectiveTransform HomographyFitter::fit(const std::vector<types::HomogeneousPoint> &points1,
                                                     const std::vector<types::HomogeneousPoint> &points2) {
        checkCorrespondences(points1, points2);

        const auto [normalized1, T1] = normalize(points1);
        const auto [normalized2, T2] = normalize(points2);
        return solve(buildConstraintMatrix(normalized1, normalized2), T1, T2);
    }

    types::ProjectiveTransform HomographyFitter::solve(const Eigen::MatrixXd &A, const types::ProjectiveTransform &T1,
                                                       const types::ProjectiveTransform &T2) {
        // Thin A (exactly 8 equations) still needs the full V to reach the 9th right singular vector.
        const Eigen::JacobiSVD<Eigen::MatrixXd> svd(A, Eigen::ComputeFullV);
        const Eigen::VectorXd h = svd.matrixV().col(8);

        const types::ProjectiveTransform normalized(
                static_cast<float>(h(0)), static_cast<float>(h(1)), static_cast<float>(h(2)),
                static_cast<float>(h(3)), static_cast<float>(h(4)), static_cast<float>(h(5)),
                static_cast<float>(h(6)), static_cast<float>(h(7)), static_cast<float>(h(8)));

        if (!T2.isInvertible()) {
            throw common::NumericSingularityError("Normalizing transform of the second point set is not invertible");
        }

        const auto H = T2.invert() * (normalized * T1);
        LOG_TRACE("DLT fit over {} equations: {}", A.rows(), H);
        return H;
    }

} // namespace processing::image
