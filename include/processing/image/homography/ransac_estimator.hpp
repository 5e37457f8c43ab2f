// File: processing/image/homography/ransac_estimator.hpp

#ifndef PROCESSING_IMAGE_HOMOGRAPHY_RANSAC_ESTIMATOR_HPP
#define PROCESSING_IMAGE_HOMOGRAPHY_RANSAC_ESTIMATOR_HPP

#include <cstdint>
#include <optional>
#include <opencv2/core/types.hpp>
#include <vector>

#include "processing/image/ransac.hpp"
#include "types/projective_transform.hpp"

namespace processing::image {

    enum class EstimationStatus { Success, InsufficientConsensus };

    struct HomographyEstimate {
        EstimationStatus status{EstimationStatus::InsufficientConsensus};
        std::optional<types::ProjectiveTransform> homography;
        std::vector<int> inliers; // Indices into the correspondence arrays
        int trials{0};

        [[nodiscard]] bool success() const noexcept {
            return status == EstimationStatus::Success && homography.has_value();
        }
    };

    /**
     * @brief Robust homography between two index-aligned point sets.
     *
     * Both sets are normalized once, RANSAC runs on 4-point samples in that normalized frame (so the
     * threshold is a squared symmetric transfer error in normalized units), and the winning consensus
     * set is refitted with the DLT before mapping the result back to pixel coordinates.
     *
     * Not finding a consensus of at least four points is reported through the returned status;
     * only inconsistent input sizes throw.
     */
    class RansacHomographyEstimator {
    public:
        struct Options {
            double threshold;
            double probability;
            int max_evaluations;
            int max_samplings;
            std::optional<std::uint32_t> seed;

            Options() :
                threshold(0.001), probability(0.99), max_evaluations(1000), max_samplings(100), seed(std::nullopt) {}
        };

        explicit RansacHomographyEstimator(const Options &options = Options());

        // Build from the "homography.ransac.*" configuration keys.
        [[nodiscard]] static RansacHomographyEstimator fromConfiguration();

        // @throws common::ArgumentMismatchError if the sets differ in size.
        [[nodiscard]] HomographyEstimate estimate(const std::vector<cv::Point2f> &points1,
                                                  const std::vector<cv::Point2f> &points2) const;

        [[nodiscard]] HomographyEstimate estimate(const std::vector<cv::Point> &points1,
                                                  const std::vector<cv::Point> &points2) const;

        [[nodiscard]] const Options &options() const noexcept { return options_; }

    private:
        // A sample model together with its inverse, which the backward transfer error needs.
        struct CandidateModel {
            types::ProjectiveTransform forward;
            types::ProjectiveTransform backward;
        };

        Options options_;

        [[nodiscard]] auto ransacOptions() const -> RANSAC<CandidateModel>::Options;
    };

    // Signed-area collinearity test: |(y1 - y2) x3 + (x2 - x1) y3 + (x1 y2 - y1 x2)| < float epsilon.
    [[nodiscard]] bool collinear(const cv::Point2f &p1, const cv::Point2f &p2, const cv::Point2f &p3) noexcept;

} // namespace processing::image

#endif // PROCESSING_IMAGE_HOMOGRAPHY_RANSAC_ESTIMATOR_HPP
