// File: processing/image/aligner.hpp

#ifndef PROCESSING_IMAGE_ALIGNER_HPP
#define PROCESSING_IMAGE_ALIGNER_HPP

#include <memory>
#include <opencv2/core.hpp>

#include "processing/image/feature/detector.hpp"
#include "processing/image/feature/matcher.hpp"
#include "processing/image/homography/ransac_estimator.hpp"

namespace processing::image {

    struct AlignmentResult {
        Corners corners1;
        Corners corners2;
        Correspondences matches;
        HomographyEstimate estimate;

        [[nodiscard]] bool success() const noexcept { return estimate.success(); }

        // Matched pairs that agree with the estimated homography.
        [[nodiscard]] Correspondences inlierCorrespondences() const { return matches.subset(estimate.inliers); }
    };

    /*
     * Two-image registration pipeline: corners in both images, correlation matching, then a robust
     * homography mapping image 1 onto image 2.
     */
    class ImageAligner {
    public:
        ImageAligner(std::shared_ptr<CornerDetector> detector, std::shared_ptr<PointMatcher> matcher,
                     RansacHomographyEstimator estimator);

        // Harris corners, correlation matching and RANSAC, all configured from the configuration keys.
        [[nodiscard]] static ImageAligner fromConfiguration();

        [[nodiscard]] AlignmentResult align(const cv::Mat &image1, const cv::Mat &image2) const;

    private:
        std::shared_ptr<CornerDetector> detector_;
        std::shared_ptr<PointMatcher> matcher_;
        RansacHomographyEstimator estimator_;
    };

} // namespace processing::image

#endif // PROCESSING_IMAGE_ALIGNER_HPP
