// File: processing/image/aligner.cpp

#include "processing/image/aligner.hpp"

#include <stdexcept>
#include <utility>

#include "common/logging/logger.hpp"
#include "common/timer.hpp"
#include "processing/image/feature/detector/harris_detector.hpp"
#include "processing/image/feature/matcher/correlation_matcher.hpp"

namespace processing::image {

    ImageAligner::ImageAligner(std::shared_ptr<CornerDetector> detector, std::shared_ptr<PointMatcher> matcher,
                               RansacHomographyEstimator estimator) :
        detector_(std::move(detector)), matcher_(std::move(matcher)), estimator_(std::move(estimator)) {
        if (!detector_ || !matcher_) {
            throw std::invalid_argument("ImageAligner requires a corner detector and a point matcher");
        }
    }

    ImageAligner ImageAligner::fromConfiguration() {
        return {CornerDetector::create<HarrisCornerDetector>(HarrisCornerDetector::fromConfiguration()),
                PointMatcher::create<CorrelationMatcher>(CorrelationMatcher::fromConfiguration()),
                RansacHomographyEstimator::fromConfiguration()};
    }

    AlignmentResult ImageAligner::align(const cv::Mat &image1, const cv::Mat &image2) const {
        AlignmentResult result;

        {
            common::Timer timer("corner detection");
            result.corners1 = detector_->detect(image1);
            result.corners2 = detector_->detect(image2);
        }
        LOG_INFO("Detected {} and {} corners", result.corners1.size(), result.corners2.size());

        {
            common::Timer timer("correlation matching");
            result.matches = matcher_->match(image1, result.corners1, image2, result.corners2);
        }
        LOG_INFO("Matched {} point pairs", result.matches.size());

        {
            common::Timer timer("homography estimation");
            result.estimate = estimator_.estimate(result.matches.points1, result.matches.points2);
        }

        if (result.success()) {
            LOG_INFO("Homography from {} inliers after {} trials: {}", result.estimate.inliers.size(),
                     result.estimate.trials, *result.estimate.homography);
        } else {
            LOG_WARN("No consensus among {} matched pairs", result.matches.size());
        }
        return result;
    }

} // namespace processing::image
