// File: processing/image/homography/ransac_estimator.cpp

#include "processing/image/homography/ransac_estimator.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <tuple>

#include "common/errors.hpp"
#include "common/logging/logger.hpp"
#include "config/configuration.hpp"
#include "processing/image/homography/homography_fitter.hpp"

namespace processing::image {

    namespace {

        std::vector<cv::Point2f> select(const std::vector<cv::Point2f> &points, const std::vector<int> &indices) {
            std::vector<cv::Point2f> result;
            result.reserve(indices.size());
            for (const int index: indices) {
                result.push_back(points[index]);
            }
            return result;
        }

        bool anyThreeCollinear(const std::vector<cv::Point2f> &points, const std::vector<int> &sample) {
            const auto &a = points[sample[0]];
            const auto &b = points[sample[1]];
            const auto &c = points[sample[2]];
            const auto &d = points[sample[3]];
            return collinear(a, b, c) || collinear(a, b, d) || collinear(a, c, d) || collinear(b, c, d);
        }

    } // namespace

    bool collinear(const cv::Point2f &p1, const cv::Point2f &p2, const cv::Point2f &p3) noexcept {
        return std::abs((p1.y - p2.y) * p3.x + (p2.x - p1.x) * p3.y + (p1.x * p2.y - p1.y * p2.x)) <
               std::numeric_limits<float>::epsilon();
    }

    RansacHomographyEstimator::RansacHomographyEstimator(const Options &options) : options_(options) {
        if (options_.probability <= 0.0 || options_.probability >= 1.0) {
            throw common::ArgumentMismatchError("RANSAC probability must lie in (0, 1)");
        }
        if (options_.max_evaluations <= 0 || options_.max_samplings <= 0) {
            throw common::ArgumentMismatchError("RANSAC evaluation and sampling limits must be positive");
        }
    }

    RansacHomographyEstimator RansacHomographyEstimator::fromConfiguration() {
        Options options;
        options.threshold = config::get("homography.ransac.threshold", options.threshold);
        options.probability = config::get("homography.ransac.probability", options.probability);
        options.max_evaluations = config::get("homography.ransac.max_evaluations", options.max_evaluations);
        options.max_samplings = config::get("homography.ransac.max_samplings", options.max_samplings);
        if (const auto seed = config::get<std::uint32_t>("homography.ransac.seed")) {
            options.seed = *seed;
        }
        return RansacHomographyEstimator(options);
    }

    auto RansacHomographyEstimator::ransacOptions() const -> RANSAC<CandidateModel>::Options {
        RANSAC<CandidateModel>::Options options;
        options.sample_size = 4;
        options.distance_threshold = options_.threshold;
        options.probability = options_.probability;
        options.max_evaluations = options_.max_evaluations;
        options.max_samplings = options_.max_samplings;
        options.seed = options_.seed;
        return options;
    }

    HomographyEstimate RansacHomographyEstimator::estimate(const std::vector<cv::Point> &points1,
                                                           const std::vector<cv::Point> &points2) const {
        if (points1.size() != points2.size()) {
            throw common::ArgumentMismatchError("The number of points should be equal.");
        }
        std::vector<cv::Point2f> p1(points1.begin(), points1.end());
        std::vector<cv::Point2f> p2(points2.begin(), points2.end());
        return estimate(p1, p2);
    }

    HomographyEstimate RansacHomographyEstimator::estimate(const std::vector<cv::Point2f> &points1,
                                                           const std::vector<cv::Point2f> &points2) const {
        if (points1.size() != points2.size()) {
            throw common::ArgumentMismatchError("The number of points should be equal (" +
                                                std::to_string(points1.size()) + " vs " +
                                                std::to_string(points2.size()) + ")");
        }

        HomographyEstimate estimate;
        if (points1.size() < 4) {
            LOG_WARN("At least four correspondences are required, got {}", points1.size());
            return estimate;
        }

        // Everything below works in the normalized frames of both sets.
        std::vector<cv::Point2f> set1, set2;
        types::ProjectiveTransform T1, T2;
        try {
            std::tie(set1, T1) = HomographyFitter::normalize(points1);
            std::tie(set2, T2) = HomographyFitter::normalize(points2);
        } catch (const common::NumericSingularityError &e) {
            LOG_WARN("Correspondences cannot be normalized: {}", e.what());
            return estimate;
        }

        const auto fit = [&set1, &set2](const std::vector<int> &sample) -> std::optional<CandidateModel> {
            try {
                auto H = HomographyFitter::fit(select(set1, sample), select(set2, sample));
                auto inverse = H.invert();
                return CandidateModel{H, inverse};
            } catch (const common::NumericSingularityError &e) {
                LOG_TRACE("Discarding sample: {}", e.what());
                return std::nullopt;
            }
        };

        const auto degenerate = [&set1, &set2](const std::vector<int> &sample) {
            return anyThreeCollinear(set1, sample) || anyThreeCollinear(set2, sample);
        };

        // Symmetric transfer error: forward residual in the second frame plus backward residual in the first.
        const auto inliers = [&set1, &set2](const CandidateModel &model, const double threshold) {
            const auto projected1 = model.forward.transformPoints(set1);
            const auto projected2 = model.backward.transformPoints(set2);

            std::vector<int> result;
            for (int i = 0; i < static_cast<int>(set1.size()); ++i) {
                const float ax = set1[i].x - projected2[i].x;
                const float ay = set1[i].y - projected2[i].y;
                const float bx = set2[i].x - projected1[i].x;
                const float by = set2[i].y - projected1[i].y;
                const double d2 = ax * ax + ay * ay + bx * bx + by * by;
                if (d2 < threshold) {
                    result.push_back(i);
                }
            }
            return result;
        };

        const RANSAC<CandidateModel> ransac(fit, degenerate, inliers, ransacOptions());
        const auto result = ransac.compute(static_cast<int>(set1.size()));

        if (!result || result->inliers.size() < 4) {
            LOG_WARN("RANSAC could not find enough points to fit a homography ({} inliers)",
                     result ? result->inliers.size() : 0);
            if (result) {
                estimate.trials = result->trials;
            }
            return estimate;
        }

        try {
            const auto refit = HomographyFitter::fit(select(set1, result->inliers), select(set2, result->inliers));
            estimate.homography = T2.invert() * (refit * T1);
        } catch (const common::NumericSingularityError &e) {
            LOG_WARN("Final refit over {} inliers failed: {}", result->inliers.size(), e.what());
            estimate.trials = result->trials;
            return estimate;
        }

        estimate.status = EstimationStatus::Success;
        estimate.inliers = result->inliers;
        estimate.trials = result->trials;
        LOG_DEBUG("RANSAC kept {} of {} correspondences after {} trials", estimate.inliers.size(), points1.size(),
                  estimate.trials);
        return estimate;
    }

} // namespace processing::image
