// File: processing/image/feature/matcher/correlation_matcher.cpp

#include "processing/image/feature/matcher/correlation_matcher.hpp"

#include <cmath>
#include <limits>
#include <string>

#include "common/errors.hpp"
#include "common/logging/logger.hpp"
#include "common/utilities/image.hpp"
#include "config/configuration.hpp"

namespace processing::image {

    namespace {

        // Indices of the points whose full window fits inside the image.
        std::vector<int> eligiblePoints(const Corners &points, const cv::Size &size, const int radius) {
            std::vector<int> indices;
            indices.reserve(points.size());
            for (int i = 0; i < static_cast<int>(points.size()); ++i) {
                const auto &p = points[i];
                if (p.x >= radius && p.x < size.width - radius && p.y >= radius && p.y < size.height - radius) {
                    indices.push_back(i);
                }
            }
            return indices;
        }

        Eigen::VectorXd extractWindow(const cv::Mat &gray, const cv::Point &center, const int radius) {
            const int size = 2 * radius + 1;
            Eigen::VectorXd window(size * size);
            for (int j = 0; j < size; ++j) {
                const uchar *row = gray.ptr<uchar>(center.y - radius + j);
                for (int i = 0; i < size; ++i) {
                    window(j * size + i) = row[center.x - radius + i];
                }
            }
            return window;
        }

        // First maximum in scan order; -infinity entries never win over a finite score.
        int argMax(const Eigen::Ref<const Eigen::VectorXd> &values) {
            int best = 0;
            for (int i = 1; i < values.size(); ++i) {
                if (values(i) > values(best)) {
                    best = i;
                }
            }
            return best;
        }

    } // namespace

    CorrelationMatcher::CorrelationMatcher(const Config &config) : config_(config), radius_(0) {
        if (config_.window_size <= 0 || config_.window_size % 2 == 0) {
            throw common::ArgumentMismatchError("Correlation window size must be a positive odd number, got " +
                                                std::to_string(config_.window_size));
        }
        radius_ = (config_.window_size - 1) / 2;
    }

    CorrelationMatcher CorrelationMatcher::fromConfiguration() {
        Config config;
        config.window_size = config::get("matching.correlation.window_size", config.window_size);
        config.max_distance = config::get("matching.correlation.max_distance", config.max_distance);
        return CorrelationMatcher(config);
    }

    Eigen::MatrixXd CorrelationMatcher::computeScoreMatrix(const cv::Mat &image1, const Corners &points1,
                                                           const cv::Mat &image2, const Corners &points2) const {
        const cv::Mat gray1 = common::utilities::toGrayscale(image1);
        const cv::Mat gray2 = common::utilities::toGrayscale(image2);

        Eigen::MatrixXd scores = Eigen::MatrixXd::Constant(static_cast<Eigen::Index>(points1.size()),
                                                           static_cast<Eigen::Index>(points2.size()),
                                                           -std::numeric_limits<double>::infinity());

        const auto eligible1 = eligiblePoints(points1, gray1.size(), radius_);
        const auto eligible2 = eligiblePoints(points2, gray2.size(), radius_);
        if (eligible1.empty() || eligible2.empty()) {
            return scores;
        }

        // Candidate windows of the second image are read once and paired with their energy.
        std::vector<Eigen::VectorXd> windows2;
        std::vector<double> norms2;
        windows2.reserve(eligible2.size());
        norms2.reserve(eligible2.size());
        for (const int index: eligible2) {
            windows2.push_back(extractWindow(gray2, points2[index], radius_));
            norms2.push_back(windows2.back().norm());
        }

        const double max_distance_squared = config_.max_distance * config_.max_distance;
        int skipped = 0;

        for (const int n1: eligible1) {
            const cv::Point &p1 = points1[n1];
            Eigen::VectorXd window1 = extractWindow(gray1, p1, radius_);
            const double norm1 = window1.norm();
            if (norm1 == 0.0) {
                ++skipped;
                continue;
            }
            window1 /= norm1;

            for (std::size_t k = 0; k < eligible2.size(); ++k) {
                const int n2 = eligible2[k];
                if (config_.max_distance != 0.0) {
                    const double dx = p1.x - points2[n2].x;
                    const double dy = p1.y - points2[n2].y;
                    if (!(dx * dx + dy * dy < max_distance_squared)) {
                        continue;
                    }
                }
                if (norms2[k] == 0.0) {
                    continue;
                }
                scores(n1, n2) = window1.dot(windows2[k]) / norms2[k];
            }
        }

        if (skipped > 0) {
            LOG_TRACE("{} zero-energy windows were left unscored", skipped);
        }
        return scores;
    }

    std::vector<std::pair<int, int>> CorrelationMatcher::selectMutualBest(const Eigen::MatrixXd &scores) {
        std::vector<std::pair<int, int>> pairs;
        if (scores.rows() == 0 || scores.cols() == 0) {
            return pairs;
        }

        std::vector<int> best_column(scores.rows());
        std::vector<int> best_row(scores.cols());
        for (Eigen::Index i = 0; i < scores.rows(); ++i) {
            best_column[i] = argMax(scores.row(i).transpose());
        }
        for (Eigen::Index j = 0; j < scores.cols(); ++j) {
            best_row[j] = argMax(scores.col(j));
        }

        for (int i = 0; i < static_cast<int>(scores.rows()); ++i) {
            const int j = best_column[i];
            if (best_row[j] == i && std::isfinite(scores(i, j))) {
                pairs.emplace_back(i, j);
            }
        }
        return pairs;
    }

    Correspondences CorrelationMatcher::match(const cv::Mat &image1, const Corners &points1, const cv::Mat &image2,
                                              const Corners &points2) const {
        const Eigen::MatrixXd scores = computeScoreMatrix(image1, points1, image2, points2);

        Correspondences correspondences;
        for (const auto &[i, j]: selectMutualBest(scores)) {
            correspondences.add(points1[i], points2[j], i, j);
        }

        LOG_DEBUG("Correlation matcher kept {} of {}x{} candidate pairs", correspondences.size(), points1.size(),
                  points2.size());
        return correspondences;
    }

} // namespace processing::image
