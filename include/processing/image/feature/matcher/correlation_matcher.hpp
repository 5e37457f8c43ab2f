// File: processing/image/feature/matcher/correlation_matcher.hpp

#ifndef FEATURE_MATCHER_CORRELATION_HPP
#define FEATURE_MATCHER_CORRELATION_HPP

#include <Eigen/Core>
#include <opencv2/core.hpp>

#include "processing/image/feature/matcher.hpp"

namespace processing::image {

    /**
     * @brief Matches points between two images by normalized correlation of the surrounding windows.
     *
     * Every eligible point of the first image is compared against every eligible point of the second
     * image (or only those closer than max_distance) and a pair is kept only when each point is the
     * other's best scoring partner.
     */
    class CorrelationMatcher final : public PointMatcher {
    public:
        struct Config {
            int window_size;
            double max_distance; // 0 means unrestricted

            Config() : window_size(9), max_distance(0.0) {}
        };

        // @throws common::ArgumentMismatchError if the window size is even or not positive.
        explicit CorrelationMatcher(const Config &config = Config());

        // Build from the "matching.correlation.*" configuration keys.
        [[nodiscard]] static CorrelationMatcher fromConfiguration();

        // @throws common::UnsupportedFormatError if either image cannot be reduced to 8-bit grayscale.
        [[nodiscard]] Correspondences match(const cv::Mat &image1, const Corners &points1, const cv::Mat &image2,
                                            const Corners &points2) const override;

        /**
         * @brief Correlation scores between all point pairs.
         *
         * Rows follow points1, columns follow points2. Pairs that were never evaluated (border
         * points, pairs further apart than max_distance, zero-energy windows) hold -infinity.
         */
        [[nodiscard]] Eigen::MatrixXd computeScoreMatrix(const cv::Mat &image1, const Corners &points1,
                                                         const cv::Mat &image2, const Corners &points2) const;

        // Mutual best (row, column) pairs with a finite score, ordered by row.
        [[nodiscard]] static std::vector<std::pair<int, int>> selectMutualBest(const Eigen::MatrixXd &scores);

        [[nodiscard]] const Config &config() const noexcept { return config_; }

    private:
        Config config_;
        int radius_;
    };

} // namespace processing::image

#endif // FEATURE_MATCHER_CORRELATION_HPP
