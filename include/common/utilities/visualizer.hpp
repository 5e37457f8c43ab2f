// File: common/utilities/visualizer.hpp

#ifndef COMMON_UTILITIES_VISUALIZER_HPP
#define COMMON_UTILITIES_VISUALIZER_HPP

#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "types/projective_transform.hpp"

namespace common::utilities {

    class Visualizer {
    public:
        // Places both images side by side (3-channel) with image 2 to the right of image 1.
        [[nodiscard]] static cv::Mat concatenate(const cv::Mat &image1, const cv::Mat &image2);

        // Marks points with small crosses on a 3-channel copy of the image.
        [[nodiscard]] static cv::Mat markPoints(const cv::Mat &image, const std::vector<cv::Point> &points,
                                                const cv::Scalar &color = cv::Scalar(255, 255, 255));

        /**
         * @brief Side-by-side overlay of matched pairs.
         *
         * Each pair points1[i] <-> points2[i] is joined by a line; points2 are shifted by the width of
         * image 1.
         */
        [[nodiscard]] static cv::Mat drawPairs(const cv::Mat &image1, const cv::Mat &image2,
                                               const std::vector<cv::Point> &points1,
                                               const std::vector<cv::Point> &points2,
                                               const cv::Scalar &color = cv::Scalar(255, 255, 255));

        /**
         * @brief Projects image 2 into the frame of image 1 and pastes image 1 on top.
         *
         * The canvas covers image 1 and the projected outline of image 2.
         *
         * @param homography Transform mapping image 1 coordinates onto image 2.
         * @throws common::NumericSingularityError if the homography cannot be inverted or sends a corner
         * of image 2 to infinity.
         */
        [[nodiscard]] static cv::Mat blend(const cv::Mat &image1, const cv::Mat &image2,
                                           const types::ProjectiveTransform &homography);

        // Writes the image and logs the destination. Returns false if OpenCV could not encode it.
        static bool save(const cv::Mat &image, const std::string &output_path);

    private:
        [[nodiscard]] static cv::Mat toBgr(const cv::Mat &image);
    };

} // namespace common::utilities

#endif // COMMON_UTILITIES_VISUALIZER_HPP
