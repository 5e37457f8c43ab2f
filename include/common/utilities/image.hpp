// File: common/utilities/image.hpp

#ifndef COMMON_UTILITIES_IMAGE_HPP
#define COMMON_UTILITIES_IMAGE_HPP

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <string>

#include "common/errors.hpp"
#include "common/logging/logger.hpp"

namespace common::utilities {

    /**
     * @brief Converts an 8-bit image to single-channel grayscale.
     *
     * Single-channel input is returned as is (shallow copy). Three-channel input is treated as BGR,
     * four-channel input as BGRA.
     *
     * @param image Input image (CV_8UC1, CV_8UC3 or CV_8UC4).
     * @return cv::Mat The grayscale image (CV_8UC1).
     *
     * @throws common::UnsupportedFormatError if the image is empty, not 8-bit, or has another channel count.
     */
    inline cv::Mat toGrayscale(const cv::Mat &image) {
        if (image.empty()) {
            throw UnsupportedFormatError("Input image is empty.");
        }
        if (image.depth() != CV_8U) {
            throw UnsupportedFormatError("Only 8-bit images are supported.");
        }

        cv::Mat gray;
        switch (image.channels()) {
            case 1:
                LOG_TRACE("Image is already grayscale");
                return image;
            case 3:
                cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
                break;
            case 4:
                cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
                break;
            default:
                throw UnsupportedFormatError("Unsupported channel count: " + std::to_string(image.channels()));
        }
        LOG_TRACE("Converted {}-channel image to grayscale", image.channels());
        return gray;
    }

    /**
     * @brief Gaussian blur of a single-channel buffer, in place.
     *
     * @param image Buffer to blur.
     * @param sigma Standard deviation in both directions. Non-positive values leave the buffer untouched.
     * @param kernel_size Odd aperture size.
     */
    inline void gaussianBlurInPlace(cv::Mat &image, const double sigma, const int kernel_size) {
        if (sigma <= 0.0) {
            return;
        }
        cv::GaussianBlur(image, image, cv::Size(kernel_size, kernel_size), sigma, sigma, cv::BORDER_REPLICATE);
    }

} // namespace common::utilities

#endif // COMMON_UTILITIES_IMAGE_HPP
