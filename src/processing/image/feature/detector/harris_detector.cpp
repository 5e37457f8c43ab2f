// File: processing/image/feature/detector/harris_detector.cpp

#include "processing/image/feature/detector/harris_detector.hpp"

#include <algorithm>

#include "common/errors.hpp"
#include "common/logging/logger.hpp"
#include "common/utilities/image.hpp"
#include "config/configuration.hpp"

namespace processing::image {

    namespace {

        inline uchar clampToByte(const int value) noexcept {
            return static_cast<uchar>(std::clamp(value, 0, 255));
        }

        // Applies -(row above) + (row below) over a 3-wide neighbourhood. Border pixels are 0.
        cv::Mat verticalDifference(const cv::Mat &source) {
            cv::Mat result = cv::Mat::zeros(source.size(), CV_8UC1);
            for (int y = 1; y < source.rows - 1; ++y) {
                const uchar *above = source.ptr<uchar>(y - 1);
                const uchar *below = source.ptr<uchar>(y + 1);
                uchar *out = result.ptr<uchar>(y);
                for (int x = 1; x < source.cols - 1; ++x) {
                    const int v = -(above[x - 1] + above[x] + above[x + 1]) + (below[x - 1] + below[x] + below[x + 1]);
                    out[x] = clampToByte(v);
                }
            }
            return result;
        }

        // Applies -(left column) + (right column) over a 3-tall neighbourhood. Border pixels are 0.
        cv::Mat horizontalDifference(const cv::Mat &source) {
            cv::Mat result = cv::Mat::zeros(source.size(), CV_8UC1);
            for (int y = 1; y < source.rows - 1; ++y) {
                const uchar *above = source.ptr<uchar>(y - 1);
                const uchar *row = source.ptr<uchar>(y);
                const uchar *below = source.ptr<uchar>(y + 1);
                uchar *out = result.ptr<uchar>(y);
                for (int x = 1; x < source.cols - 1; ++x) {
                    const int h = -(above[x - 1] + row[x - 1] + below[x - 1]) + (above[x + 1] + row[x + 1] + below[x + 1]);
                    out[x] = clampToByte(h);
                }
            }
            return result;
        }

    } // namespace

    HarrisCornerDetector::HarrisCornerDetector(const Config &config) : config_(config) {
        if (config_.suppression < 0) {
            throw common::ArgumentMismatchError("Suppression radius must be non-negative");
        }
        if (config_.sigma > 0.0 && (config_.blur_kernel_size <= 0 || config_.blur_kernel_size % 2 == 0)) {
            throw common::ArgumentMismatchError("Blur kernel size must be a positive odd number");
        }
    }

    HarrisCornerDetector HarrisCornerDetector::fromConfiguration() {
        Config config;
        config.k = config::get("corners.harris.k", config.k);
        config.threshold = config::get("corners.harris.threshold", config.threshold);
        config.sigma = config::get("corners.harris.sigma", config.sigma);
        config.suppression = config::get("corners.harris.suppression", config.suppression);
        config.blur_kernel_size = config::get("corners.harris.blur_kernel_size", config.blur_kernel_size);
        return HarrisCornerDetector(config);
    }

    cv::Mat HarrisCornerDetector::computeResponse(const cv::Mat &image) const {
        const cv::Mat gray = common::utilities::toGrayscale(image);

        cv::Mat dx = horizontalDifference(gray);
        cv::Mat dy = verticalDifference(gray);
        cv::Mat dxy = verticalDifference(dx);

        common::utilities::gaussianBlurInPlace(dx, config_.sigma, config_.blur_kernel_size);
        common::utilities::gaussianBlurInPlace(dy, config_.sigma, config_.blur_kernel_size);
        common::utilities::gaussianBlurInPlace(dxy, config_.sigma, config_.blur_kernel_size);

        cv::Mat response(gray.size(), CV_32FC1);
        for (int y = 0; y < gray.rows; ++y) {
            const uchar *a = dx.ptr<uchar>(y);
            const uchar *b = dy.ptr<uchar>(y);
            const uchar *c = dxy.ptr<uchar>(y);
            auto *m = response.ptr<float>(y);
            for (int x = 0; x < gray.cols; ++x) {
                const float A = a[x];
                const float B = b[x];
                const float C = c[x];
                const float M = (A * B - C * C) - config_.k * ((A + B) * (A + B));
                m[x] = M > config_.threshold ? M : 0.0f;
            }
        }
        return response;
    }

    Corners HarrisCornerDetector::detect(const cv::Mat &image) const {
        const cv::Mat response = computeResponse(image);
        Corners corners = suppressNonMaxima(response);
        LOG_DEBUG("Harris detector found {} corners in a {}x{} image", corners.size(), image.cols, image.rows);
        return corners;
    }

    Corners HarrisCornerDetector::suppressNonMaxima(const cv::Mat &response) const {
        const int r = config_.suppression;
        Corners corners;

        for (int y = r; y < response.rows - r; ++y) {
            const auto *row = response.ptr<float>(y);
            for (int x = r; x < response.cols - r; ++x) {
                const float current = row[x];
                if (current == 0.0f) {
                    continue;
                }

                bool is_maximum = true;
                for (int i = -r; i <= r && is_maximum; ++i) {
                    const auto *window = response.ptr<float>(y + i);
                    for (int j = -r; j <= r; ++j) {
                        if (window[x + j] > current) {
                            is_maximum = false;
                            break;
                        }
                    }
                }

                if (is_maximum) {
                    corners.emplace_back(x, y);
                }
            }
        }
        return corners;
    }

} // namespace processing::image
