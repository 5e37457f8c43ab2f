// File: processing/image/feature/detector/harris_detector.hpp

#ifndef FEATURE_DETECTOR_HARRIS_HPP
#define FEATURE_DETECTOR_HARRIS_HPP

#include <opencv2/core.hpp>

#include "processing/image/feature/detector.hpp"

namespace processing::image {

    /**
     * @brief Harris corner detector working on clamped 8-bit gradient proxies.
     *
     * The gradients are the Prewitt-like 3x3 stencils clamped to [0, 255], the cross term is the
     * vertical stencil applied to the horizontal gradient, and the three buffers are optionally
     * smoothed before the response M = (A*B - C^2) - k*(A + B)^2 is computed. Responses that do not
     * exceed the threshold are zeroed; the remaining local maxima (ties allowed) are the corners.
     */
    class HarrisCornerDetector final : public CornerDetector {
    public:
        struct Config {
            float k;
            float threshold;
            double sigma;
            int suppression;
            int blur_kernel_size;

            Config() : k(0.04f), threshold(1000.0f), sigma(1.4), suppression(3), blur_kernel_size(5) {}
        };

        // @throws common::ArgumentMismatchError for a negative radius or an unusable blur kernel.
        explicit HarrisCornerDetector(const Config &config = Config());

        // Build from the "corners.harris.*" configuration keys.
        [[nodiscard]] static HarrisCornerDetector fromConfiguration();

        // @throws common::UnsupportedFormatError if the image cannot be reduced to 8-bit grayscale.
        [[nodiscard]] Corners detect(const cv::Mat &image) const override;

        // Thresholded corner response map (CV_32FC1, same size as the image).
        [[nodiscard]] cv::Mat computeResponse(const cv::Mat &image) const;

        [[nodiscard]] const Config &config() const noexcept { return config_; }

    private:
        Config config_;

        [[nodiscard]] Corners suppressNonMaxima(const cv::Mat &response) const;
    };

} // namespace processing::image

#endif // FEATURE_DETECTOR_HARRIS_HPP
