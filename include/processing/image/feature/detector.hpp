// File: processing/image/feature/detector.hpp

#ifndef FEATURE_DETECTOR_HPP
#define FEATURE_DETECTOR_HPP

#include <memory>
#include <opencv2/core.hpp>
#include <type_traits>
#include <utility>
#include <vector>

namespace processing::image {

    using Corners = std::vector<cv::Point>;

    class CornerDetector {
    public:
        virtual ~CornerDetector() = default;

        // Detect interest points in an image and return them in raster order.
        [[nodiscard]] virtual Corners detect(const cv::Mat &image) const = 0;

        template<typename T, typename... Args>
        static std::shared_ptr<CornerDetector> create(Args &&...args) {
            static_assert(std::is_base_of_v<CornerDetector, T>, "T must derive from CornerDetector");
            return std::make_shared<T>(std::forward<Args>(args)...);
        }
    };

} // namespace processing::image

#endif // FEATURE_DETECTOR_HPP
