// File: processing/image/feature/matcher.hpp

#ifndef FEATURE_MATCHER_HPP
#define FEATURE_MATCHER_HPP

#include <memory>
#include <opencv2/core.hpp>
#include <type_traits>
#include <utility>
#include <vector>

#include "processing/image/feature/detector.hpp"

namespace processing::image {

    /*
     * Index-aligned matched pairs: points1[k] in the first image corresponds to points2[k] in the
     * second one. indices1/indices2 point back into the corner lists that were matched.
     */
    struct Correspondences {
        std::vector<cv::Point> points1;
        std::vector<cv::Point> points2;
        std::vector<int> indices1;
        std::vector<int> indices2;

        [[nodiscard]] std::size_t size() const noexcept { return points1.size(); }

        [[nodiscard]] bool empty() const noexcept { return points1.empty(); }

        void add(const cv::Point &p1, const cv::Point &p2, const int index1, const int index2) {
            points1.push_back(p1);
            points2.push_back(p2);
            indices1.push_back(index1);
            indices2.push_back(index2);
        }

        // Keep only the pairs at the given positions, in that order.
        [[nodiscard]] Correspondences subset(const std::vector<int> &positions) const {
            Correspondences result;
            for (const int k: positions) {
                result.add(points1[k], points2[k], indices1[k], indices2[k]);
            }
            return result;
        }
    };

    class PointMatcher {
    public:
        virtual ~PointMatcher() = default;

        [[nodiscard]] virtual Correspondences match(const cv::Mat &image1, const Corners &points1, const cv::Mat &image2,
                                                    const Corners &points2) const = 0;

        template<typename T, typename... Args>
        static std::shared_ptr<PointMatcher> create(Args &&...args) {
            static_assert(std::is_base_of_v<PointMatcher, T>, "T must derive from PointMatcher");
            return std::make_shared<T>(std::forward<Args>(args)...);
        }
    };

} // namespace processing::image

#endif // FEATURE_MATCHER_HPP
