// File: types/homogeneous_point.hpp

#ifndef TYPE_HOMOGENEOUS_POINT_HPP
#define TYPE_HOMOGENEOUS_POINT_HPP

#include <optional>
#include <opencv2/core/types.hpp>

#include "common/errors.hpp"

namespace types {

    /**
     * @brief A 2D point in homogeneous coordinates (x, y, w).
     *
     * Points that differ only by scale represent the same location and compare equal. The perspective
     * divide is never implicit: use toAffine() or normalized() to leave homogeneous space, both of
     * which make the w == 0 case (point at infinity) explicit.
     */
    struct HomogeneousPoint {
        float x{0.0f};
        float y{0.0f};
        float w{1.0f};

        constexpr HomogeneousPoint() noexcept = default;

        constexpr HomogeneousPoint(const float x, const float y) noexcept : x(x), y(y), w(1.0f) {}

        constexpr HomogeneousPoint(const float x, const float y, const float w) noexcept : x(x), y(y), w(w) {}

        [[nodiscard]] constexpr bool isNormalized() const noexcept { return w == 1.0f; }

        [[nodiscard]] constexpr bool isAtInfinity() const noexcept { return w == 0.0f; }

        /**
         * @brief Returns the same point scaled to w = 1.
         * @throws common::NumericSingularityError if the point lies at infinity.
         */
        [[nodiscard]] HomogeneousPoint normalized() const {
            if (isAtInfinity()) {
                throw common::NumericSingularityError("Cannot normalize a point at infinity");
            }
            return {x / w, y / w, 1.0f};
        }

        [[nodiscard]] constexpr HomogeneousPoint operator*(const float scale) const noexcept {
            return {x * scale, y * scale, w * scale};
        }

        [[nodiscard]] constexpr HomogeneousPoint operator+(const HomogeneousPoint &other) const noexcept {
            return {x + other.x, y + other.y, w + other.w};
        }

        [[nodiscard]] constexpr HomogeneousPoint operator-(const HomogeneousPoint &other) const noexcept {
            return {x - other.x, y - other.y, w - other.w};
        }

        // Equal iff the perspective-divided coordinates match.
        [[nodiscard]] bool operator==(const HomogeneousPoint &other) const noexcept {
            return x / w == other.x / other.w && y / w == other.y / other.w;
        }

        [[nodiscard]] bool operator!=(const HomogeneousPoint &other) const noexcept { return !(*this == other); }
    };

    [[nodiscard]] inline HomogeneousPoint toHomogeneous(const cv::Point2f &point) noexcept {
        return {point.x, point.y, 1.0f};
    }

    [[nodiscard]] inline HomogeneousPoint toHomogeneous(const cv::Point &point) noexcept {
        return {static_cast<float>(point.x), static_cast<float>(point.y), 1.0f};
    }

    // Perspective divide. Empty for points at infinity.
    [[nodiscard]] inline std::optional<cv::Point2f> toAffine(const HomogeneousPoint &point) noexcept {
        if (point.isAtInfinity()) {
            return std::nullopt;
        }
        return cv::Point2f(point.x / point.w, point.y / point.w);
    }

} // namespace types

#endif // TYPE_HOMOGENEOUS_POINT_HPP
