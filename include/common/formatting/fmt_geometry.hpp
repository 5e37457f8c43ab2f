// File: common/formatting/fmt_geometry.hpp

#ifndef FMT_GEOMETRY_HPP
#define FMT_GEOMETRY_HPP

#include <fmt/core.h>
#include <fmt/format.h>
#include <opencv2/core.hpp>

#include "types/homogeneous_point.hpp"
#include "types/projective_transform.hpp"

/*
 * fmt formatters for the geometric value types so they can be passed straight to LOG_* macros.
 * Example: LOG_DEBUG("Corner at {}, H = {}", point, homography);
 */

template<typename T>
struct fmt::formatter<cv::Point_<T>> {
    constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const cv::Point_<T> &point, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "({}, {})", point.x, point.y);
    }
};

template<>
struct fmt::formatter<types::HomogeneousPoint> {
    constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const types::HomogeneousPoint &point, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "({}, {}, {})", point.x, point.y, point.w);
    }
};

template<>
struct fmt::formatter<types::ProjectiveTransform> {
    constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const types::ProjectiveTransform &transform, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "{}", transform.toString());
    }
};

#endif // FMT_GEOMETRY_HPP
