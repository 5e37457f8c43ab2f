// File: common/utilities/visualizer.cpp

#include "common/utilities/visualizer.hpp"

#include <algorithm>
#include <cmath>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <string>

#include "common/errors.hpp"
#include "common/logging/logger.hpp"
#include "common/utilities/matrix.hpp"

namespace common::utilities {

    namespace {
        // Largest side accepted for a blended canvas, in multiples of the larger input side.
        constexpr int kMaxCanvasScale = 8;
    } // namespace

    cv::Mat Visualizer::toBgr(const cv::Mat &image) {
        if (image.empty() || image.depth() != CV_8U) {
            throw UnsupportedFormatError("Visualizer expects a non-empty 8-bit image");
        }

        cv::Mat bgr;
        switch (image.channels()) {
            case 1:
                cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
                break;
            case 3:
                bgr = image.clone();
                break;
            case 4:
                cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
                break;
            default:
                throw UnsupportedFormatError("Unsupported channel count: " + std::to_string(image.channels()));
        }
        return bgr;
    }

    cv::Mat Visualizer::concatenate(const cv::Mat &image1, const cv::Mat &image2) {
        const cv::Mat left = toBgr(image1);
        const cv::Mat right = toBgr(image2);

        cv::Mat layout = cv::Mat::zeros(std::max(left.rows, right.rows), left.cols + right.cols, CV_8UC3);
        left.copyTo(layout(cv::Rect(0, 0, left.cols, left.rows)));
        right.copyTo(layout(cv::Rect(left.cols, 0, right.cols, right.rows)));
        return layout;
    }

    cv::Mat Visualizer::markPoints(const cv::Mat &image, const std::vector<cv::Point> &points, const cv::Scalar &color) {
        cv::Mat marked = toBgr(image);
        for (const auto &point: points) {
            cv::drawMarker(marked, point, color, cv::MARKER_CROSS, 7, 1);
        }
        return marked;
    }

    cv::Mat Visualizer::drawPairs(const cv::Mat &image1, const cv::Mat &image2, const std::vector<cv::Point> &points1,
                                  const std::vector<cv::Point> &points2, const cv::Scalar &color) {
        if (points1.size() != points2.size()) {
            throw ArgumentMismatchError("Pair overlay needs index-aligned point sets");
        }

        cv::Mat layout = concatenate(image1, image2);
        const cv::Point shift(image1.cols, 0);
        for (std::size_t i = 0; i < points1.size(); ++i) {
            cv::line(layout, points1[i], points2[i] + shift, color, 1, cv::LINE_AA);
            cv::circle(layout, points1[i], 2, color, cv::FILLED);
            cv::circle(layout, points2[i] + shift, 2, color, cv::FILLED);
        }
        return layout;
    }

    cv::Mat Visualizer::blend(const cv::Mat &image1, const cv::Mat &image2,
                              const types::ProjectiveTransform &homography) {
        const cv::Mat base = toBgr(image1);
        const cv::Mat overlay = toBgr(image2);

        // Image 2 is pulled back into image 1's frame.
        const types::ProjectiveTransform inverse = homography.invert();

        float min_x = 0.0f, min_y = 0.0f;
        auto max_x = static_cast<float>(base.cols), max_y = static_cast<float>(base.rows);
        const std::vector<cv::Point2f> outline{{0.0f, 0.0f},
                                               {static_cast<float>(overlay.cols), 0.0f},
                                               {static_cast<float>(overlay.cols), static_cast<float>(overlay.rows)},
                                               {0.0f, static_cast<float>(overlay.rows)}};
        for (const auto &corner: inverse.transformPoints(outline)) {
            if (!std::isfinite(corner.x) || !std::isfinite(corner.y)) {
                throw NumericSingularityError("Homography sends a corner of the second image to infinity");
            }
            min_x = std::min(min_x, corner.x);
            min_y = std::min(min_y, corner.y);
            max_x = std::max(max_x, corner.x);
            max_y = std::max(max_y, corner.y);
        }

        // Extents stay in double until they are known to fit the canvas limit.
        const double left = std::floor(-static_cast<double>(min_x));
        const double top = std::floor(-static_cast<double>(min_y));
        const double canvas_width = std::ceil(static_cast<double>(max_x)) + left;
        const double canvas_height = std::ceil(static_cast<double>(max_y)) + top;

        const int limit = kMaxCanvasScale * std::max({base.cols, base.rows, overlay.cols, overlay.rows});
        if (canvas_width > limit || canvas_height > limit) {
            LOG_WARN("Blended canvas {:.0f}x{:.0f} exceeds {} pixels, overlaying within the first image only",
                     canvas_width, canvas_height, limit);
            cv::Mat warped, blended;
            cv::warpPerspective(overlay, warped, toCV(inverse), base.size());
            cv::addWeighted(base, 0.5, warped, 0.5, 0.0, blended);
            return blended;
        }

        const int offset_x = static_cast<int>(left);
        const int offset_y = static_cast<int>(top);
        const int width = static_cast<int>(canvas_width);
        const int height = static_cast<int>(canvas_height);

        const types::ProjectiveTransform shift(1.0f, 0.0f, static_cast<float>(offset_x), 0.0f, 1.0f,
                                               static_cast<float>(offset_y), 0.0f, 0.0f);
        cv::Mat canvas;
        cv::warpPerspective(overlay, canvas, toCV(shift * inverse), cv::Size(width, height));
        base.copyTo(canvas(cv::Rect(offset_x, offset_y, base.cols, base.rows)));

        LOG_DEBUG("Blended canvas {}x{}, first image at ({}, {})", width, height, offset_x, offset_y);
        return canvas;
    }

    bool Visualizer::save(const cv::Mat &image, const std::string &output_path) {
        try {
            if (!cv::imwrite(output_path, image)) {
                LOG_ERROR("Failed to write image to: {}", output_path);
                return false;
            }
        } catch (const cv::Exception &e) {
            LOG_ERROR("OpenCV could not encode '{}': {}", output_path, e.what());
            return false;
        }
        LOG_INFO("Visualization saved to: {}", output_path);
        return true;
    }

} // namespace common::utilities
