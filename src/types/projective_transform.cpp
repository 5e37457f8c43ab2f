// File: types/projective_transform.cpp

#include "types/projective_transform.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>

#include "common/errors.hpp"

namespace types {

    ProjectiveTransform::ProjectiveTransform() noexcept : elements_{1, 0, 0, 0, 1, 0, 0, 0} {}

    ProjectiveTransform::ProjectiveTransform(const float m11, const float m12, const float m13, const float m21,
                                             const float m22, const float m23, const float m31,
                                             const float m32) noexcept :
        elements_{m11, m12, m13, m21, m22, m23, m31, m32} {}

    ProjectiveTransform::ProjectiveTransform(const float m11, const float m12, const float m13, const float m21,
                                             const float m22, const float m23, const float m31, const float m32,
                                             const float m33) :
        elements_{m11, m12, m13, m21, m22, m23, m31, m32} {
        if (m33 == 0.0f) {
            throw common::NumericSingularityError("Projective matrix has a zero scale element");
        }
        for (auto &element: elements_) {
            element /= m33;
        }
    }

    ProjectiveTransform::ProjectiveTransform(const Elements &elements) noexcept : elements_(elements) {}

    ProjectiveTransform ProjectiveTransform::fromMatrix(const Eigen::Matrix3d &matrix) {
        const double scale = matrix(2, 2);
        if (scale == 0.0) {
            throw common::NumericSingularityError("Projective matrix has a zero scale element");
        }
        Elements elements{};
        for (int i = 0, k = 0; i < 3; ++i) {
            for (int j = 0; j < 3 && k < 8; ++j, ++k) {
                elements[k] = static_cast<float>(matrix(i, j) / scale);
            }
        }
        return ProjectiveTransform(elements);
    }

    float ProjectiveTransform::determinant() const noexcept {
        const auto &e = elements_;
        return e[0] * (e[4] - e[5] * e[7]) - e[1] * (e[3] - e[5] * e[6]) + e[2] * (e[3] * e[7] - e[4] * e[6]);
    }

    bool ProjectiveTransform::isInvertible() const noexcept { return determinant() > 0.0f; }

    bool ProjectiveTransform::isAffine() const noexcept { return elements_[6] == 0.0f && elements_[7] == 0.0f; }

    bool ProjectiveTransform::isIdentity() const noexcept { return elements_ == Elements{1, 0, 0, 0, 1, 0, 0, 0}; }

    ProjectiveTransform ProjectiveTransform::invert() const {
        //                  (ei-fh)   (ch-bi)   (bf-ce)
        //  inv(A) = 1/det  (fg-di)   (ai-cg)   (cd-af)
        //                  (dh-eg)   (bg-ah)   (ae-bd)
        // with i == 1.
        const float a = elements_[0], b = elements_[1], c = elements_[2];
        const float d = elements_[3], e = elements_[4], f = elements_[5];
        const float g = elements_[6], h = elements_[7];

        const float det = determinant();
        if (det == 0.0f) {
            throw common::NumericSingularityError("Projective transform is singular (determinant is zero)");
        }

        const float m = 1.0f / det;
        return {m * (e - f * h), m * (c * h - b), m * (b * f - c * e),
                m * (f * g - d), m * (a - c * g), m * (c * d - a * f),
                m * (d * h - e * g), m * (b * g - a * h), m * (a * e - b * d)};
    }

    ProjectiveTransform ProjectiveTransform::multiply(const ProjectiveTransform &other) const {
        const auto &l = elements_;
        const auto &r = other.elements_;

        return {l[0] * r[0] + l[1] * r[3] + l[2] * r[6], l[0] * r[1] + l[1] * r[4] + l[2] * r[7],
                l[0] * r[2] + l[1] * r[5] + l[2],

                l[3] * r[0] + l[4] * r[3] + l[5] * r[6], l[3] * r[1] + l[4] * r[4] + l[5] * r[7],
                l[3] * r[2] + l[4] * r[5] + l[5],

                l[6] * r[0] + l[7] * r[3] + r[6],        l[6] * r[1] + l[7] * r[4] + r[7],
                l[6] * r[2] + l[7] * r[5] + 1.0f};
    }

    HomogeneousPoint ProjectiveTransform::transform(const HomogeneousPoint &point) const noexcept {
        const auto &e = elements_;
        return {e[0] * point.x + e[1] * point.y + e[2] * point.w, e[3] * point.x + e[4] * point.y + e[5] * point.w,
                e[6] * point.x + e[7] * point.y + point.w};
    }

    cv::Point2f ProjectiveTransform::transform(const cv::Point2f &point) const noexcept {
        const auto &e = elements_;
        const float w = e[6] * point.x + e[7] * point.y + 1.0f;
        return {(e[0] * point.x + e[1] * point.y + e[2]) / w, (e[3] * point.x + e[4] * point.y + e[5]) / w};
    }

    std::vector<HomogeneousPoint>
    ProjectiveTransform::transformPoints(const std::vector<HomogeneousPoint> &points) const {
        std::vector<HomogeneousPoint> result(points.size());
        std::ranges::transform(points, result.begin(), [this](const HomogeneousPoint &p) { return transform(p); });
        return result;
    }

    std::vector<cv::Point2f> ProjectiveTransform::transformPoints(const std::vector<cv::Point2f> &points) const {
        std::vector<cv::Point2f> result(points.size());
        std::ranges::transform(points, result.begin(), [this](const cv::Point2f &p) { return transform(p); });
        return result;
    }

    Eigen::Matrix3f ProjectiveTransform::toMatrix() const noexcept {
        Eigen::Matrix3f matrix;
        matrix << elements_[0], elements_[1], elements_[2], elements_[3], elements_[4], elements_[5], elements_[6],
                elements_[7], 1.0f;
        return matrix;
    }

    bool ProjectiveTransform::isApprox(const ProjectiveTransform &other, const float tolerance) const noexcept {
        for (std::size_t i = 0; i < elements_.size(); ++i) {
            const float scale = std::max({1.0f, std::abs(elements_[i]), std::abs(other.elements_[i])});
            if (!(std::abs(elements_[i] - other.elements_[i]) <= tolerance * scale)) {
                return false;
            }
        }
        return true;
    }

    std::string ProjectiveTransform::toString() const {
        const auto &e = elements_;
        return fmt::format("[[{:.6g}, {:.6g}, {:.6g}], [{:.6g}, {:.6g}, {:.6g}], [{:.6g}, {:.6g}, 1]]", e[0], e[1],
                           e[2], e[3], e[4], e[5], e[6], e[7]);
    }

} // namespace types
