// File: types/projective_transform.hpp

#ifndef TYPE_PROJECTIVE_TRANSFORM_HPP
#define TYPE_PROJECTIVE_TRANSFORM_HPP

#include <array>
#include <string>
#include <vector>

#include <Eigen/Core>
#include <opencv2/core/types.hpp>

#include "types/homogeneous_point.hpp"

namespace types {

    /**
     * @brief 3x3 projective transform (homography) with 8 degrees of freedom.
     *
     * Elements are stored row-major as {m11, m12, m13, m21, m22, m23, m31, m32}; m33 is fixed to 1.
     * Every constructor and every operation keeps that normalized form. All arithmetic is single
     * precision.
     */
    class ProjectiveTransform {
    public:
        using Elements = std::array<float, 8>;

        // Identity.
        ProjectiveTransform() noexcept;

        ProjectiveTransform(float m11, float m12, float m13, float m21, float m22, float m23, float m31,
                            float m32) noexcept;

        /**
         * @brief Builds a transform from a full 3x3 matrix, dividing every element by m33.
         * @throws common::NumericSingularityError if m33 is zero.
         */
        ProjectiveTransform(float m11, float m12, float m13, float m21, float m22, float m23, float m31, float m32,
                            float m33);

        explicit ProjectiveTransform(const Elements &elements) noexcept;

        // @throws common::NumericSingularityError if matrix(2, 2) is zero.
        [[nodiscard]] static ProjectiveTransform fromMatrix(const Eigen::Matrix3d &matrix);

        [[nodiscard]] static ProjectiveTransform identity() noexcept { return {}; }

        [[nodiscard]] const Elements &elements() const noexcept { return elements_; }

        [[nodiscard]] float offsetX() const noexcept { return elements_[2]; }

        [[nodiscard]] float offsetY() const noexcept { return elements_[5]; }

        [[nodiscard]] float determinant() const noexcept;

        // Strictly positive determinant. Orientation-reversing transforms are rejected on purpose.
        [[nodiscard]] bool isInvertible() const noexcept;

        // Bottom row is (0, 0, 1).
        [[nodiscard]] bool isAffine() const noexcept;

        [[nodiscard]] bool isIdentity() const noexcept;

        /**
         * @brief Closed-form inverse through the cofactor matrix.
         * @throws common::NumericSingularityError if the determinant is zero or the inverse cannot be
         * brought back to normalized form.
         */
        [[nodiscard]] ProjectiveTransform invert() const;

        // this * other, renormalized.
        [[nodiscard]] ProjectiveTransform multiply(const ProjectiveTransform &other) const;

        [[nodiscard]] ProjectiveTransform operator*(const ProjectiveTransform &other) const { return multiply(other); }

        [[nodiscard]] HomogeneousPoint transform(const HomogeneousPoint &point) const noexcept;

        // Applies the perspective divide; a zero w produces non-finite coordinates.
        [[nodiscard]] cv::Point2f transform(const cv::Point2f &point) const noexcept;

        [[nodiscard]] std::vector<HomogeneousPoint> transformPoints(const std::vector<HomogeneousPoint> &points) const;

        [[nodiscard]] std::vector<cv::Point2f> transformPoints(const std::vector<cv::Point2f> &points) const;

        [[nodiscard]] Eigen::Matrix3f toMatrix() const noexcept;

        [[nodiscard]] bool isApprox(const ProjectiveTransform &other, float tolerance = 1e-5f) const noexcept;

        [[nodiscard]] std::string toString() const;

        [[nodiscard]] bool operator==(const ProjectiveTransform &other) const noexcept {
            return elements_ == other.elements_;
        }

        [[nodiscard]] bool operator!=(const ProjectiveTransform &other) const noexcept { return !(*this == other); }

    private:
        Elements elements_;
    };

} // namespace types

#endif // TYPE_PROJECTIVE_TRANSFORM_HPP
