// File: tests/types/projective_transform_test.cpp

#include <cmath>
#include <gtest/gtest.h>

#include "common/errors.hpp"
#include "types/projective_transform.hpp"

using types::HomogeneousPoint;
using types::ProjectiveTransform;

class ProjectiveTransformTest : public ::testing::Test {
protected:
    // Mild perspective warp with a positive determinant.
    const ProjectiveTransform warp{1.1f, 0.05f, 20.0f, -0.03f, 0.95f, 10.0f, 1e-4f, 2e-4f};
};

TEST_F(ProjectiveTransformTest, DefaultIsIdentity) {
    const ProjectiveTransform identity;
    EXPECT_TRUE(identity.isIdentity());
    EXPECT_TRUE(identity.isAffine());
    EXPECT_TRUE(identity.isInvertible());
    EXPECT_FLOAT_EQ(identity.determinant(), 1.0f);
    EXPECT_EQ(identity, ProjectiveTransform::identity());
}

TEST_F(ProjectiveTransformTest, NineElementConstructorNormalizes) {
    const ProjectiveTransform scaled(2.0f, 0.0f, 4.0f, 0.0f, 2.0f, 6.0f, 0.0f, 0.0f, 2.0f);
    EXPECT_TRUE(scaled.isAffine());
    EXPECT_FLOAT_EQ(scaled.offsetX(), 2.0f);
    EXPECT_FLOAT_EQ(scaled.offsetY(), 3.0f);
    EXPECT_EQ(scaled, ProjectiveTransform(1.0f, 0.0f, 2.0f, 0.0f, 1.0f, 3.0f, 0.0f, 0.0f));
}

TEST_F(ProjectiveTransformTest, ZeroScaleElementThrows) {
    EXPECT_THROW(ProjectiveTransform(1.0f, 0.0f, 0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 0.0f, 0.0f),
                 common::NumericSingularityError);

    Eigen::Matrix3d matrix = Eigen::Matrix3d::Identity();
    matrix(2, 2) = 0.0;
    EXPECT_THROW((void) ProjectiveTransform::fromMatrix(matrix), common::NumericSingularityError);
}

TEST_F(ProjectiveTransformTest, FromMatrixDividesByScale) {
    Eigen::Matrix3d matrix;
    matrix << 4, 0, 8, 0, 4, -4, 0, 0, 4;
    const auto transform = ProjectiveTransform::fromMatrix(matrix);
    EXPECT_EQ(transform, ProjectiveTransform(1.0f, 0.0f, 2.0f, 0.0f, 1.0f, -1.0f, 0.0f, 0.0f));
}

TEST_F(ProjectiveTransformTest, DoubleInversionRoundTrip) {
    ASSERT_TRUE(warp.isInvertible());
    EXPECT_TRUE(warp.invert().invert().isApprox(warp, 1e-4f)) << warp.invert().invert().toString();
}

TEST_F(ProjectiveTransformTest, PointRoundTripThroughInverse) {
    const auto inverse = warp.invert();
    for (const cv::Point2f point: {cv::Point2f(0.0f, 0.0f), cv::Point2f(50.0f, 80.0f), cv::Point2f(-30.0f, 120.0f)}) {
        const auto back = inverse.transform(warp.transform(point));
        EXPECT_NEAR(back.x, point.x, 1e-3f);
        EXPECT_NEAR(back.y, point.y, 1e-3f);
    }
}

TEST_F(ProjectiveTransformTest, ProductWithInverseIsIdentity) {
    const auto product = warp * warp.invert();
    EXPECT_TRUE(product.isApprox(ProjectiveTransform::identity(), 1e-4f)) << product.toString();
}

TEST_F(ProjectiveTransformTest, MultiplyComposesTransforms) {
    const ProjectiveTransform shift(1.0f, 0.0f, 5.0f, 0.0f, 1.0f, -3.0f, 0.0f, 0.0f);
    const auto composed = shift.multiply(warp);

    const cv::Point2f point(12.0f, 34.0f);
    const auto expected = shift.transform(warp.transform(point));
    const auto actual = composed.transform(point);
    EXPECT_NEAR(actual.x, expected.x, 1e-3f);
    EXPECT_NEAR(actual.y, expected.y, 1e-3f);

    EXPECT_EQ(warp * ProjectiveTransform::identity(), warp);
}

TEST_F(ProjectiveTransformTest, SingularInverseThrows) {
    const ProjectiveTransform singular(1.0f, 2.0f, 0.0f, 2.0f, 4.0f, 0.0f, 0.0f, 0.0f);
    EXPECT_FLOAT_EQ(singular.determinant(), 0.0f);
    EXPECT_FALSE(singular.isInvertible());
    EXPECT_THROW((void) singular.invert(), common::NumericSingularityError);
}

TEST_F(ProjectiveTransformTest, NegativeDeterminantIsNotInvertible) {
    const ProjectiveTransform mirror(-1.0f, 0.0f, 0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 0.0f);
    EXPECT_FLOAT_EQ(mirror.determinant(), -1.0f);
    EXPECT_FALSE(mirror.isInvertible());
    // The closed-form inverse still exists.
    EXPECT_EQ(mirror.invert(), mirror);
}

TEST_F(ProjectiveTransformTest, AffineDetection) {
    EXPECT_FALSE(warp.isAffine());
    EXPECT_TRUE(ProjectiveTransform(2.0f, 1.0f, 3.0f, 0.5f, 1.0f, 4.0f, 0.0f, 0.0f).isAffine());
}

TEST_F(ProjectiveTransformTest, HomogeneousTransformKeepsScale) {
    const auto points = warp.transformPoints(std::vector<HomogeneousPoint>{{100.0f, 100.0f}});
    ASSERT_EQ(points.size(), 1u);
    EXPECT_FLOAT_EQ(points[0].w, 1.0f + 1e-4f * 100.0f + 2e-4f * 100.0f);
    EXPECT_FALSE(points[0].isNormalized());

    const auto affine = warp.transformPoints(std::vector<cv::Point2f>{{100.0f, 100.0f}});
    EXPECT_NEAR(affine[0].x, points[0].x / points[0].w, 1e-4f);
    EXPECT_NEAR(affine[0].y, points[0].y / points[0].w, 1e-4f);
}

TEST_F(ProjectiveTransformTest, PointSentToInfinityIsNotFinite) {
    const ProjectiveTransform perspective(1.0f, 0.0f, 0.0f, 0.0f, 1.0f, 0.0f, 1.0f, 0.0f);
    const auto projected = perspective.transform(cv::Point2f(-1.0f, 0.0f));
    EXPECT_FALSE(std::isfinite(projected.x));

    const auto homogeneous = perspective.transform(HomogeneousPoint(-1.0f, 0.0f));
    EXPECT_TRUE(homogeneous.isAtInfinity());
    EXPECT_FALSE(types::toAffine(homogeneous).has_value());
}

TEST_F(ProjectiveTransformTest, ToMatrixHasUnitScale) {
    const Eigen::Matrix3f matrix = warp.toMatrix();
    EXPECT_FLOAT_EQ(matrix(2, 2), 1.0f);
    EXPECT_FLOAT_EQ(matrix(0, 2), 20.0f);
    EXPECT_FLOAT_EQ(matrix(2, 1), 2e-4f);
}
