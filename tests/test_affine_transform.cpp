/**
 * @file test_affine_transform.cpp
 * @brief 命名轴仿射变换测试
 *
 * 覆盖：工厂方法、按轴顺序生成矩阵、Sequence 的中间轴推导、求逆、相等比较。
 */

#include <gtest/gtest.h>
#include <cmath>
#include "math/transform/affine_transform.hpp"
#include "math/tensor/tensor.hpp"
#include "spalign/common/exceptions.hpp"

using namespace spalign;
using namespace spalign::math::transform;
using namespace spalign::math::transform::constants;

// 测试辅助函数
bool isApproxEqual(const MatrixXd& a, const MatrixXd& b, double tolerance = EPSILON) {
    return a.rows() == b.rows() && a.cols() == b.cols() && (a - b).cwiseAbs().maxCoeff() < tolerance;
}

#define EXPECT_APPROX_EQ(a, b) EXPECT_TRUE(isApproxEqual(a, b))

// ==================== 工厂方法 ====================

TEST(AffineTransformTest, DefaultConstructorIsIdentity) {
    AffineTransform t;
    EXPECT_EQ(t.kind(), TransformKind::IDENTITY);
    EXPECT_TRUE(t.isIdentity({"x", "y"}));
    EXPECT_APPROX_EQ(t.toAffineMatrix({"y", "x"}, {"y", "x"}), MatrixXd::Identity(3, 3));
}

TEST(AffineTransformTest, TranslationMatrix) {
    auto t = AffineTransform::Translation(Eigen::Vector2d(5.0, -2.0), {"x", "y"});
    MatrixXd expected = MatrixXd::Identity(3, 3);
    expected(0, 2) = 5.0;
    expected(1, 2) = -2.0;
    EXPECT_APPROX_EQ(t.toAffineMatrix({"x", "y"}, {"x", "y"}), expected);
}

TEST(AffineTransformTest, ScaleMatrixFollowsRequestedAxisOrder) {
    auto t = AffineTransform::Scale(Eigen::Vector2d(2.0, 3.0), {"x", "y"});
    MatrixXd m = t.toAffineMatrix({"y", "x"}, {"y", "x"});
    EXPECT_DOUBLE_EQ(m(0, 0), 3.0) << "y factor should come first";
    EXPECT_DOUBLE_EQ(m(1, 1), 2.0);
    EXPECT_DOUBLE_EQ(m(2, 2), 1.0);
}

TEST(AffineTransformTest, UnmappedAxesPassThrough) {
    auto t = AffineTransform::Scale(Eigen::Vector2d(2.0, 2.0), {"y", "x"});
    MatrixXd m = t.toAffineMatrix({"c", "y", "x"}, {"c", "y", "x"});
    MatrixXd expected = MatrixXd::Identity(4, 4);
    expected(1, 1) = 2.0;
    expected(2, 2) = 2.0;
    EXPECT_APPROX_EQ(m, expected);
}

TEST(AffineTransformTest, RotationQuarterTurn) {
    auto t = AffineTransform::Rotation(HALF_PI, {"x", "y"});
    MatrixXd m = t.toAffineMatrix({"x", "y"}, {"x", "y"});
    Eigen::Vector3d p(1.0, 0.0, 1.0);
    Eigen::Vector3d q = m * p;
    EXPECT_NEAR(q[0], 0.0, 1e-12);
    EXPECT_NEAR(q[1], 1.0, 1e-12);
}

TEST(AffineTransformTest, AffineOnChannelRaster) {
    // 仅作用于 (y, x) 的仿射在 (c, y, x) 上使用时，c 透传
    MatrixXd a(3, 3);
    a << 0.0, -1.0, 0.0,
         1.0,  0.0, 0.0,
         0.0,  0.0, 1.0;
    auto t = AffineTransform::Affine(a, {"y", "x"}, {"y", "x"});
    MatrixXd m = t.toAffineMatrix({"c", "y", "x"}, {"c", "y", "x"});
    EXPECT_DOUBLE_EQ(m(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(m(1, 2), -1.0);
    EXPECT_DOUBLE_EQ(m(2, 1), 1.0);
}

// ==================== 参数校验 ====================

TEST(AffineTransformTest, InvalidConstruction) {
    EXPECT_THROW(AffineTransform::Translation(Eigen::Vector3d(1.0, 2.0, 3.0), {"x", "y"}), InvalidArgumentError);
    EXPECT_THROW(AffineTransform::Scale(Eigen::Vector2d(1.0, 2.0), {"x", "x"}), InvalidArgumentError);

    MatrixXd bad_shape = MatrixXd::Identity(3, 3);
    EXPECT_THROW(AffineTransform::Affine(bad_shape, {"x", "y", "z"}, {"x", "y"}), InvalidArgumentError);

    MatrixXd bad_last_row = MatrixXd::Identity(3, 3);
    bad_last_row(2, 0) = 1.0;
    EXPECT_THROW(AffineTransform::Affine(bad_last_row, {"x", "y"}, {"x", "y"}), InvalidArgumentError);

    EXPECT_THROW(AffineTransform::Rotation(0.1, {"x"}), InvalidArgumentError);
}

TEST(AffineTransformTest, MissingAxisThrows) {
    auto t = AffineTransform::Translation(Eigen::VectorXd::Constant(1, 1.0), {"z"});
    EXPECT_THROW(t.toAffineMatrix({"x", "y"}, {"x", "y"}), AxisMismatchError);
    EXPECT_THROW(t.outputAxesFor({"x", "y"}), AxisMismatchError);
}

TEST(AffineTransformTest, AffineCannotProduceConsumedAxis) {
    auto rename = AffineTransform::Affine(MatrixXd::Identity(3, 3), {"x", "y"}, {"a", "b"});
    EXPECT_THROW(rename.toAffineMatrix({"x", "y"}, {"x", "y"}), AxisMismatchError);
}

// ==================== Sequence ====================

TEST(AffineTransformTest, SequenceAppliesInOrder) {
    auto scale = AffineTransform::Scale(Eigen::Vector2d(2.0, 2.0), {"x", "y"});
    auto shift = AffineTransform::Translation(Eigen::Vector2d(1.0, 0.0), {"x", "y"});
    auto seq = scale.compose(shift);

    EXPECT_EQ(seq.kind(), TransformKind::SEQUENCE);
    MatrixXd m = seq.toAffineMatrix({"x", "y"}, {"x", "y"});
    Eigen::Vector3d q = m * Eigen::Vector3d(1.0, 1.0, 1.0);
    EXPECT_DOUBLE_EQ(q[0], 3.0);
    EXPECT_DOUBLE_EQ(q[1], 2.0);

    // 顺序相反时结果不同
    MatrixXd reversed = shift.compose(scale).toAffineMatrix({"x", "y"}, {"x", "y"});
    Eigen::Vector3d r = reversed * Eigen::Vector3d(1.0, 1.0, 1.0);
    EXPECT_DOUBLE_EQ(r[0], 4.0);
}

TEST(AffineTransformTest, SequenceTracksIntermediateAxes) {
    auto rename = AffineTransform::Affine(MatrixXd::Identity(3, 3), {"x", "y"}, {"a", "b"});
    auto scale_a = AffineTransform::Scale(Eigen::VectorXd::Constant(1, 4.0), {"a"});
    auto seq = AffineTransform::Sequence({rename, scale_a});

    AxisList out = seq.outputAxesFor({"x", "y"});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], "a");
    EXPECT_EQ(out[1], "b");

    MatrixXd m = seq.toAffineMatrix({"x", "y"}, {"b", "a"});
    EXPECT_DOUBLE_EQ(m(0, 1), 1.0) << "b comes from y";
    EXPECT_DOUBLE_EQ(m(1, 0), 4.0) << "a comes from 4 * x";
}

TEST(AffineTransformTest, EmptySequenceIsIdentity) {
    auto seq = AffineTransform::Sequence({});
    EXPECT_TRUE(seq.isIdentity({"c", "y", "x"}));
}

// ==================== 求逆 ====================

TEST(AffineTransformTest, TranslationAndScaleInverse) {
    auto t = AffineTransform::Translation(Eigen::Vector2d(5.0, -2.0), {"x", "y"});
    EXPECT_EQ(t.inverse(), AffineTransform::Translation(Eigen::Vector2d(-5.0, 2.0), {"x", "y"}));

    auto s = AffineTransform::Scale(Eigen::Vector2d(2.0, 4.0), {"x", "y"});
    EXPECT_EQ(s.inverse(), AffineTransform::Scale(Eigen::Vector2d(0.5, 0.25), {"x", "y"}));
}

TEST(AffineTransformTest, AffineInverseComposesToIdentity) {
    MatrixXd a(3, 3);
    a << 2.0, 1.0, 3.0,
         0.5, 1.0, -1.0,
         0.0, 0.0, 1.0;
    auto t = AffineTransform::Affine(a, {"x", "y"}, {"x", "y"});
    EXPECT_TRUE(t.compose(t.inverse()).isIdentity({"x", "y"}));
    EXPECT_TRUE(t.inverse().compose(t).isIdentity({"x", "y"}));
}

TEST(AffineTransformTest, SequenceInverseReversesOrder) {
    auto seq = AffineTransform::Sequence({
        AffineTransform::Scale(Eigen::Vector2d(2.0, 3.0), {"y", "x"}),
        AffineTransform::Rotation(0.3, {"y", "x"}),
        AffineTransform::Translation(Eigen::Vector2d(1.0, -7.0), {"y", "x"})
    });
    auto inv = seq.inverse();
    ASSERT_EQ(inv.transformations().size(), 3u);
    EXPECT_EQ(inv.transformations()[0].kind(), TransformKind::TRANSLATION);
    EXPECT_EQ(inv.transformations()[2].kind(), TransformKind::SCALE);
    EXPECT_TRUE(seq.compose(inv).isIdentity({"c", "y", "x"}));
}

TEST(AffineTransformTest, NonInvertibleTransforms) {
    EXPECT_THROW(AffineTransform::Scale(Eigen::Vector2d(0.0, 1.0), {"x", "y"}).inverse(),
                 NonInvertibleTransformError);

    MatrixXd singular(3, 3);
    singular << 1.0, 2.0, 0.0,
                2.0, 4.0, 0.0,
                0.0, 0.0, 1.0;
    EXPECT_THROW(AffineTransform::Affine(singular, {"x", "y"}, {"x", "y"}).inverse(),
                 NonInvertibleTransformError);

    MatrixXd projection(2, 3);
    projection << 1.0, 0.0, 0.0,
                  0.0, 0.0, 1.0;
    EXPECT_THROW(AffineTransform::Affine(projection, {"x", "y"}, {"x"}).inverse(),
                 NonInvertibleTransformError);
}

// ==================== 比较 ====================

TEST(AffineTransformTest, StructuralEqualityVersusApprox) {
    auto unit_scale = AffineTransform::Scale(Eigen::Vector2d(1.0, 1.0), {"x", "y"});
    EXPECT_NE(unit_scale, AffineTransform::Identity()) << "equality is structural";
    EXPECT_TRUE(unit_scale.isApprox(AffineTransform::Identity(), {"x", "y"}));

    auto a = AffineTransform::Translation(Eigen::Vector2d(1.0, 2.0), {"x", "y"});
    auto b = AffineTransform::Translation(Eigen::Vector2d(1.0, 2.0), {"x", "y"});
    EXPECT_EQ(a, b);
    EXPECT_NE(a, AffineTransform::Translation(Eigen::Vector2d(2.0, 1.0), {"y", "x"}));
    EXPECT_TRUE(a.isApprox(AffineTransform::Translation(Eigen::Vector2d(2.0, 1.0), {"y", "x"}), {"x", "y"}));
}

TEST(AffineTransformTest, ToStringNamesKind) {
    auto seq = AffineTransform::Sequence({AffineTransform::Identity(),
                                          AffineTransform::Scale(Eigen::Vector2d(2.0, 2.0), {"x", "y"})});
    const std::string text = seq.toString();
    EXPECT_NE(text.find("Sequence"), std::string::npos);
    EXPECT_NE(text.find("Scale(x, y)"), std::string::npos);
}

// ==================== 点坐标 ====================

TEST(AffineTransformTest, ApplyToPoints) {
    auto t = AffineTransform::Scale(Eigen::Vector2d(2.0, 3.0), {"x", "y"});
    MatrixXd points(2, 2);
    points << 1.0, 1.0,
              -1.0, 2.0;
    MatrixXd h = spalign::math::tensor::utils::toHomogeneous(points);
    MatrixXd out = spalign::math::tensor::utils::fromHomogeneous(
        applyToPoints(t.toAffineMatrix({"x", "y"}, {"x", "y"}), h));
    EXPECT_DOUBLE_EQ(out(0, 0), 2.0);
    EXPECT_DOUBLE_EQ(out(0, 1), 3.0);
    EXPECT_DOUBLE_EQ(out(1, 0), -2.0);
    EXPECT_DOUBLE_EQ(out(1, 1), 6.0);

    EXPECT_THROW(applyToPoints(MatrixXd::Identity(4, 4), h), InvalidArgumentError);
}
