/**
 * @file test_point_polygon_transformer.cpp
 * @brief 点表与几何变换测试
 */

#include <gtest/gtest.h>
#include "spalign/operations/point_transformer.hpp"
#include "spalign/operations/polygon_transformer.hpp"
#include "spalign/common/exceptions.hpp"

using namespace spalign;
using namespace spalign::elements;
using namespace spalign::operations;
using spalign::math::transform::AffineTransform;

namespace {

Eigen::MatrixXd unitSquare() {
    Eigen::MatrixXd ring(4, 2);
    ring << 0.0, 0.0,
            1.0, 0.0,
            1.0, 1.0,
            0.0, 1.0;
    return ring;
}

} // namespace

// ==================== 点表 ====================

TEST(PointTransformerTest, ScaleCoordinates) {
    Eigen::MatrixXd coords(3, 2);
    coords << 0.0, 0.0,
              1.0, 0.0,
              0.0, 1.0;
    const PointTable points(coords, {"x", "y"}, {{"gene", {1.0, 2.0, 3.0}}});

    PointTransformer transformer;
    const PointTable out = transformer.transform(points, AffineTransform::Scale(Eigen::Vector2d(2.0, 2.0), {"x", "y"}));

    Eigen::MatrixXd expected(3, 2);
    expected << 0.0, 0.0,
                2.0, 0.0,
                0.0, 2.0;
    EXPECT_TRUE(out.coordinates().isApprox(expected));
    EXPECT_EQ(out.attributes().at("gene"), (std::vector<double>{1.0, 2.0, 3.0})) << "attributes are carried over";
    EXPECT_TRUE(out.transformations().isPlaceholder());
}

TEST(PointTransformerTest, AxisOrderIsRespected) {
    Eigen::MatrixXd coords(1, 2);
    coords << 1.0, 2.0;
    const PointTable points(coords, {"x", "y"});

    // 平移按名称作用：y 方向 +10
    const PointTable out = PointTransformer().transform(
        points, AffineTransform::Translation(Eigen::Vector2d(10.0, 0.0), {"y", "x"}));
    EXPECT_DOUBLE_EQ(out.coordinates()(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(out.coordinates()(0, 1), 12.0);
}

TEST(PointTransformerTest, ThreeDimensionalPoints) {
    Eigen::MatrixXd coords(2, 3);
    coords << 1.0, 1.0, 1.0,
              0.0, 2.0, -1.0;
    const PointTable points(coords, {"x", "y", "z"});
    const PointTable out = PointTransformer().transform(
        points, AffineTransform::Scale(Eigen::VectorXd::Constant(1, 3.0), {"z"}));
    EXPECT_DOUBLE_EQ(out.coordinates()(0, 2), 3.0);
    EXPECT_DOUBLE_EQ(out.coordinates()(1, 2), -3.0);
    EXPECT_DOUBLE_EQ(out.coordinates()(1, 1), 2.0);
}

TEST(PointTransformerTest, MissingAxis) {
    Eigen::MatrixXd coords(1, 2);
    coords << 1.0, 2.0;
    const PointTable points(coords, {"x", "y"});
    EXPECT_THROW(PointTransformer().transform(
                     points, AffineTransform::Scale(Eigen::VectorXd::Constant(1, 3.0), {"z"})),
                 AxisMismatchError);
}

TEST(PointTransformerTest, InvalidTable) {
    Eigen::MatrixXd coords(2, 2);
    coords.setZero();
    EXPECT_THROW(PointTable bad_axes(coords, {"x", "y", "z"}), InvalidArgumentError);
    EXPECT_THROW(PointTable bad_column(coords, {"x", "y"}, {{"gene", {1.0}}}), InvalidArgumentError);
}

// ==================== 几何 ====================

TEST(PolygonTransformerTest, PolygonWithHole) {
    Eigen::MatrixXd hole(3, 2);
    hole << 0.25, 0.25,
            0.75, 0.25,
            0.5, 0.75;
    const PolygonSet shapes({Geometry::Polygon(unitSquare(), {hole})}, {"x", "y"});

    const auto shift = AffineTransform::Translation(Eigen::Vector2d(1.0, -1.0), {"x", "y"});
    const PolygonSet out = PolygonTransformer().transform(shapes, shift);

    ASSERT_EQ(out.size(), 1u);
    const Geometry& g = out.geometries()[0];
    ASSERT_EQ(g.type, GeometryType::POLYGON);
    ASSERT_EQ(g.parts.size(), 1u);
    EXPECT_DOUBLE_EQ(g.parts[0].exterior(2, 0), 2.0);
    EXPECT_DOUBLE_EQ(g.parts[0].exterior(2, 1), 0.0);
    ASSERT_EQ(g.parts[0].interiors.size(), 1u);
    EXPECT_DOUBLE_EQ(g.parts[0].interiors[0](2, 1), -0.25);
    EXPECT_TRUE(out.transformations().isPlaceholder());
}

TEST(PolygonTransformerTest, MultiPolygon) {
    Eigen::MatrixXd far_square = (unitSquare().array() + 5.0).matrix();
    const PolygonSet shapes({Geometry::MultiPolygon({PolygonPart{unitSquare(), {}},
                                                     PolygonPart{far_square, {}}})},
                            {"x", "y"});
    const PolygonSet out = PolygonTransformer().transform(
        shapes, AffineTransform::Scale(Eigen::Vector2d(2.0, 2.0), {"x", "y"}));

    const Geometry& g = out.geometries()[0];
    ASSERT_EQ(g.parts.size(), 2u);
    EXPECT_DOUBLE_EQ(g.parts[1].exterior(0, 0), 10.0);
    EXPECT_DOUBLE_EQ(g.parts[1].exterior(2, 1), 12.0);
}

TEST(PolygonTransformerTest, CircleRadiusScalesIsotropically) {
    const PolygonSet circles({Geometry::Point(Eigen::RowVector2d(1.0, 1.0)),
                              Geometry::Point(Eigen::RowVector2d(3.0, 0.0))},
                             {"x", "y"},
                             {{PolygonSet::RADIUS, {1.0, 0.5}}});

    const PolygonSet out = PolygonTransformer().transform(
        circles, AffineTransform::Scale(Eigen::Vector2d(2.0, 2.0), {"x", "y"}));

    EXPECT_DOUBLE_EQ(out.geometries()[1].point[0], 6.0);
    const auto& radius = out.attributes().at(PolygonSet::RADIUS);
    EXPECT_DOUBLE_EQ(radius[0], 2.0);
    EXPECT_DOUBLE_EQ(radius[1], 1.0);

    // 旋转不改变半径
    const PolygonSet rotated = PolygonTransformer().transform(
        circles, AffineTransform::Rotation(0.7, {"x", "y"}));
    EXPECT_NEAR(rotated.attributes().at(PolygonSet::RADIUS)[0], 1.0, 1e-12);
}

TEST(PolygonTransformerTest, AnisotropicRadiusUsesMeanModulus) {
    const PolygonSet circles({Geometry::Point(Eigen::RowVector2d(0.0, 0.0))},
                             {"x", "y"},
                             {{PolygonSet::RADIUS, {1.0}}});
    const PolygonSet out = PolygonTransformer().transform(
        circles, AffineTransform::Scale(Eigen::Vector2d(2.0, 4.0), {"x", "y"}));
    EXPECT_NEAR(out.attributes().at(PolygonSet::RADIUS)[0], 3.0, 1e-12);

    const RadiusScale scale =
        PolygonTransformer::radiusScaleFactor(Eigen::Vector2d(2.0, 4.0).asDiagonal().toDenseMatrix(), 1e-5, 1e-8);
    EXPECT_FALSE(scale.isotropic);
    EXPECT_NEAR(scale.factor, 3.0, 1e-12);
}

TEST(PolygonTransformerTest, RadiusOnlyAppliesToPoints) {
    // 多边形也有 radius 列时，只有点几何的值被缩放
    const PolygonSet mixed({Geometry::Polygon(unitSquare()), Geometry::Point(Eigen::RowVector2d(0.0, 0.0))},
                           {"x", "y"},
                           {{PolygonSet::RADIUS, {0.0, 1.0}}});
    const PolygonSet out = PolygonTransformer().transform(
        mixed, AffineTransform::Scale(Eigen::Vector2d(3.0, 3.0), {"x", "y"}));
    const auto& radius = out.attributes().at(PolygonSet::RADIUS);
    EXPECT_DOUBLE_EQ(radius[0], 0.0);
    EXPECT_DOUBLE_EQ(radius[1], 3.0);

    // 没有点几何时 radius 原样保留
    const PolygonSet polygons({Geometry::Polygon(unitSquare())}, {"x", "y"}, {{PolygonSet::RADIUS, {5.0}}});
    const PolygonSet scaled = PolygonTransformer().transform(
        polygons, AffineTransform::Scale(Eigen::Vector2d(3.0, 3.0), {"x", "y"}));
    EXPECT_DOUBLE_EQ(scaled.attributes().at(PolygonSet::RADIUS)[0], 5.0);
}
