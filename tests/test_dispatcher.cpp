/**
 * @file test_dispatcher.cpp
 * @brief 变换入口、注册表重建、数据集与模式校验测试
 */

#include <gtest/gtest.h>
#include "spalign/operations/dispatcher.hpp"
#include "spalign/common/exceptions.hpp"

using namespace spalign;
using namespace spalign::elements;
using namespace spalign::operations;
using spalign::coordination::CoordinateSystem;
using spalign::coordination::TransformationRegistry;
using spalign::math::transform::AffineTransform;

namespace {

AffineTransform doubleScale() {
    return AffineTransform::Scale(Eigen::Vector2d(2.0, 2.0), {"x", "y"});
}

AffineTransform shiftYX() {
    return AffineTransform::Translation(Eigen::Vector2d(5.0, 5.0), {"y", "x"});
}

PointTable makePoints(TransformationRegistry registry = TransformationRegistry::withDefault()) {
    Eigen::MatrixXd coords(3, 2);
    coords << 0.0, 0.0,
              1.0, 0.0,
              0.0, 1.0;
    return PointTable(coords, {"x", "y"}, {}, std::move(registry));
}

Raster makeImage(TransformationRegistry registry = TransformationRegistry::withDefault()) {
    NDArray data({1, 3, 3}, DataType::UINT8, 0.0);
    for (size_t y = 0; y < 3; ++y) {
        for (size_t x = 0; x < 3; ++x) {
            data.set({0, y, x}, static_cast<double>(3 * y + x));
        }
    }
    return Raster(makeArray(data), {"c", "y", "x"}, ElementModel::IMAGE2D, std::move(registry));
}

Raster blankImage(size_t height, size_t width, TransformationRegistry registry) {
    return Raster(makeArray(NDArray({1, height, width}, DataType::UINT8, 1.0)), {"c", "y", "x"},
                  ElementModel::IMAGE2D, std::move(registry));
}

Eigen::MatrixXd triangle() {
    Eigen::MatrixXd ring(3, 2);
    ring << 0.0, 0.0,
            1.0, 0.0,
            0.0, 1.0;
    return ring;
}

} // namespace

// ==================== 单个元素 ====================

TEST(DispatcherTest, PointsToNamedCoordinateSystem) {
    const auto points = makePoints(TransformationRegistry::withDefault().with("physical", doubleScale()));
    Dispatcher dispatcher;

    const SpatialElement out = dispatcher.apply(points, std::nullopt, false, std::string("physical"));
    const auto& moved = std::get<PointTable>(out);

    Eigen::MatrixXd expected(3, 2);
    expected << 0.0, 0.0,
                2.0, 0.0,
                0.0, 2.0;
    EXPECT_TRUE(moved.coordinates().isApprox(expected));

    TransformationRegistry expected_registry;
    expected_registry.set("physical", AffineTransform::Identity());
    EXPECT_EQ(moved.transformations(), expected_registry) << "only the target remains, anchored by Identity";

    // 输入保持不变
    EXPECT_EQ(points.transformations().size(), 2u);
    EXPECT_DOUBLE_EQ(points.coordinates()(1, 0), 1.0);
}

TEST(DispatcherTest, RasterToNamedCoordinateSystem) {
    const Raster image = makeImage(TransformationRegistry().with("world", shiftYX()));
    const SpatialElement out = Dispatcher().apply(image, std::nullopt, false, std::string("world"));
    const auto& moved = std::get<Raster>(out);

    EXPECT_EQ(moved.shape(), image.shape());
    EXPECT_EQ(moved.data()->realize(), image.data()->realize()) << "integer shifts keep every pixel";
    ASSERT_TRUE(moved.transformations().contains("world"));
    EXPECT_EQ(moved.transformations().size(), 1u);
    EXPECT_TRUE(moved.transformations().get("world").isApprox(shiftYX(), {"c", "y", "x"}));
}

TEST(DispatcherTest, MaintainPositioningPrependsInverse) {
    const auto points = makePoints();
    const SpatialElement out = Dispatcher().apply(points, doubleScale(), true);
    const auto& moved = std::get<PointTable>(out);

    EXPECT_DOUBLE_EQ(moved.coordinates()(1, 0), 2.0);
    TransformationRegistry expected;
    expected.set("global", AffineTransform::Sequence({doubleScale().inverse(), AffineTransform::Identity()}));
    EXPECT_EQ(moved.transformations(), expected);
    EXPECT_FALSE(moved.transformations().isApprox(points.transformations(), {"x", "y"}));

    // 变换后的点回到全局坐标系中的原位置
    const PointTable back = PointTransformer().transform(moved, moved.transformations().get("global"));
    EXPECT_TRUE(back.coordinates().isApprox(points.coordinates()));
}

TEST(DispatcherTest, MaintainPositioningIsReversible) {
    Dispatcher dispatcher;
    const auto rotation = AffineTransform::Rotation(0.3, {"x", "y"});
    const auto points = makePoints(TransformationRegistry::withDefault().with("physical", doubleScale()));

    const SpatialElement once = dispatcher.apply(points, rotation, true);
    const SpatialElement twice = dispatcher.apply(once, rotation.inverse(), true);
    const auto& result = std::get<PointTable>(twice);

    EXPECT_TRUE(result.coordinates().isApprox(points.coordinates(), 1e-12));
    EXPECT_TRUE(result.transformations().isApprox(points.transformations(), {"x", "y"}));
}

TEST(DispatcherTest, RasterTranslationKeepsCallerAxes) {
    const auto shift = AffineTransform::Translation(Eigen::Vector2d(5.0, 5.0), {"x", "y"});
    const Raster image = blankImage(10, 10, TransformationRegistry().with("world", shift));
    const SpatialElement out = Dispatcher().apply(image, std::nullopt, false, std::string("world"));
    const auto& moved = std::get<Raster>(out);

    EXPECT_EQ(moved.shape(), (Shape{1, 10, 10}));
    TransformationRegistry expected;
    expected.set("world", shift);
    EXPECT_EQ(moved.transformations(), expected);
}

TEST(DispatcherTest, SquareRasterRoundTrip) {
    Dispatcher dispatcher;
    const auto rotation = AffineTransform::Rotation(math::transform::constants::HALF_PI, {"y", "x"});
    const Raster image = blankImage(10, 10, TransformationRegistry::withDefault().with("physical", doubleScale()));

    const SpatialElement once = dispatcher.apply(image, rotation, true);
    EXPECT_EQ(std::get<Raster>(once).shape(), (Shape{1, 10, 10}));
    const SpatialElement twice = dispatcher.apply(once, rotation.inverse(), true);
    const auto& result = std::get<Raster>(twice);

    EXPECT_EQ(result.shape(), image.shape());
    EXPECT_TRUE(result.transformations().isApprox(image.transformations(), {"c", "y", "x"}));
}

TEST(DispatcherTest, SquareMultiscaleRoundTrip) {
    Dispatcher dispatcher;
    const auto rotation = AffineTransform::Rotation(math::transform::constants::HALF_PI, {"y", "x"});
    std::vector<Raster> levels = {
        Raster(makeArray(NDArray({8, 8}, DataType::UINT16, 2.0)), {"y", "x"}, ElementModel::LABELS2D),
        Raster(makeArray(NDArray({4, 4}, DataType::UINT16, 2.0)), {"y", "x"}, ElementModel::LABELS2D)
    };
    const MultiscaleRaster pyramid(std::move(levels),
                                   TransformationRegistry::withDefault().with("physical", doubleScale()));

    const SpatialElement once = dispatcher.apply(pyramid, rotation, true);
    const SpatialElement twice = dispatcher.apply(once, rotation.inverse(), true);
    const auto& result = std::get<MultiscaleRaster>(twice);

    ASSERT_EQ(result.numLevels(), 2u);
    EXPECT_EQ(result.level(1).shape(), (Shape{4, 4}));
    EXPECT_TRUE(result.transformations().isApprox(pyramid.transformations(), {"y", "x"}));
}

// 非方形栅格每次旋转都按 new/old 修正像素中心，往返后 y 方向残留 1/3 像素
TEST(DispatcherTest, NonSquareRasterRoundTripDrift) {
    Dispatcher dispatcher;
    const auto rotation = AffineTransform::Rotation(math::transform::constants::HALF_PI, {"y", "x"});
    const Raster image = blankImage(4, 6, TransformationRegistry::withDefault().with("physical", doubleScale()));

    const SpatialElement once = dispatcher.apply(image, rotation, true);
    EXPECT_EQ(std::get<Raster>(once).shape(), (Shape{1, 6, 4}));
    const SpatialElement twice = dispatcher.apply(once, rotation.inverse(), true);
    const auto& result = std::get<Raster>(twice);

    EXPECT_EQ(result.shape(), image.shape());
    const auto drift = AffineTransform::Translation(Eigen::Vector2d(1.0 / 3.0, 0.0), {"y", "x"});
    const AxisList dims = {"c", "y", "x"};
    EXPECT_FALSE(result.transformations().isApprox(image.transformations(), dims));
    EXPECT_TRUE(result.transformations().get("global").isApprox(drift, dims));
    EXPECT_TRUE(result.transformations().get("physical").isApprox(
        AffineTransform::Sequence({drift, doubleScale()}), dims));
}

TEST(DispatcherTest, MaintainPositioningFromTarget) {
    const auto points = makePoints(TransformationRegistry::withDefault().with("physical", doubleScale()));
    const SpatialElement out = Dispatcher().apply(points, std::nullopt, true, std::string("physical"));
    const auto& moved = std::get<PointTable>(out);

    EXPECT_DOUBLE_EQ(moved.coordinates()(2, 1), 2.0);
    EXPECT_EQ(moved.transformations().size(), 2u);
    EXPECT_TRUE(moved.transformations().get("physical").isApprox(AffineTransform::Identity(), {"x", "y"}));
}

TEST(DispatcherTest, ResolutionErrors) {
    Dispatcher dispatcher;
    const auto points = makePoints(TransformationRegistry::withDefault().with("physical", doubleScale()));

    EXPECT_THROW(dispatcher.apply(points, doubleScale(), false, std::string("physical")), AmbiguousTransformError);
    EXPECT_THROW(dispatcher.apply(points), AmbiguousTransformError);
    EXPECT_THROW(dispatcher.apply(points, std::nullopt, false, std::string("atlas")), AmbiguousTransformError);
    EXPECT_THROW(dispatcher.apply(points, doubleScale(), true, std::string("physical")), InvalidArgumentError);
    EXPECT_THROW(dispatcher.apply(points, std::nullopt, true), InvalidArgumentError);
    EXPECT_THROW(dispatcher.apply(points, std::nullopt, true, std::string("atlas")), CoordinateSystemNotFoundError);
}

TEST(DispatcherTest, SingleEntryShim) {
    const auto points = makePoints(TransformationRegistry().with("physical", doubleScale()));
    const SpatialElement out = Dispatcher().apply(points, doubleScale());
    EXPECT_TRUE(std::get<PointTable>(out).transformations().contains("physical"));

    utility::TransformOptions strict;
    strict.allow_explicit_transform_shim = false;
    EXPECT_THROW(Dispatcher(strict).apply(points, doubleScale()), AmbiguousTransformError);
}

TEST(DispatcherTest, MultiscaleRaster) {
    std::vector<Raster> levels = {
        Raster(makeArray(NDArray({4, 4}, DataType::UINT16, 3.0)), {"y", "x"}, ElementModel::LABELS2D),
        Raster(makeArray(NDArray({2, 2}, DataType::UINT16, 3.0)), {"y", "x"}, ElementModel::LABELS2D)
    };
    const MultiscaleRaster pyramid(std::move(levels));
    const auto scale = AffineTransform::Scale(Eigen::Vector2d(2.0, 2.0), {"y", "x"});

    const SpatialElement out = Dispatcher().apply(pyramid, scale, true);
    const auto& result = std::get<MultiscaleRaster>(out);
    ASSERT_EQ(result.numLevels(), 2u);
    EXPECT_EQ(result.level(0).shape(), (Shape{8, 8}));
    EXPECT_EQ(result.level(1).shape(), (Shape{4, 4}));
    EXPECT_EQ(result.level(0).data()->realize().at({0, 0}), 3.0);

    const auto expected = AffineTransform::Sequence({
        AffineTransform::Sequence({AffineTransform::Translation(Eigen::Vector2d(-0.5, -0.5), {"y", "x"}),
                                   scale.inverse()}),
        AffineTransform::Identity()});
    EXPECT_EQ(result.transformations().get("global"), expected);
    EXPECT_EQ(result.level(0).transformations(), result.transformations()) << "level 0 mirrors the pyramid";
}

TEST(DispatcherTest, FreeFunctionApply) {
    const auto points = makePoints();
    const SpatialElement out = operations::apply(points, doubleScale(), true);
    EXPECT_DOUBLE_EQ(std::get<PointTable>(out).coordinates()(2, 1), 2.0);

    utility::TransformOptions broken;
    broken.interpolation_order = 3;
    EXPECT_THROW(operations::apply(points, doubleScale(), true, std::nullopt, broken), ConfigurationError);
}

// ==================== 注册表重建 ====================

TEST(TransformationAdjusterTest, PrependTable) {
    const auto t = doubleScale();
    const auto rt = AffineTransform::Translation(Eigen::Vector2d(-0.5, -0.5), {"y", "x"});

    EXPECT_EQ(TransformationAdjuster::toPrepend(ElementKind::RASTER, t, rt, true),
              AffineTransform::Sequence({rt, t.inverse()}));
    EXPECT_EQ(TransformationAdjuster::toPrepend(ElementKind::MULTISCALE_RASTER, t, rt, false), rt);
    EXPECT_EQ(TransformationAdjuster::toPrepend(ElementKind::POINT_TABLE, t, std::nullopt, true), t.inverse());
    EXPECT_EQ(TransformationAdjuster::toPrepend(ElementKind::POLYGON_SET, t, std::nullopt, false),
              AffineTransform::Identity());
}

TEST(TransformationAdjusterTest, InvariantViolations) {
    const auto t = doubleScale();
    const auto rt = AffineTransform::Translation(Eigen::Vector2d(-0.5, -0.5), {"y", "x"});
    EXPECT_THROW(TransformationAdjuster::toPrepend(ElementKind::RASTER, t, std::nullopt, true),
                 InvariantViolationError);
    EXPECT_THROW(TransformationAdjuster::toPrepend(ElementKind::POINT_TABLE, t, rt, true),
                 InvariantViolationError);

    TransformationAdjuster adjuster;
    const auto old_registry = TransformationRegistry::withDefault();
    const auto not_placeholder = TransformationRegistry::withDefault().with("physical", t);
    EXPECT_THROW(adjuster.adjust(not_placeholder, old_registry, ElementKind::POINT_TABLE, t, std::nullopt,
                                 true, std::nullopt),
                 InvariantViolationError);
    EXPECT_THROW(adjuster.adjust(old_registry, old_registry, ElementKind::POINT_TABLE, t, std::nullopt,
                                 true, std::string("physical")),
                 InvariantViolationError);
}

TEST(TransformationAdjusterTest, DefaultTargetWhenUnnamed) {
    utility::TransformOptions options;
    options.default_coordinate_system = "canvas";
    TransformationAdjuster adjuster(options);

    const auto registry = adjuster.adjust(TransformationRegistry::withDefault("canvas"),
                                          TransformationRegistry::withDefault("canvas"),
                                          ElementKind::POINT_TABLE, doubleScale(), std::nullopt,
                                          false, std::nullopt);
    EXPECT_TRUE(registry.isPlaceholder("canvas"));
}

// ==================== 数据集 ====================

TEST(SpatialDatasetTest, AddAndLookup) {
    SpatialDataset dataset;
    dataset.catalog().registerCoordinateSystem(CoordinateSystem::fromAxisNames("global", {"c", "y", "x"}));
    dataset.add(ElementGroup::IMAGES, "image", makeImage());
    dataset.add(ElementGroup::POINTS, "transcripts", makePoints());

    EXPECT_EQ(dataset.size(), 2u);
    EXPECT_TRUE(dataset.contains("image"));
    EXPECT_EQ(dataset.groupOf("transcripts").value(), ElementGroup::POINTS);
    EXPECT_EQ(elementKind(dataset.get("image")), ElementKind::RASTER);
    EXPECT_TRUE(dataset.labels().empty());
    EXPECT_THROW(dataset.get("missing"), InvalidArgumentError);

    EXPECT_THROW(dataset.add(ElementGroup::POINTS, "transcripts", makePoints()), InvalidArgumentError);
    EXPECT_THROW(dataset.add(ElementGroup::POINTS, "", makePoints()), InvalidArgumentError);
    EXPECT_THROW(dataset.add(ElementGroup::LABELS, "not_labels", makeImage()), InvalidArgumentError);
}

TEST(SpatialDatasetTest, CatalogRestrictsAxes) {
    SpatialDataset dataset;
    dataset.catalog().registerCoordinateSystem(CoordinateSystem::fromAxisNames("physical", {"x", "y"}));
    EXPECT_NO_THROW(dataset.add(ElementGroup::POINTS, "points",
                                makePoints(TransformationRegistry().with("physical", doubleScale()))));
    EXPECT_THROW(dataset.add(ElementGroup::IMAGES, "image",
                             makeImage(TransformationRegistry().with("physical", AffineTransform::Identity()))),
                 InvalidArgumentError)
        << "the channel axis has no place in (x, y)";
}

TEST(SpatialDatasetTest, FilterByCoordinateSystem) {
    SpatialDataset dataset;
    dataset.add(ElementGroup::IMAGES, "image",
                makeImage(TransformationRegistry::withDefault().with("world", shiftYX())));
    dataset.add(ElementGroup::POINTS, "points", makePoints());

    const auto names = dataset.coordinateSystems();
    EXPECT_EQ(names, (std::vector<std::string>{"global", "world"}));

    const SpatialDataset world = dataset.filterByCoordinateSystem("world");
    EXPECT_EQ(world.size(), 1u);
    EXPECT_TRUE(world.contains("image"));
}

TEST(SpatialDatasetTest, TransformToCoordinateSystem) {
    SpatialDataset dataset;
    dataset.catalog().registerCoordinateSystem(CoordinateSystem::fromAxisNames("world", {"c", "y", "x"}));
    dataset.add(ElementGroup::IMAGES, "image",
                makeImage(TransformationRegistry::withDefault().with("world", shiftYX())));
    dataset.add(ElementGroup::POINTS, "points", makePoints());

    Dispatcher dispatcher;
    const SpatialDataset moved = dispatcher.transformToCoordinateSystem(dataset, "world");
    ASSERT_EQ(moved.size(), 1u) << "elements not anchored in the target are dropped";
    const auto& image = std::get<Raster>(moved.get("image"));
    EXPECT_EQ(image.transformations().coordinateSystems(), (std::vector<std::string>{"world"}));
    EXPECT_TRUE(moved.catalog().contains("world"));

    const SpatialDataset same = dispatcher.apply(dataset, std::nullopt, false, std::string("world"));
    EXPECT_EQ(same.size(), 1u);
}

TEST(SpatialDatasetTest, ApplyMaintainPositioning) {
    SpatialDataset dataset;
    dataset.catalog().registerCoordinateSystem(CoordinateSystem::fromAxisNames("global", {"c", "y", "x"}));
    dataset.add(ElementGroup::POINTS, "a", makePoints());
    dataset.add(ElementGroup::POINTS, "b", makePoints());
    dataset.add(ElementGroup::SHAPES, "cells", PolygonSet({Geometry::Polygon(triangle())}, {"x", "y"}));

    const SpatialDataset out = Dispatcher().apply(dataset, doubleScale(), true);
    EXPECT_EQ(out.size(), 3u);
    EXPECT_TRUE(out.catalog().contains("global"));
    const auto& a = std::get<PointTable>(out.get("a"));
    EXPECT_DOUBLE_EQ(a.coordinates()(1, 0), 2.0);
    const auto& cells = std::get<PolygonSet>(out.get("cells"));
    EXPECT_DOUBLE_EQ(cells.geometries()[0].parts[0].exterior(2, 1), 2.0);
}

TEST(SpatialDatasetTest, ApplyErrors) {
    SpatialDataset dataset;
    dataset.add(ElementGroup::POINTS, "a", makePoints());
    Dispatcher dispatcher;

    EXPECT_THROW(dispatcher.apply(dataset, doubleScale(), false), AmbiguousTransformError);
    EXPECT_THROW(dispatcher.apply(dataset, doubleScale(), false, std::string("global")), AmbiguousTransformError);
    EXPECT_THROW(dispatcher.apply(dataset, doubleScale(), true, std::string("global")), InvalidArgumentError);
    EXPECT_THROW(dispatcher.apply(dataset, std::nullopt, true), InvalidArgumentError);
}

// ==================== 模式校验 ====================

TEST(SchemaValidatorTest, RejectsMalformedElements) {
    DefaultSchemaValidator validator;

    EXPECT_NO_THROW(validator.validate(makeImage()));
    EXPECT_EQ(validator.getModel(makeImage()), ElementModel::IMAGE2D);
    EXPECT_EQ(validator.getAxesNames(makePoints()), (AxisList{"x", "y"}));

    const Raster wrong_dims(makeArray(NDArray({3, 3}, DataType::UINT8, 0.0)), {"y", "x"}, ElementModel::IMAGE2D);
    EXPECT_THROW(validator.validate(wrong_dims), SchemaValidationError);

    const Raster float_labels(makeArray(NDArray({3, 3}, DataType::FLOAT64, 0.0)), {"y", "x"},
                              ElementModel::LABELS2D);
    EXPECT_THROW(validator.validate(float_labels), SchemaValidationError);

    const Raster empty_image(makeArray(NDArray({1, 0, 3}, DataType::UINT8, 0.0)), {"c", "y", "x"},
                             ElementModel::IMAGE2D);
    EXPECT_THROW(validator.validate(empty_image), SchemaValidationError);

    const Raster wrong_channels(makeArray(NDArray({1, 3, 3}, DataType::UINT8, 0.0)), {"c", "y", "x"},
                                ElementModel::IMAGE2D, TransformationRegistry::withDefault(), {"dapi", "cd45"});
    EXPECT_THROW(validator.validate(wrong_channels), SchemaValidationError);

    Eigen::MatrixXd segment(2, 2);
    segment << 0.0, 0.0,
               1.0, 1.0;
    const PolygonSet bad_ring({Geometry::Polygon(segment)}, {"x", "y"});
    EXPECT_THROW(validator.validate(bad_ring), SchemaValidationError);

    const PolygonSet negative_radius({Geometry::Point(Eigen::RowVector2d(0.0, 0.0))}, {"x", "y"},
                                     {{PolygonSet::RADIUS, {-1.0}}});
    EXPECT_THROW(validator.validate(negative_radius), SchemaValidationError);

    Eigen::MatrixXd coords(1, 2);
    coords << 0.0, 0.0;
    const PointTable yx_points(coords, {"y", "x"});
    EXPECT_THROW(validator.validate(yx_points), SchemaValidationError);

    const PointTable unanchored(coords, {"x", "y"}, {}, TransformationRegistry());
    EXPECT_THROW(validator.validate(unanchored), SchemaValidationError);
}
