/**
 * @file test_transformation_registry.cpp
 * @brief 变换注册表、坐标系目录与变换解析测试
 */

#include <gtest/gtest.h>
#include "spalign/coordination/transformation_registry.hpp"
#include "spalign/coordination/coordinate_system_catalog.hpp"
#include "spalign/coordination/transform_resolver.hpp"
#include "spalign/common/exceptions.hpp"

using namespace spalign;
using namespace spalign::coordination;
using spalign::math::transform::AffineTransform;

namespace {

AffineTransform halfScale() {
    return AffineTransform::Scale(Eigen::Vector2d(0.5, 0.5), {"y", "x"});
}

} // namespace

// ==================== 注册表 ====================

TEST(TransformationRegistryTest, DefaultRegistry) {
    auto registry = TransformationRegistry::withDefault();
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_TRUE(registry.contains("global"));
    EXPECT_TRUE(registry.isPlaceholder());
    EXPECT_FALSE(TransformationRegistry::withDefault("aligned").isPlaceholder())
        << "placeholder is defined against the default name";
    EXPECT_TRUE(TransformationRegistry::withDefault("aligned").isPlaceholder("aligned"));
}

TEST(TransformationRegistryTest, SetGetAndRemove) {
    auto registry = TransformationRegistry::withDefault();
    registry.set("physical", halfScale());

    EXPECT_EQ(registry.get("physical"), halfScale());
    EXPECT_FALSE(registry.isPlaceholder());
    ASSERT_EQ(registry.coordinateSystems().size(), 2u);
    EXPECT_EQ(registry.coordinateSystems()[0], "global") << "names are sorted";

    // 覆盖已有条目
    registry.set("physical", AffineTransform::Identity());
    EXPECT_EQ(registry.get("physical").kind(), math::transform::TransformKind::IDENTITY);

    EXPECT_TRUE(registry.remove("physical"));
    EXPECT_FALSE(registry.remove("physical"));
    EXPECT_FALSE(registry.find("physical").has_value());

    EXPECT_THROW(registry.set("", AffineTransform::Identity()), InvalidArgumentError);
}

TEST(TransformationRegistryTest, MissingCoordinateSystem) {
    auto registry = TransformationRegistry::withDefault();
    try {
        registry.get("atlas");
        FAIL() << "expected CoordinateSystemNotFoundError";
    } catch (const CoordinateSystemNotFoundError& e) {
        EXPECT_EQ(e.getCoordinateSystem(), "atlas");
        EXPECT_NE(std::string(e.what()).find("global"), std::string::npos) << "message lists available names";
    }
}

TEST(TransformationRegistryTest, WithReturnsCopy) {
    const auto registry = TransformationRegistry::withDefault();
    const auto extended = registry.with("physical", halfScale());
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(extended.size(), 2u);
    EXPECT_NE(registry, extended);
}

TEST(TransformationRegistryTest, ApproxComparison) {
    TransformationRegistry a;
    a.set("global", AffineTransform::Sequence({halfScale(), halfScale().inverse()}));
    EXPECT_NE(a, TransformationRegistry::withDefault());
    EXPECT_TRUE(a.isApprox(TransformationRegistry::withDefault(), {"y", "x"}));
}

// ==================== 坐标系目录 ====================

TEST(CoordinateSystemCatalogTest, RegisterAndLookup) {
    CoordinateSystemCatalog catalog;
    EXPECT_TRUE(catalog.registerCoordinateSystem(CoordinateSystem::fromAxisNames("global", {"c", "y", "x"})));
    EXPECT_FALSE(catalog.registerCoordinateSystem(CoordinateSystem::fromAxisNames("global", {"c", "y", "x"})))
        << "identical re-registration is a no-op";

    const auto& cs = catalog.get("global");
    ASSERT_EQ(cs.axes().size(), 3u);
    EXPECT_EQ(cs.axes()[0].type, AxisType::CHANNEL);
    EXPECT_EQ(cs.spatialAxisNames(), (AxisList{"y", "x"}));

    EXPECT_THROW(catalog.registerCoordinateSystem(CoordinateSystem::fromAxisNames("global", {"x", "y", "z"})),
                 InvalidArgumentError);
    EXPECT_THROW(catalog.get("atlas"), CoordinateSystemNotFoundError);
    EXPECT_NE(catalog.generateDescription().find("c (channel)"), std::string::npos);
}

// ==================== 变换解析 ====================

TEST(TransformResolverTest, TargetWithoutMaintain) {
    auto registry = TransformationRegistry::withDefault().with("physical", halfScale());
    auto resolved = resolveForTransform(registry, std::nullopt, std::string("physical"), false);
    EXPECT_EQ(resolved.transformation, halfScale());
    ASSERT_TRUE(resolved.target_coordinate_system.has_value());
    EXPECT_EQ(*resolved.target_coordinate_system, "physical");
}

TEST(TransformResolverTest, MissingTargetIsAmbiguous) {
    auto registry = TransformationRegistry::withDefault();
    EXPECT_THROW(resolveForTransform(registry, std::nullopt, std::string("atlas"), false),
                 AmbiguousTransformError);
}

TEST(TransformResolverTest, ExplicitTransformShim) {
    TransformationRegistry registry;
    registry.set("physical", halfScale());

    auto resolved = resolveForTransform(registry, halfScale(), std::nullopt, false);
    ASSERT_TRUE(resolved.target_coordinate_system.has_value());
    EXPECT_EQ(*resolved.target_coordinate_system, "physical");

    // 变换与唯一条目不一致
    EXPECT_THROW(resolveForTransform(registry, halfScale().inverse(), std::nullopt, false),
                 AmbiguousTransformError);

    // 关闭兼容路径
    utility::TransformOptions strict;
    strict.allow_explicit_transform_shim = false;
    EXPECT_THROW(resolveForTransform(registry, halfScale(), std::nullopt, false, strict),
                 AmbiguousTransformError);
}

TEST(TransformResolverTest, AmbiguousWithoutMaintain) {
    auto registry = TransformationRegistry::withDefault().with("physical", halfScale());
    EXPECT_THROW(resolveForTransform(registry, halfScale(), std::string("physical"), false),
                 AmbiguousTransformError);
    EXPECT_THROW(resolveForTransform(registry, halfScale(), std::nullopt, false), AmbiguousTransformError);
    EXPECT_THROW(resolveForTransform(registry, std::nullopt, std::nullopt, false), AmbiguousTransformError);
}

TEST(TransformResolverTest, MaintainPositioning) {
    auto registry = TransformationRegistry::withDefault().with("physical", halfScale());

    auto from_explicit = resolveForTransform(registry, halfScale(), std::nullopt, true);
    EXPECT_EQ(from_explicit.transformation, halfScale());
    EXPECT_FALSE(from_explicit.target_coordinate_system.has_value());

    auto from_target = resolveForTransform(registry, std::nullopt, std::string("physical"), true);
    EXPECT_EQ(from_target.transformation, halfScale());
    EXPECT_FALSE(from_target.target_coordinate_system.has_value());

    EXPECT_THROW(resolveForTransform(registry, halfScale(), std::string("physical"), true), InvalidArgumentError);
    EXPECT_THROW(resolveForTransform(registry, std::nullopt, std::nullopt, true), InvalidArgumentError);
    EXPECT_THROW(resolveForTransform(registry, std::nullopt, std::string("atlas"), true),
                 CoordinateSystemNotFoundError);
}
