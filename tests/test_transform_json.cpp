/**
 * @file test_transform_json.cpp
 * @brief 变换与注册表 JSON 编解码测试
 */

#include <gtest/gtest.h>
#include "math/transform/transform_json.hpp"
#include "spalign/coordination/transformation_registry.hpp"
#include "spalign/common/exceptions.hpp"

using namespace spalign;
using namespace spalign::math::transform;
using spalign::coordination::TransformationRegistry;

TEST(TransformJsonTest, TranslationLayout) {
    nlohmann::json j = AffineTransform::Translation(Eigen::Vector2d(5.0, 5.0), {"y", "x"});
    EXPECT_EQ(j["type"], "translation");
    EXPECT_EQ(j["translation"], nlohmann::json::array({5.0, 5.0}));
    EXPECT_EQ(j["axes"], nlohmann::json::array({"y", "x"}));
}

TEST(TransformJsonTest, AffineLayout) {
    MatrixXd m(3, 3);
    m << 0.0, -1.0, 2.0,
         1.0,  0.0, 0.0,
         0.0,  0.0, 1.0;
    nlohmann::json j = AffineTransform::Affine(m, {"x", "y"}, {"x", "y"});
    EXPECT_EQ(j["type"], "affine");
    ASSERT_EQ(j["affine"].size(), 3u);
    EXPECT_DOUBLE_EQ(j["affine"][0][2].get<double>(), 2.0);
    EXPECT_EQ(j["input"], nlohmann::json::array({"x", "y"}));
}

TEST(TransformJsonTest, ParseNestedSequence) {
    const auto j = nlohmann::json::parse(R"({
        "type": "sequence",
        "transformations": [
            {"type": "scale", "scale": [2.0, 2.0], "axes": ["y", "x"]},
            {"type": "sequence", "transformations": [
                {"type": "identity"},
                {"type": "translation", "translation": [1.0, -1.0], "axes": ["y", "x"]}
            ]}
        ]
    })");

    auto t = j.get<AffineTransform>();
    ASSERT_EQ(t.kind(), TransformKind::SEQUENCE);
    ASSERT_EQ(t.transformations().size(), 2u);
    EXPECT_EQ(t.transformations()[1].kind(), TransformKind::SEQUENCE) << "nesting is preserved";

    MatrixXd expected = MatrixXd::Identity(3, 3);
    expected(0, 0) = 2.0;
    expected(1, 1) = 2.0;
    expected(0, 2) = 1.0;
    expected(1, 2) = -1.0;
    EXPECT_TRUE(t.toAffineMatrix({"y", "x"}, {"y", "x"}).isApprox(expected));

    // 编码后再解码保持结构相等
    nlohmann::json again = t;
    EXPECT_EQ(again.get<AffineTransform>(), t);
}

TEST(TransformJsonTest, InvalidDocuments) {
    EXPECT_THROW(nlohmann::json::parse(R"({"type": "shear"})").get<AffineTransform>(), InvalidArgumentError);
    EXPECT_THROW(nlohmann::json::parse(R"({"type": "scale", "axes": ["x"]})").get<AffineTransform>(),
                 InvalidArgumentError);
    EXPECT_THROW(nlohmann::json::parse(R"([1, 2, 3])").get<AffineTransform>(), InvalidArgumentError);
    EXPECT_THROW(nlohmann::json::parse(
                     R"({"type": "affine", "affine": [[1, 0], [0, 1]], "input": ["x"], "output": ["x", "y"]})")
                     .get<AffineTransform>(),
                 InvalidArgumentError);
}

TEST(TransformJsonTest, RegistryRoundTrip) {
    auto registry = TransformationRegistry::withDefault();
    registry.set("physical", AffineTransform::Scale(Eigen::Vector2d(0.5, 0.5), {"y", "x"}));

    nlohmann::json j = registry;
    ASSERT_TRUE(j.is_object());
    EXPECT_EQ(j["global"]["type"], "identity");
    EXPECT_EQ(j["physical"]["type"], "scale");

    auto decoded = j.get<TransformationRegistry>();
    EXPECT_EQ(decoded, registry);

    EXPECT_THROW(nlohmann::json::array().get<TransformationRegistry>(), InvalidArgumentError);
}
