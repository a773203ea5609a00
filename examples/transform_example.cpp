#include "math/transform/affine_transform.hpp"
#include "math/transform/transform_json.hpp"
#include "spalign/operations/dispatcher.hpp"
#include <iostream>
#include <iomanip>

using namespace spalign;
using namespace spalign::math::transform;
using namespace spalign::elements;

int main() {
    std::cout << std::fixed << std::setprecision(4);

    std::cout << "=== 命名轴仿射变换使用示例 ===\n\n";

    // 1. 基本变换创建
    std::cout << "1. 基本变换创建:\n";

    auto shift = AffineTransform::Translation(Eigen::Vector2d(5.0, -2.0), {"x", "y"});
    auto scale = AffineTransform::Scale(Eigen::Vector2d(2.0, 0.5), {"x", "y"});
    auto rotation = AffineTransform::Rotation(0.5, {"x", "y"});

    std::cout << "平移: " << shift.toString() << "\n";
    std::cout << "缩放: " << scale.toString() << "\n";
    std::cout << "旋转: " << rotation.toString() << "\n\n";

    // 2. 按请求的轴顺序生成矩阵
    std::cout << "2. 按轴顺序生成矩阵:\n";
    std::cout << "缩放在 (x, y) 上:\n" << scale.toAffineMatrix({"x", "y"}, {"x", "y"}) << "\n";
    std::cout << "缩放在 (c, y, x) 上，c 直接透传:\n"
              << scale.toAffineMatrix({"c", "y", "x"}, {"c", "y", "x"}) << "\n\n";

    // 3. 组合与求逆
    std::cout << "3. 组合与求逆:\n";
    auto combined = scale.compose(shift);
    auto roundtrip = combined.compose(combined.inverse());
    std::cout << "先缩放后平移:\n" << combined.toAffineMatrix({"x", "y"}, {"x", "y"}) << "\n";
    std::cout << "与自身逆组合是否为单位变换: "
              << (roundtrip.isIdentity({"x", "y"}) ? "是" : "否") << "\n\n";

    // 4. JSON 序列化
    std::cout << "4. JSON 序列化:\n";
    nlohmann::json j = combined;
    std::cout << j.dump(2) << "\n";
    auto restored = j.get<AffineTransform>();
    std::cout << "反序列化后结构相等: " << (restored == combined ? "是" : "否") << "\n\n";

    // 5. 作用在点表上
    std::cout << "5. 作用在点表上:\n";
    Eigen::MatrixXd coords(3, 2);
    coords << 0.0, 0.0,
              1.0, 0.0,
              0.0, 1.0;
    PointTable points(coords, {"x", "y"});

    operations::Dispatcher dispatcher;
    auto result = std::get<PointTable>(dispatcher.apply(points, combined, true));
    std::cout << "变换后的坐标:\n" << result.coordinates() << "\n";
    std::cout << "变换注册表: " << result.transformations().toString() << "\n\n";

    // 6. 作用在栅格上
    std::cout << "6. 作用在栅格上:\n";
    NDArray image({1, 2, 3}, DataType::FLOAT64, 1.0);
    Raster raster(makeArray(image), {"c", "y", "x"}, ElementModel::IMAGE2D);
    auto rotated = std::get<Raster>(dispatcher.apply(
        raster, AffineTransform::Rotation(0.5 * 3.14159265358979323846, {"y", "x"}), true));
    std::cout << "旋转 90 度后的形状: " << shapeToString(rotated.shape()) << "\n";
    std::cout << "变换注册表: " << rotated.transformations().toString() << "\n";

    return 0;
}
