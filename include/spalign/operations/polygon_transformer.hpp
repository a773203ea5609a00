/**
 * @file polygon_transformer.hpp
 * @brief 几何集合的仿射变换
 *
 * 每个环的每个顶点都按 (x, y[, z]) 上的齐次矩阵变换。
 * 点几何若带有 radius 属性，按线性部分特征值的模缩放半径：
 * 各特征值的模在容差内相等时为各向同性，直接使用该模；
 * 否则记录一条警告，并使用模的平均值作为近似。
 */
#pragma once

#include "spalign/elements/spatial_element.hpp"
#include "spalign/utility/transform_options.hpp"

namespace spalign {
namespace operations {

/**
 * @brief 半径缩放因子
 */
struct RadiusScale {
    double factor = 1.0;
    bool isotropic = true;
};

class PolygonTransformer {
public:
    explicit PolygonTransformer(utility::TransformOptions options = utility::TransformOptions{})
        : options_(std::move(options)) {}

    /**
     * @brief 变换所有几何，结果注册表为占位
     * @throws AxisMismatchError 变换涉及几何之外的轴
     */
    elements::PolygonSet transform(const elements::PolygonSet& shapes,
                                   const math::transform::AffineTransform& transformation) const;

    /**
     * @brief 由线性部分计算半径缩放
     * @param linear D x D 线性矩阵
     * @param rtol 相对容差
     * @param atol 绝对容差
     */
    static RadiusScale radiusScaleFactor(const Eigen::MatrixXd& linear, double rtol, double atol);

private:
    utility::TransformOptions options_;
};

} // namespace operations
} // namespace spalign
