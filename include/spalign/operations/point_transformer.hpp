/**
 * @file point_transformer.hpp
 * @brief 点表的仿射变换
 */
#pragma once

#include "spalign/elements/spatial_element.hpp"
#include "spalign/utility/transform_options.hpp"

namespace spalign {
namespace operations {

class PointTransformer {
public:
    explicit PointTransformer(utility::TransformOptions options = utility::TransformOptions{})
        : options_(std::move(options)) {}

    /**
     * @brief 变换坐标列，属性列保持不变，结果注册表为占位
     * @throws AxisMismatchError 变换涉及点表之外的轴
     */
    elements::PointTable transform(const elements::PointTable& points,
                                   const math::transform::AffineTransform& transformation) const;

private:
    utility::TransformOptions options_;
};

} // namespace operations
} // namespace spalign
