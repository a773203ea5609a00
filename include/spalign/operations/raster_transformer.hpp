/**
 * @file raster_transformer.hpp
 * @brief 栅格的仿射变换
 *
 * 只有变换的线性部分作用在像素上（旋转、缩放），平移部分与旋转带来的
 * 角落填充由返回的 raster_translation 表达，由 TransformationAdjuster 写入注册表。
 *
 * 算法：
 * 1. 取空间维度范围 [0, n] 的 2^d 个角点，映射到目标空间
 * 2. 新形状 = ceil(max - min)，贴近整数时先吸附
 * 3. translation_vector = min(映射后的角点)
 * 4. 采样矩阵 Sequence([Translation(translation_vector), t.inverse()]) 把输出索引映射到输入坐标
 * 5. raster_translation = Translation(translation_vector - new/old / 2 + 0.5)
 *
 * 通道轴 c 原样透传。
 */
#pragma once

#include "spalign/elements/spatial_element.hpp"
#include "spalign/utility/transform_options.hpp"
#include <memory>

namespace spalign {
namespace operations {

using elements::LazyArrayPtr;
using elements::Shape;
using math::transform::AffineTransform;
using math::transform::AxisList;

/**
 * @brief 变换后的输出网格
 */
struct RasterOutputGeometry {
    Shape spatial_shape;                 ///< 各空间维度的新长度
    Eigen::VectorXd translation_vector;  ///< 映射后角点的最小值
};

struct RasterTransformResult {
    LazyArrayPtr data;
    AffineTransform raster_translation;
};

/**
 * @brief 变换后的栅格，注册表为占位
 */
struct TransformedRaster {
    elements::Raster raster;
    AffineTransform raster_translation;
};

class RasterTransformer {
public:
    /**
     * @param options 共享配置
     * @param compute 数组计算协作者，为空时按 options.lazy_resampling 创建
     */
    explicit RasterTransformer(utility::TransformOptions options = utility::TransformOptions{},
                               std::shared_ptr<const elements::IArrayCompute> compute = nullptr);

    /**
     * @brief 变换数组
     * @param data 输入数组
     * @param dims 数组维度名称
     * @param transformation 已解析的变换
     * @param order 插值阶数，为负时使用 options.interpolation_order
     * @throws AxisMismatchError 变换涉及栅格之外的轴
     * @throws NonInvertibleTransformError 变换不可逆
     */
    RasterTransformResult transform(const LazyArrayPtr& data,
                                    const AxisList& dims,
                                    const AffineTransform& transformation,
                                    int order = -1) const;

    /**
     * @brief 变换整个栅格，保留维度、模型与通道名称
     *
     * 标签栅格总是使用最近邻插值。
     */
    TransformedRaster transform(const elements::Raster& raster, const AffineTransform& transformation) const;

    /**
     * @brief 计算输出网格
     * @param spatial_shape 输入空间形状
     * @param matrix 空间维度上的齐次矩阵
     * @param snap_tolerance 吸附到整数的容差
     */
    static RasterOutputGeometry computeOutputGeometry(const Shape& spatial_shape,
                                                      const Eigen::MatrixXd& matrix,
                                                      double snap_tolerance);

    const utility::TransformOptions& options() const { return options_; }

private:
    utility::TransformOptions options_;
    std::shared_ptr<const elements::IArrayCompute> compute_;
};

} // namespace operations
} // namespace spalign
