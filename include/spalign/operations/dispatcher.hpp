/**
 * @file dispatcher.hpp
 * @brief 变换的统一入口
 *
 * apply() 依次完成：解析要应用的变换，按元素类型分派到对应的变换器，
 * 重建注册表，最后用模式校验器检查结果。输入元素永不被修改。
 *
 * 使用示例：
 * @code
 * Dispatcher dispatcher(TransformOptions::fromConfig());
 *
 * // 把点表变换到 "physical" 坐标系
 * SpatialElement moved = dispatcher.apply(points, std::nullopt, false, "physical");
 *
 * // 旋转数据，同时保持它在所有坐标系中的位置
 * SpatialElement rotated = dispatcher.apply(image, AffineTransform::Rotation(HALF_PI, {"y", "x"}), true);
 * @endcode
 */
#pragma once

#include "multiscale_transformer.hpp"
#include "point_transformer.hpp"
#include "polygon_transformer.hpp"
#include "raster_transformer.hpp"
#include "transformation_adjuster.hpp"
#include "spalign/elements/schema.hpp"
#include "spalign/elements/spatial_dataset.hpp"
#include <memory>
#include <optional>

namespace spalign {
namespace operations {

class Dispatcher {
public:
    /**
     * @param options 共享配置
     * @param compute 数组计算协作者，为空时按配置创建
     * @param validator 模式校验器，为空时使用 DefaultSchemaValidator
     */
    explicit Dispatcher(utility::TransformOptions options = utility::TransformOptions{},
                        std::shared_ptr<const elements::IArrayCompute> compute = nullptr,
                        std::shared_ptr<const elements::ISchemaValidator> validator = nullptr);

    /**
     * @brief 变换单个元素
     * @param element 输入元素
     * @param transformation 显式变换（maintain_positioning 为 true 时使用）
     * @param maintain_positioning 是否保持在其他坐标系中的定位
     * @param to_coordinate_system 目标坐标系
     * @throws AmbiguousTransformError, InvalidArgumentError, CoordinateSystemNotFoundError,
     *         AxisMismatchError, NonInvertibleTransformError, SchemaValidationError
     */
    elements::SpatialElement apply(const elements::SpatialElement& element,
                                   const std::optional<AffineTransform>& transformation = std::nullopt,
                                   bool maintain_positioning = false,
                                   const std::optional<CoordinateSystemName>& to_coordinate_system = std::nullopt) const;

    /**
     * @brief 变换整个数据集
     *
     * maintain_positioning 为 false 时只接受目标坐标系写法，等价于 transformToCoordinateSystem；
     * 为 true 时逐元素变换，空组跳过。
     */
    elements::SpatialDataset apply(const elements::SpatialDataset& dataset,
                                   const std::optional<AffineTransform>& transformation = std::nullopt,
                                   bool maintain_positioning = false,
                                   const std::optional<CoordinateSystemName>& to_coordinate_system = std::nullopt) const;

    /**
     * @brief 把锚定在目标坐标系中的元素全部变换过去，其余元素丢弃
     */
    elements::SpatialDataset transformToCoordinateSystem(const elements::SpatialDataset& dataset,
                                                         const CoordinateSystemName& target) const;

    const utility::TransformOptions& options() const { return options_; }

private:
    utility::TransformOptions options_;
    std::shared_ptr<const elements::ISchemaValidator> validator_;
    RasterTransformer raster_transformer_;
    MultiscaleRasterTransformer multiscale_transformer_;
    PointTransformer point_transformer_;
    PolygonTransformer polygon_transformer_;
    TransformationAdjuster adjuster_;
};

/**
 * @brief 使用一次性 Dispatcher 变换单个元素
 */
elements::SpatialElement apply(const elements::SpatialElement& element,
                               const std::optional<AffineTransform>& transformation = std::nullopt,
                               bool maintain_positioning = false,
                               const std::optional<CoordinateSystemName>& to_coordinate_system = std::nullopt,
                               const utility::TransformOptions& options = utility::TransformOptions{});

} // namespace operations
} // namespace spalign
