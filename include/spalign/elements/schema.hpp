/**
 * @file schema.hpp
 * @brief 元素模式校验
 *
 * 变换结果在返回给调用者之前必须通过校验；校验失败抛出 SchemaValidationError。
 */
#pragma once

#include "spatial_element.hpp"
#include <memory>

namespace spalign {
namespace elements {

/**
 * @brief 模式校验协作者接口
 */
class ISchemaValidator {
public:
    virtual ~ISchemaValidator() = default;

    /**
     * @throws SchemaValidationError
     */
    virtual void validate(const SpatialElement& element) const = 0;

    /**
     * @brief 元素的结构模型，多尺度栅格返回其层的模型
     */
    virtual ElementModel getModel(const SpatialElement& element) const = 0;

    /**
     * @brief 元素的有序轴名称
     */
    virtual AxisList getAxesNames(const SpatialElement& element) const = 0;
};

/**
 * @brief 默认校验规则
 *
 * - 栅格：维度顺序符合模型，各维长度大于 0，通道名称数量与 c 维一致，标签为整数类型
 * - 多尺度：各层有效，空间尺寸逐层不增
 * - 点表与几何：轴为 (x, y) 或 (x, y, z)，几何维度一致，多边形环至少 3 个顶点
 * - 注册表非空，且每个变换都能作用在元素的轴上
 */
class DefaultSchemaValidator : public ISchemaValidator {
public:
    void validate(const SpatialElement& element) const override;
    ElementModel getModel(const SpatialElement& element) const override;
    AxisList getAxesNames(const SpatialElement& element) const override;

private:
    void validateRaster(const Raster& raster, const std::string& what) const;
    void validateMultiscale(const MultiscaleRaster& raster) const;
    void validatePoints(const PointTable& points) const;
    void validateShapes(const PolygonSet& shapes) const;
    void validateRegistry(const TransformationRegistry& registry, const AxisList& axes,
                          const std::string& what) const;
};

std::shared_ptr<const ISchemaValidator> defaultSchemaValidator();

} // namespace elements
} // namespace spalign
