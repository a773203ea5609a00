/**
 * @file multiscale_transformer.hpp
 * @brief 多尺度金字塔的仿射变换
 *
 * 第 0 层直接使用变换 t；第 i 层先取该层相对第 0 层的缩放 S_i，
 * 使用 Sequence([S_i, t, S_i^-1]) 变换，保证所有层对齐到同一个物理变换。
 * 返回的 raster_translation 只取自第 0 层。
 */
#pragma once

#include "raster_transformer.hpp"

namespace spalign {
namespace operations {

struct TransformedMultiscaleRaster {
    elements::MultiscaleRaster raster;   ///< 各层与金字塔的注册表均为占位
    AffineTransform raster_translation;
};

class MultiscaleRasterTransformer {
public:
    explicit MultiscaleRasterTransformer(utility::TransformOptions options = utility::TransformOptions{},
                                         std::shared_ptr<const elements::IArrayCompute> compute = nullptr);

    /**
     * @throws AxisMismatchError, NonInvertibleTransformError
     */
    TransformedMultiscaleRaster transform(const elements::MultiscaleRaster& raster,
                                          const AffineTransform& transformation) const;

    /**
     * @brief 第 i 层实际使用的变换
     */
    static AffineTransform levelTransform(const elements::MultiscaleRaster& raster, size_t level,
                                          const AffineTransform& transformation);

private:
    RasterTransformer raster_transformer_;
};

} // namespace operations
} // namespace spalign
