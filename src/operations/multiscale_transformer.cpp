/**
 * @file multiscale_transformer.cpp
 * @brief 多尺度栅格变换实现
 */

#include "spalign/operations/multiscale_transformer.hpp"
#include "spalign/utility/simple_logger.hpp"
#include <optional>

namespace spalign {
namespace operations {

MultiscaleRasterTransformer::MultiscaleRasterTransformer(utility::TransformOptions options,
                                                         std::shared_ptr<const elements::IArrayCompute> compute)
    : raster_transformer_(std::move(options), std::move(compute)) {}

AffineTransform MultiscaleRasterTransformer::levelTransform(const elements::MultiscaleRaster& raster,
                                                           size_t level,
                                                           const AffineTransform& transformation) {
    if (level == 0) {
        return transformation;
    }
    const AffineTransform scale = raster.levelScale(level);
    return AffineTransform::Sequence({scale, transformation, scale.inverse()});
}

TransformedMultiscaleRaster MultiscaleRasterTransformer::transform(const elements::MultiscaleRaster& raster,
                                                                   const AffineTransform& transformation) const {
    const auto& options = raster_transformer_.options();
    std::vector<elements::Raster> levels;
    levels.reserve(raster.numLevels());
    std::optional<AffineTransform> raster_translation;

    for (size_t i = 0; i < raster.numLevels(); ++i) {
        const AffineTransform composed = levelTransform(raster, i, transformation);
        TransformedRaster transformed = raster_transformer_.transform(raster.level(i), composed);
        if (!raster_translation) {
            raster_translation = transformed.raster_translation;
        }
        levels.push_back(std::move(transformed.raster));

        LOG_COMPONENT_NAMED_DEBUG("MultiscaleRasterTransformer", "level {} -> {}",
                                  elements::MultiscaleRaster::levelName(i),
                                  elements::shapeToString(levels.back().shape()));
    }

    return TransformedMultiscaleRaster{
        elements::MultiscaleRaster(std::move(levels),
                                   coordination::TransformationRegistry::withDefault(options.default_coordinate_system),
                                   options.default_coordinate_system),
        *raster_translation
    };
}

} // namespace operations
} // namespace spalign
