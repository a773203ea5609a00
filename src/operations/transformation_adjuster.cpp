/**
 * @file transformation_adjuster.cpp
 * @brief 注册表重建实现
 */

#include "spalign/operations/transformation_adjuster.hpp"
#include "spalign/common/exceptions.hpp"
#include "spalign/utility/simple_logger.hpp"

namespace spalign {
namespace operations {

namespace {

const char* kComponent = "TransformationAdjuster";

bool isRasterKind(elements::ElementKind kind) {
    return kind == elements::ElementKind::RASTER || kind == elements::ElementKind::MULTISCALE_RASTER;
}

} // namespace

AffineTransform TransformationAdjuster::toPrepend(elements::ElementKind kind,
                                                  const AffineTransform& transformation,
                                                  const std::optional<AffineTransform>& raster_translation,
                                                  bool maintain_positioning) {
    if (isRasterKind(kind)) {
        if (!raster_translation) {
            throw InvariantViolationError(kComponent,
                elements::elementKindToString(kind) + " requires a raster translation");
        }
        if (maintain_positioning) {
            return AffineTransform::Sequence({*raster_translation, transformation.inverse()});
        }
        return *raster_translation;
    }

    if (raster_translation) {
        throw InvariantViolationError(kComponent,
            elements::elementKindToString(kind) + " must not carry a raster translation");
    }
    return maintain_positioning ? transformation.inverse() : AffineTransform::Identity();
}

TransformationRegistry TransformationAdjuster::adjust(const TransformationRegistry& new_registry,
                                                      const TransformationRegistry& old_registry,
                                                      elements::ElementKind kind,
                                                      const AffineTransform& transformation,
                                                      const std::optional<AffineTransform>& raster_translation,
                                                      bool maintain_positioning,
                                                      const std::optional<CoordinateSystemName>& to_coordinate_system) const {
    if (maintain_positioning && to_coordinate_system) {
        throw InvariantViolationError(kComponent,
            "to_coordinate_system must be empty when maintain_positioning is true");
    }
    if (!new_registry.isPlaceholder(options_.default_coordinate_system)) {
        throw InvariantViolationError(kComponent,
            "transformed element must hold only {" + options_.default_coordinate_system +
            ": Identity} before adjustment, got " + new_registry.toString());
    }

    const AffineTransform to_prepend = toPrepend(kind, transformation, raster_translation, maintain_positioning);

    TransformationRegistry result;
    if (maintain_positioning) {
        for (const auto& [cs, old] : old_registry) {
            result.set(cs, AffineTransform::Sequence({to_prepend, old}));
        }
    } else {
        result.set(to_coordinate_system.value_or(options_.default_coordinate_system), to_prepend);
    }

    LOG_COMPONENT_NAMED_DEBUG(kComponent, "{} registry {} -> {}",
                              elements::elementKindToString(kind), old_registry.toString(), result.toString());
    return result;
}

elements::SpatialElement TransformationAdjuster::adjust(const elements::SpatialElement& transformed,
                                                        const TransformationRegistry& old_registry,
                                                        const AffineTransform& transformation,
                                                        const std::optional<AffineTransform>& raster_translation,
                                                        bool maintain_positioning,
                                                        const std::optional<CoordinateSystemName>& to_coordinate_system) const {
    TransformationRegistry registry = adjust(elements::transformationsOf(transformed), old_registry,
                                             elements::elementKind(transformed), transformation,
                                             raster_translation, maintain_positioning, to_coordinate_system);
    return elements::withTransformations(transformed, std::move(registry));
}

} // namespace operations
} // namespace spalign
