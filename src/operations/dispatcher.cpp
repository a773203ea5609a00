/**
 * @file dispatcher.cpp
 * @brief 变换入口实现
 */

#include "spalign/operations/dispatcher.hpp"
#include "spalign/coordination/transform_resolver.hpp"
#include "spalign/common/exceptions.hpp"
#include "spalign/utility/simple_logger.hpp"
#include <type_traits>

namespace spalign {
namespace operations {

namespace {
const char* kComponent = "Dispatcher";
}

Dispatcher::Dispatcher(utility::TransformOptions options,
                       std::shared_ptr<const elements::IArrayCompute> compute,
                       std::shared_ptr<const elements::ISchemaValidator> validator)
    : options_(options),
      validator_(validator ? std::move(validator) : elements::defaultSchemaValidator()),
      raster_transformer_(options, compute),
      multiscale_transformer_(options, compute),
      point_transformer_(options),
      polygon_transformer_(options),
      adjuster_(options) {
    options_.validate();
}

elements::SpatialElement Dispatcher::apply(const elements::SpatialElement& element,
                                           const std::optional<AffineTransform>& transformation,
                                           bool maintain_positioning,
                                           const std::optional<CoordinateSystemName>& to_coordinate_system) const {
    const TransformationRegistry& old_registry = elements::transformationsOf(element);
    const coordination::ResolvedTransform resolved = coordination::resolveForTransform(
        old_registry, transformation, to_coordinate_system, maintain_positioning, options_);
    const AffineTransform& t = resolved.transformation;

    std::optional<AffineTransform> raster_translation;
    elements::SpatialElement transformed = std::visit([&](const auto& e) -> elements::SpatialElement {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, elements::Raster>) {
            TransformedRaster out = raster_transformer_.transform(e, t);
            raster_translation = out.raster_translation;
            return out.raster;
        } else if constexpr (std::is_same_v<T, elements::MultiscaleRaster>) {
            TransformedMultiscaleRaster out = multiscale_transformer_.transform(e, t);
            raster_translation = out.raster_translation;
            return out.raster;
        } else if constexpr (std::is_same_v<T, elements::PointTable>) {
            return point_transformer_.transform(e, t);
        } else {
            return polygon_transformer_.transform(e, t);
        }
    }, element);

    elements::SpatialElement result = adjuster_.adjust(transformed, old_registry, t, raster_translation,
                                                       maintain_positioning, resolved.target_coordinate_system);
    validator_->validate(result);

    LOG_COMPONENT_NAMED_DEBUG(kComponent, "{} transformed with {}, maintain_positioning={}",
                              elements::elementKindToString(elements::elementKind(element)),
                              t.toString(), maintain_positioning);
    return result;
}

elements::SpatialDataset Dispatcher::apply(const elements::SpatialDataset& dataset,
                                           const std::optional<AffineTransform>& transformation,
                                           bool maintain_positioning,
                                           const std::optional<CoordinateSystemName>& to_coordinate_system) const {
    if (!maintain_positioning) {
        if (!transformation && to_coordinate_system) {
            return transformToCoordinateSystem(dataset, *to_coordinate_system);
        }
        throw AmbiguousTransformError(kComponent,
            "without maintain_positioning a dataset can only be transformed to a named coordinate system");
    }
    if (transformation.has_value() == to_coordinate_system.has_value()) {
        throw InvalidArgumentError(kComponent,
            "when maintain_positioning is true, exactly one of transformation and to_coordinate_system must be set");
    }

    elements::SpatialDataset result;
    result.catalog() = dataset.catalog();
    for (auto group : elements::SpatialDataset::allGroups()) {
        const auto& elements_in_group = dataset.group(group);
        if (elements_in_group.empty()) {
            continue;
        }
        for (const auto& [name, element] : elements_in_group) {
            result.add(group, name, apply(element, transformation, true, to_coordinate_system));
        }
    }
    return result;
}

elements::SpatialDataset Dispatcher::transformToCoordinateSystem(const elements::SpatialDataset& dataset,
                                                                 const CoordinateSystemName& target) const {
    const elements::SpatialDataset anchored = dataset.filterByCoordinateSystem(target);

    elements::SpatialDataset result;
    result.catalog() = anchored.catalog();
    for (auto group : elements::SpatialDataset::allGroups()) {
        for (const auto& [name, element] : anchored.group(group)) {
            result.add(group, name, apply(element, std::nullopt, false, target));
        }
    }

    LOG_COMPONENT_NAMED_INFO(kComponent, "{} of {} elements transformed to '{}'",
                             result.size(), dataset.size(), target);
    return result;
}

elements::SpatialElement apply(const elements::SpatialElement& element,
                               const std::optional<AffineTransform>& transformation,
                               bool maintain_positioning,
                               const std::optional<CoordinateSystemName>& to_coordinate_system,
                               const utility::TransformOptions& options) {
    return Dispatcher(options).apply(element, transformation, maintain_positioning, to_coordinate_system);
}

} // namespace operations
} // namespace spalign
