/**
 * @file transform_resolver.cpp
 * @brief 变换解析实现
 */

#include "spalign/coordination/transform_resolver.hpp"
#include "spalign/common/exceptions.hpp"
#include "spalign/utility/simple_logger.hpp"

namespace spalign {
namespace coordination {

namespace {

const char* kComponent = "TransformResolver";

const char* kNamedTargetRequired =
    "without maintain_positioning, apply() needs to_coordinate_system rather than an explicit "
    "transformation, because an element can be anchored in several coordinate systems. "
    "Register the transformation on the element first and transform to its coordinate system.";

} // namespace

ResolvedTransform resolveForTransform(const TransformationRegistry& registry,
                                      const std::optional<AffineTransform>& explicit_transform,
                                      const std::optional<CoordinateSystemName>& target_coordinate_system,
                                      bool maintain_positioning,
                                      const utility::TransformOptions& options) {
    if (!maintain_positioning) {
        if (!explicit_transform && target_coordinate_system) {
            auto found = registry.find(*target_coordinate_system);
            if (!found) {
                throw AmbiguousTransformError(kComponent,
                    "coordinate system '" + *target_coordinate_system + "' not found in element, registry is " +
                    registry.toString());
            }
            return ResolvedTransform{*found, target_coordinate_system};
        }

        if (explicit_transform && !target_coordinate_system && registry.size() == 1 &&
            options.allow_explicit_transform_shim) {
            const auto& [name, only] = *registry.begin();
            if (*explicit_transform == only) {
                LOG_COMPONENT_NAMED_WARN(kComponent, "Deprecated call form: {}", kNamedTargetRequired);
                return ResolvedTransform{*explicit_transform, name};
            }
        }

        throw AmbiguousTransformError(kComponent, kNamedTargetRequired);
    }

    if (explicit_transform.has_value() == target_coordinate_system.has_value()) {
        throw InvalidArgumentError(kComponent,
            "when maintain_positioning is true, exactly one of transformation and to_coordinate_system must be set");
    }

    if (explicit_transform) {
        return ResolvedTransform{*explicit_transform, std::nullopt};
    }

    return ResolvedTransform{registry.get(*target_coordinate_system), std::nullopt};
}

} // namespace coordination
} // namespace spalign
