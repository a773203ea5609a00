/**
 * @file transform_resolver.hpp
 * @brief 解析一次变换实际要应用的仿射变换
 *
 * 元素可能同时锚定在多个坐标系中，调用者必须消歧：
 * 给出目标坐标系名称，或（在 maintain_positioning 模式下）直接给出变换。
 *
 * 规则：
 * - maintain_positioning = false
 *   - 仅给出目标坐标系：从注册表取该坐标系的变换，缺失时 AmbiguousTransformError
 *   - 仅给出显式变换：仅当注册表恰有一个条目且与之结构相等时合法（已弃用的兼容写法）
 *   - 其余组合：AmbiguousTransformError
 * - maintain_positioning = true
 *   - 两者必须恰好给出一个，否则 InvalidArgumentError
 *   - 返回的目标坐标系总是空
 */

#pragma once

#include "transformation_registry.hpp"
#include "spalign/utility/transform_options.hpp"
#include <optional>

namespace spalign {
namespace coordination {

/**
 * @brief 解析结果
 */
struct ResolvedTransform {
    AffineTransform transformation;                                 ///< 要应用的变换
    std::optional<CoordinateSystemName> target_coordinate_system;   ///< 变换后的目标坐标系
};

/**
 * @brief 解析要应用的变换
 *
 * @param registry 元素当前的注册表
 * @param explicit_transform 调用者显式给出的变换
 * @param target_coordinate_system 目标坐标系
 * @param maintain_positioning 是否保持在其他坐标系中的定位
 * @param options 共享配置
 * @throws AmbiguousTransformError, InvalidArgumentError, CoordinateSystemNotFoundError
 */
ResolvedTransform resolveForTransform(const TransformationRegistry& registry,
                                      const std::optional<AffineTransform>& explicit_transform,
                                      const std::optional<CoordinateSystemName>& target_coordinate_system,
                                      bool maintain_positioning,
                                      const utility::TransformOptions& options = utility::TransformOptions{});

} // namespace coordination
} // namespace spalign
