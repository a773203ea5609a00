/**
 * @file transformation_adjuster.hpp
 * @brief 变换后重建元素的注册表
 *
 * 前置变换 to_prepend 由元素类型与 maintain_positioning 决定：
 *
 * | 元素           | maintain = true                                   | maintain = false      |
 * |----------------|---------------------------------------------------|-----------------------|
 * | 栅格/多尺度    | Sequence([raster_translation, t.inverse()])       | raster_translation    |
 * | 点表/几何      | t.inverse()                                       | Identity              |
 *
 * maintain = true：旧注册表中每个 (cs, old) 变为 (cs, Sequence([to_prepend, old]))；
 * maintain = false：只保留一个条目 (目标坐标系, to_prepend)，目标为空时使用默认坐标系。
 */
#pragma once

#include "spalign/elements/spatial_element.hpp"
#include "spalign/utility/transform_options.hpp"
#include <optional>

namespace spalign {
namespace operations {

using coordination::CoordinateSystemName;
using coordination::TransformationRegistry;
using math::transform::AffineTransform;

class TransformationAdjuster {
public:
    explicit TransformationAdjuster(utility::TransformOptions options = utility::TransformOptions{})
        : options_(std::move(options)) {}

    /**
     * @throws InvariantViolationError 栅格缺少 raster_translation，或非栅格带有 raster_translation
     */
    static AffineTransform toPrepend(elements::ElementKind kind,
                                     const AffineTransform& transformation,
                                     const std::optional<AffineTransform>& raster_translation,
                                     bool maintain_positioning);

    /**
     * @brief 计算新注册表
     * @param new_registry 变换产生的新元素当前的注册表，必须是占位
     * @param old_registry 原元素的注册表
     * @throws InvariantViolationError 前置条件不满足
     */
    TransformationRegistry adjust(const TransformationRegistry& new_registry,
                                  const TransformationRegistry& old_registry,
                                  elements::ElementKind kind,
                                  const AffineTransform& transformation,
                                  const std::optional<AffineTransform>& raster_translation,
                                  bool maintain_positioning,
                                  const std::optional<CoordinateSystemName>& to_coordinate_system) const;

    /**
     * @brief 对元素调用 adjust 并写回
     */
    elements::SpatialElement adjust(const elements::SpatialElement& transformed,
                                    const TransformationRegistry& old_registry,
                                    const AffineTransform& transformation,
                                    const std::optional<AffineTransform>& raster_translation,
                                    bool maintain_positioning,
                                    const std::optional<CoordinateSystemName>& to_coordinate_system) const;

private:
    utility::TransformOptions options_;
};

} // namespace operations
} // namespace spalign
