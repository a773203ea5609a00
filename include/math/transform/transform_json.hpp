#pragma once

/**
 * @file transform_json.hpp
 * @brief AffineTransform 的 JSON 编解码
 *
 * 采用 NGFF "coordinateTransformations" 风格：
 * @code
 * {"type": "identity"}
 * {"type": "translation", "translation": [5, 5], "axes": ["y", "x"]}
 * {"type": "scale", "scale": [2, 2], "axes": ["y", "x"]}
 * {"type": "affine", "affine": [[...], ...], "input": ["x", "y"], "output": ["x", "y"]}
 * {"type": "sequence", "transformations": [...]}
 * @endcode
 */

#include "affine_transform.hpp"
#include <nlohmann/json.hpp>

namespace spalign {
namespace math {
namespace transform {

void to_json(nlohmann::json& j, const AffineTransform& t);

/**
 * @throws InvalidArgumentError 未知的类型或缺失字段
 */
void from_json(const nlohmann::json& j, AffineTransform& t);

std::string transformKindToString(TransformKind kind);

} // namespace transform
} // namespace math
} // namespace spalign
