/**
 * @file transformation_registry.hpp
 * @brief 元素的变换注册表
 *
 * 每个空间元素独占一个注册表：坐标系名称 -> 把该元素锚定到该坐标系的仿射变换。
 * 注册表是值类型，元素持有不可变副本；"修改"总是构造新的注册表。
 *
 * 使用示例：
 * @code
 * auto registry = TransformationRegistry::withDefault();             // {"global": Identity}
 * registry.set("physical", AffineTransform::Scale(Eigen::Vector2d(0.5, 0.5), {"y", "x"}));
 *
 * const auto& t = registry.get("physical");
 * registry.get("atlas");                                            // 抛出 CoordinateSystemNotFoundError
 * @endcode
 */

#pragma once

#include "coordinate_system.hpp"
#include "math/transform/affine_transform.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace spalign {
namespace coordination {

using math::transform::AffineTransform;

class TransformationRegistry {
public:
    using Storage = std::map<CoordinateSystemName, AffineTransform>;
    using const_iterator = Storage::const_iterator;

    TransformationRegistry() = default;

    /**
     * @brief 只包含一个条目 {default_coordinate_system: Identity} 的注册表
     */
    static TransformationRegistry withDefault(
        const CoordinateSystemName& default_coordinate_system = coordinate_systems::GLOBAL);

    // ==================== 查询接口 ====================

    /**
     * @throws CoordinateSystemNotFoundError 坐标系不存在
     */
    const AffineTransform& get(const CoordinateSystemName& coordinate_system) const;

    std::optional<AffineTransform> find(const CoordinateSystemName& coordinate_system) const;

    bool contains(const CoordinateSystemName& coordinate_system) const;

    std::vector<CoordinateSystemName> coordinateSystems() const;

    size_t size() const { return transformations_.size(); }
    bool empty() const { return transformations_.empty(); }

    const_iterator begin() const { return transformations_.begin(); }
    const_iterator end() const { return transformations_.end(); }

    /**
     * @brief 是否为变换刚产生时的占位状态
     *
     * 恰好一个条目，键为默认坐标系，值为 Identity。
     */
    bool isPlaceholder(const CoordinateSystemName& default_coordinate_system = coordinate_systems::GLOBAL) const;

    // ==================== 修改接口 ====================

    /**
     * @brief 设置（或覆盖）一个坐标系的变换
     * @throws InvalidArgumentError 坐标系名称为空
     */
    void set(const CoordinateSystemName& coordinate_system, const AffineTransform& transformation);

    /**
     * @brief 返回设置了给定条目的新注册表，自身不变
     */
    TransformationRegistry with(const CoordinateSystemName& coordinate_system,
                                const AffineTransform& transformation) const;

    bool remove(const CoordinateSystemName& coordinate_system);

    void clear() { transformations_.clear(); }

    // ==================== 比较 ====================

    bool operator==(const TransformationRegistry& other) const {
        return transformations_ == other.transformations_;
    }
    bool operator!=(const TransformationRegistry& other) const { return !(*this == other); }

    /**
     * @brief 按矩阵近似比较，两边的坐标系集合必须相同
     */
    bool isApprox(const TransformationRegistry& other, const AxisList& axes,
                  double tolerance = math::transform::constants::EPSILON) const;

    std::string toString() const;

private:
    Storage transformations_;
};

/**
 * @brief 注册表编码为 {"坐标系": 变换JSON, ...}
 */
void to_json(nlohmann::json& j, const TransformationRegistry& registry);

/**
 * @throws InvalidArgumentError JSON 不是对象或变换格式错误
 */
void from_json(const nlohmann::json& j, TransformationRegistry& registry);

} // namespace coordination
} // namespace spalign
