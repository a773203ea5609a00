/**
 * @file coordinate_system.hpp
 * @brief 坐标系与轴定义
 *
 * 提供预定义的坐标系名称和轴名称常量，避免字符串拼写错误
 */

#pragma once

#include "math/transform/types.hpp"
#include <string>
#include <unordered_set>

namespace spalign {
namespace coordination {

using math::transform::AxisList;
using math::transform::AxisName;

// 使用字符串作为坐标系标识符
using CoordinateSystemName = std::string;
using CoordinateSystemNameSet = std::unordered_set<CoordinateSystemName>;

/**
 * @brief 预定义坐标系名称
 */
namespace coordinate_systems {

// 默认坐标系：新构造或刚变换完的元素都锚定在这里
constexpr const char* GLOBAL = "global";

} // namespace coordinate_systems

/**
 * @brief 预定义轴名称
 */
namespace axes {

constexpr const char* C = "c";
constexpr const char* Z = "z";
constexpr const char* Y = "y";
constexpr const char* X = "x";

/**
 * @brief 是否为通道轴
 */
inline bool isChannelAxis(const AxisName& axis) {
    return axis == C;
}

/**
 * @brief 去掉通道轴后的空间轴（保持原顺序）
 */
inline AxisList spatialAxes(const AxisList& all_axes) {
    AxisList result;
    for (const auto& axis : all_axes) {
        if (!isChannelAxis(axis)) {
            result.push_back(axis);
        }
    }
    return result;
}

} // namespace axes

/**
 * @brief 轴的类型
 */
enum class AxisType {
    SPACE,   ///< 空间轴
    CHANNEL  ///< 通道轴，变换时原样透传
};

/**
 * @brief 带类型的轴
 */
struct Axis {
    AxisName name;
    AxisType type = AxisType::SPACE;

    bool operator==(const Axis& other) const {
        return name == other.name && type == other.type;
    }
    bool operator!=(const Axis& other) const { return !(*this == other); }
};

/**
 * @brief 坐标系：名称加有序轴列表
 *
 * 以名称作为身份；同名坐标系必须具有相同的轴（由 CoordinateSystemCatalog 保证）。
 */
class CoordinateSystem {
public:
    CoordinateSystem() = default;
    CoordinateSystem(CoordinateSystemName name, std::vector<Axis> axes)
        : name_(std::move(name)), axes_(std::move(axes)) {}

    /**
     * @brief 从轴名称构造，"c" 识别为通道轴，其余为空间轴
     */
    static CoordinateSystem fromAxisNames(const CoordinateSystemName& name, const AxisList& axis_names) {
        std::vector<Axis> typed;
        typed.reserve(axis_names.size());
        for (const auto& axis : axis_names) {
            typed.push_back(Axis{axis, axes::isChannelAxis(axis) ? AxisType::CHANNEL : AxisType::SPACE});
        }
        return CoordinateSystem(name, std::move(typed));
    }

    const CoordinateSystemName& name() const { return name_; }
    const std::vector<Axis>& axes() const { return axes_; }

    AxisList axisNames() const {
        AxisList names;
        for (const auto& axis : axes_) {
            names.push_back(axis.name);
        }
        return names;
    }

    AxisList spatialAxisNames() const {
        AxisList names;
        for (const auto& axis : axes_) {
            if (axis.type == AxisType::SPACE) {
                names.push_back(axis.name);
            }
        }
        return names;
    }

    bool operator==(const CoordinateSystem& other) const {
        return name_ == other.name_ && axes_ == other.axes_;
    }
    bool operator!=(const CoordinateSystem& other) const { return !(*this == other); }

private:
    CoordinateSystemName name_;
    std::vector<Axis> axes_;
};

// 简化的工具函数
namespace validation {

// 基本的有效性检查（非空即可）
inline bool isValidCoordinateSystemName(const std::string& name) {
    return !name.empty();
}

} // namespace validation

} // namespace coordination
} // namespace spalign
