/**
 * @file coordinate_system_catalog.hpp
 * @brief 坐标系目录
 *
 * 记录数据集中声明过的坐标系，保证同名坐标系的轴一致。
 *
 * 使用示例：
 * @code
 * CoordinateSystemCatalog catalog;
 * catalog.registerCoordinateSystem(CoordinateSystem::fromAxisNames("global", {"c", "y", "x"}));
 *
 * // 同名但轴不同会抛出 InvalidArgumentError
 * catalog.registerCoordinateSystem(CoordinateSystem::fromAxisNames("global", {"x", "y", "z"}));
 * @endcode
 */

#pragma once

#include "coordinate_system.hpp"
#include <map>
#include <string>
#include <vector>

namespace spalign {
namespace coordination {

class CoordinateSystemCatalog {
public:
    CoordinateSystemCatalog() = default;

    // ==================== 注册接口 ====================

    /**
     * @brief 注册坐标系
     *
     * @param coordinate_system 坐标系
     * @return 新注册返回 true，已存在且完全相同返回 false
     * @throws InvalidArgumentError 名称无效，或同名坐标系的轴不同
     */
    bool registerCoordinateSystem(const CoordinateSystem& coordinate_system);

    // ==================== 查询接口 ====================

    /**
     * @throws CoordinateSystemNotFoundError 未注册时
     */
    const CoordinateSystem& get(const CoordinateSystemName& name) const;

    bool contains(const CoordinateSystemName& name) const;

    std::vector<CoordinateSystemName> names() const;

    size_t size() const { return coordinate_systems_.size(); }

    // ==================== 调试和诊断接口 ====================

    /**
     * @brief 生成目录的文本表示
     */
    std::string generateDescription() const;

    void clear() { coordinate_systems_.clear(); }

private:
    std::map<CoordinateSystemName, CoordinateSystem> coordinate_systems_;
};

} // namespace coordination
} // namespace spalign
