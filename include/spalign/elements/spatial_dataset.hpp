/**
 * @file spatial_dataset.hpp
 * @brief 按组聚合的命名元素集合
 *
 * 四个组：images、labels、points、shapes。元素名称在整个数据集中唯一。
 * 数据集持有一个 CoordinateSystemCatalog；若元素锚定的坐标系已在目录中登记，
 * 元素变换后的轴必须是该坐标系轴的子集。
 */
#pragma once

#include "spatial_element.hpp"
#include "spalign/coordination/coordinate_system_catalog.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace spalign {
namespace elements {

enum class ElementGroup {
    IMAGES,
    LABELS,
    POINTS,
    SHAPES
};

std::string elementGroupToString(ElementGroup group);

class SpatialDataset {
public:
    using Group = std::map<std::string, SpatialElement>;

    SpatialDataset() = default;

    static const std::vector<ElementGroup>& allGroups();

    /**
     * @brief 添加元素
     * @throws InvalidArgumentError 名称重复、元素类型与组不符，或与目录中的坐标系冲突
     */
    void add(ElementGroup group, const std::string& name, SpatialElement element);

    const Group& group(ElementGroup group) const;
    const Group& images() const { return group(ElementGroup::IMAGES); }
    const Group& labels() const { return group(ElementGroup::LABELS); }
    const Group& points() const { return group(ElementGroup::POINTS); }
    const Group& shapes() const { return group(ElementGroup::SHAPES); }

    bool contains(const std::string& name) const;

    /**
     * @throws InvalidArgumentError 元素不存在
     */
    const SpatialElement& get(const std::string& name) const;

    std::optional<ElementGroup> groupOf(const std::string& name) const;

    size_t size() const;
    bool empty() const { return size() == 0; }

    /**
     * @brief 所有元素注册表中出现的坐标系，加上目录中登记的坐标系，按名称排序
     */
    std::vector<coordination::CoordinateSystemName> coordinateSystems() const;

    /**
     * @brief 只保留锚定在指定坐标系中的元素
     */
    SpatialDataset filterByCoordinateSystem(const coordination::CoordinateSystemName& name) const;

    const coordination::CoordinateSystemCatalog& catalog() const { return catalog_; }
    coordination::CoordinateSystemCatalog& catalog() { return catalog_; }

private:
    std::map<ElementGroup, Group> groups_;
    coordination::CoordinateSystemCatalog catalog_;

    void checkGroupKind(ElementGroup group, const std::string& name, const SpatialElement& element) const;
    void checkCatalog(const std::string& name, const SpatialElement& element) const;
};

} // namespace elements
} // namespace spalign
