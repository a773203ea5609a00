/**
 * @file spatial_dataset.cpp
 * @brief 数据集容器实现
 */

#include "spalign/elements/spatial_dataset.hpp"
#include "spalign/common/exceptions.hpp"
#include <set>

namespace spalign {
namespace elements {

namespace {
const char* kComponent = "SpatialDataset";

ElementModel modelOf(const SpatialElement& element) {
    switch (elementKind(element)) {
        case ElementKind::RASTER:            return std::get<Raster>(element).model();
        case ElementKind::MULTISCALE_RASTER: return std::get<MultiscaleRaster>(element).model();
        case ElementKind::POINT_TABLE:       return ElementModel::POINTS;
        case ElementKind::POLYGON_SET:       return ElementModel::SHAPES;
    }
    return ElementModel::POINTS;
}
} // namespace

std::string elementGroupToString(ElementGroup group) {
    switch (group) {
        case ElementGroup::IMAGES: return "images";
        case ElementGroup::LABELS: return "labels";
        case ElementGroup::POINTS: return "points";
        case ElementGroup::SHAPES: return "shapes";
    }
    return "unknown";
}

const std::vector<ElementGroup>& SpatialDataset::allGroups() {
    static const std::vector<ElementGroup> groups = {
        ElementGroup::IMAGES, ElementGroup::LABELS, ElementGroup::POINTS, ElementGroup::SHAPES
    };
    return groups;
}

void SpatialDataset::add(ElementGroup group, const std::string& name, SpatialElement element) {
    if (name.empty()) {
        throw InvalidArgumentError(kComponent, "element name must not be empty");
    }
    if (contains(name)) {
        throw InvalidArgumentError(kComponent, "element '" + name + "' already exists");
    }
    checkGroupKind(group, name, element);
    checkCatalog(name, element);
    groups_[group].emplace(name, std::move(element));
}

const SpatialDataset::Group& SpatialDataset::group(ElementGroup group) const {
    static const Group empty_group;
    auto it = groups_.find(group);
    return it == groups_.end() ? empty_group : it->second;
}

bool SpatialDataset::contains(const std::string& name) const {
    return groupOf(name).has_value();
}

const SpatialElement& SpatialDataset::get(const std::string& name) const {
    for (const auto& [group, elements] : groups_) {
        auto it = elements.find(name);
        if (it != elements.end()) {
            return it->second;
        }
    }
    throw InvalidArgumentError(kComponent, "element '" + name + "' not found");
}

std::optional<ElementGroup> SpatialDataset::groupOf(const std::string& name) const {
    for (const auto& [group, elements] : groups_) {
        if (elements.count(name) > 0) {
            return group;
        }
    }
    return std::nullopt;
}

size_t SpatialDataset::size() const {
    size_t n = 0;
    for (const auto& [group, elements] : groups_) {
        n += elements.size();
    }
    return n;
}

std::vector<coordination::CoordinateSystemName> SpatialDataset::coordinateSystems() const {
    std::set<coordination::CoordinateSystemName> names;
    for (const auto& [group, elements] : groups_) {
        for (const auto& [name, element] : elements) {
            for (const auto& [cs, t] : transformationsOf(element)) {
                names.insert(cs);
            }
        }
    }
    for (const auto& cs : catalog_.names()) {
        names.insert(cs);
    }
    return {names.begin(), names.end()};
}

SpatialDataset SpatialDataset::filterByCoordinateSystem(const coordination::CoordinateSystemName& name) const {
    SpatialDataset result;
    if (catalog_.contains(name)) {
        result.catalog_.registerCoordinateSystem(catalog_.get(name));
    }
    for (const auto& [group, elements] : groups_) {
        for (const auto& [element_name, element] : elements) {
            if (transformationsOf(element).contains(name)) {
                result.groups_[group].emplace(element_name, element);
            }
        }
    }
    return result;
}

void SpatialDataset::checkGroupKind(ElementGroup group, const std::string& name,
                                    const SpatialElement& element) const {
    const ElementModel model = modelOf(element);
    bool ok = false;
    switch (group) {
        case ElementGroup::IMAGES: ok = isRasterModel(model) && !isLabelsModel(model); break;
        case ElementGroup::LABELS: ok = isLabelsModel(model); break;
        case ElementGroup::POINTS: ok = model == ElementModel::POINTS; break;
        case ElementGroup::SHAPES: ok = model == ElementModel::SHAPES; break;
    }
    if (!ok) {
        throw InvalidArgumentError(kComponent, "element '" + name + "' with model " +
                                   elementModelToString(model) + " cannot be added to group " +
                                   elementGroupToString(group));
    }
}

void SpatialDataset::checkCatalog(const std::string& name, const SpatialElement& element) const {
    const AxisList& element_axes = axesOf(element);
    for (const auto& [cs, t] : transformationsOf(element)) {
        if (!catalog_.contains(cs)) {
            continue;
        }
        const AxisList allowed = catalog_.get(cs).axisNames();
        for (const auto& axis : t.outputAxesFor(element_axes)) {
            if (!math::transform::containsAxis(allowed, axis)) {
                throw InvalidArgumentError(kComponent, "element '" + name + "' maps to axis '" + axis +
                                           "' which coordinate system '" + cs + "' does not have " +
                                           math::transform::axesToString(allowed));
            }
        }
    }
}

} // namespace elements
} // namespace spalign
