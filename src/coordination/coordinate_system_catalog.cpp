/**
 * @file coordinate_system_catalog.cpp
 * @brief 坐标系目录实现
 */

#include "spalign/coordination/coordinate_system_catalog.hpp"
#include "spalign/common/exceptions.hpp"
#include "math/transform/affine_transform.hpp"

namespace spalign {
namespace coordination {

bool CoordinateSystemCatalog::registerCoordinateSystem(const CoordinateSystem& coordinate_system) {
    if (!validation::isValidCoordinateSystemName(coordinate_system.name())) {
        throw InvalidArgumentError("CoordinateSystemCatalog", "coordinate system name must not be empty");
    }

    auto it = coordinate_systems_.find(coordinate_system.name());
    if (it == coordinate_systems_.end()) {
        coordinate_systems_.emplace(coordinate_system.name(), coordinate_system);
        return true;
    }

    if (it->second != coordinate_system) {
        throw InvalidArgumentError("CoordinateSystemCatalog",
            "coordinate system '" + coordinate_system.name() + "' is already registered with axes " +
            math::transform::axesToString(it->second.axisNames()) + ", cannot re-register with axes " +
            math::transform::axesToString(coordinate_system.axisNames()));
    }
    return false;
}

const CoordinateSystem& CoordinateSystemCatalog::get(const CoordinateSystemName& name) const {
    auto it = coordinate_systems_.find(name);
    if (it == coordinate_systems_.end()) {
        throw CoordinateSystemNotFoundError(name, "not registered in the catalog");
    }
    return it->second;
}

bool CoordinateSystemCatalog::contains(const CoordinateSystemName& name) const {
    return coordinate_systems_.find(name) != coordinate_systems_.end();
}

std::vector<CoordinateSystemName> CoordinateSystemCatalog::names() const {
    std::vector<CoordinateSystemName> result;
    result.reserve(coordinate_systems_.size());
    for (const auto& [name, cs] : coordinate_systems_) {
        result.push_back(name);
    }
    return result;
}

std::string CoordinateSystemCatalog::generateDescription() const {
    std::string result = "Coordinate Systems:\n";
    result += "===================\n";
    result += "Count: " + std::to_string(coordinate_systems_.size()) + "\n\n";

    for (const auto& [name, cs] : coordinate_systems_) {
        result += name + ": ";
        for (size_t i = 0; i < cs.axes().size(); ++i) {
            const auto& axis = cs.axes()[i];
            if (i > 0) result += ", ";
            result += axis.name + (axis.type == AxisType::CHANNEL ? " (channel)" : " (space)");
        }
        result += "\n";
    }
    return result;
}

} // namespace coordination
} // namespace spalign
