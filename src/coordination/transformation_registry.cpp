/**
 * @file transformation_registry.cpp
 * @brief 元素变换注册表实现
 */

#include "spalign/coordination/transformation_registry.hpp"
#include "spalign/common/exceptions.hpp"
#include "math/transform/transform_json.hpp"

namespace spalign {
namespace coordination {

TransformationRegistry TransformationRegistry::withDefault(const CoordinateSystemName& default_coordinate_system) {
    TransformationRegistry registry;
    registry.set(default_coordinate_system, AffineTransform::Identity());
    return registry;
}

const AffineTransform& TransformationRegistry::get(const CoordinateSystemName& coordinate_system) const {
    auto it = transformations_.find(coordinate_system);
    if (it == transformations_.end()) {
        std::string available;
        for (const auto& [name, t] : transformations_) {
            available += (available.empty() ? "" : ", ") + name;
        }
        throw CoordinateSystemNotFoundError(coordinate_system, "available: [" + available + "]");
    }
    return it->second;
}

std::optional<AffineTransform> TransformationRegistry::find(const CoordinateSystemName& coordinate_system) const {
    auto it = transformations_.find(coordinate_system);
    if (it == transformations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TransformationRegistry::contains(const CoordinateSystemName& coordinate_system) const {
    return transformations_.find(coordinate_system) != transformations_.end();
}

std::vector<CoordinateSystemName> TransformationRegistry::coordinateSystems() const {
    std::vector<CoordinateSystemName> names;
    names.reserve(transformations_.size());
    for (const auto& [name, t] : transformations_) {
        names.push_back(name);
    }
    return names;
}

bool TransformationRegistry::isPlaceholder(const CoordinateSystemName& default_coordinate_system) const {
    if (transformations_.size() != 1) {
        return false;
    }
    auto it = transformations_.find(default_coordinate_system);
    return it != transformations_.end() &&
           it->second.kind() == math::transform::TransformKind::IDENTITY;
}

void TransformationRegistry::set(const CoordinateSystemName& coordinate_system,
                                 const AffineTransform& transformation) {
    if (!validation::isValidCoordinateSystemName(coordinate_system)) {
        throw InvalidArgumentError("TransformationRegistry", "coordinate system name must not be empty");
    }
    transformations_.insert_or_assign(coordinate_system, transformation);
}

TransformationRegistry TransformationRegistry::with(const CoordinateSystemName& coordinate_system,
                                                    const AffineTransform& transformation) const {
    TransformationRegistry copy = *this;
    copy.set(coordinate_system, transformation);
    return copy;
}

bool TransformationRegistry::remove(const CoordinateSystemName& coordinate_system) {
    return transformations_.erase(coordinate_system) > 0;
}

bool TransformationRegistry::isApprox(const TransformationRegistry& other, const AxisList& axes,
                                      double tolerance) const {
    if (transformations_.size() != other.transformations_.size()) {
        return false;
    }
    for (const auto& [name, t] : transformations_) {
        auto it = other.transformations_.find(name);
        if (it == other.transformations_.end() || !t.isApprox(it->second, axes, tolerance)) {
            return false;
        }
    }
    return true;
}

std::string TransformationRegistry::toString() const {
    std::string result = "{";
    bool first = true;
    for (const auto& [name, t] : transformations_) {
        if (!first) result += ", ";
        result += name + ": " + t.toString();
        first = false;
    }
    return result + "}";
}

// ==================== JSON ====================

void to_json(nlohmann::json& j, const TransformationRegistry& registry) {
    j = nlohmann::json::object();
    for (const auto& [name, t] : registry) {
        j[name] = t;
    }
}

void from_json(const nlohmann::json& j, TransformationRegistry& registry) {
    if (!j.is_object()) {
        throw InvalidArgumentError("TransformationRegistry", "registry JSON must be an object");
    }
    TransformationRegistry result;
    for (auto it = j.begin(); it != j.end(); ++it) {
        result.set(it.key(), it.value().get<AffineTransform>());
    }
    registry = std::move(result);
}

} // namespace coordination
} // namespace spalign
