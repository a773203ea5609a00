/**
 * @file spatial_element.cpp
 * @brief 空间元素实现
 */

#include "spalign/elements/spatial_element.hpp"
#include "spalign/common/exceptions.hpp"
#include <type_traits>

namespace spalign {
namespace elements {

namespace {

const char* kComponent = "SpatialElement";

bool sameMatrix(const Eigen::MatrixXd& a, const Eigen::MatrixXd& b) {
    return a.rows() == b.rows() && a.cols() == b.cols() && a == b;
}

void requireColumnLengths(const AttributeTable& attributes, size_t rows, const std::string& what) {
    for (const auto& [name, column] : attributes) {
        if (column.size() != rows) {
            throw InvalidArgumentError(kComponent, what + " attribute '" + name + "' has " +
                                       std::to_string(column.size()) + " values for " +
                                       std::to_string(rows) + " rows");
        }
    }
}

} // namespace

std::string elementModelToString(ElementModel model) {
    switch (model) {
        case ElementModel::IMAGE2D:  return "Image2D";
        case ElementModel::IMAGE3D:  return "Image3D";
        case ElementModel::LABELS2D: return "Labels2D";
        case ElementModel::LABELS3D: return "Labels3D";
        case ElementModel::POINTS:   return "Points";
        case ElementModel::SHAPES:   return "Shapes";
    }
    return "Unknown";
}

bool isRasterModel(ElementModel model) {
    return model != ElementModel::POINTS && model != ElementModel::SHAPES;
}

bool isLabelsModel(ElementModel model) {
    return model == ElementModel::LABELS2D || model == ElementModel::LABELS3D;
}

AxisList expectedDims(ElementModel model) {
    switch (model) {
        case ElementModel::IMAGE2D:  return {"c", "y", "x"};
        case ElementModel::IMAGE3D:  return {"c", "z", "y", "x"};
        case ElementModel::LABELS2D: return {"y", "x"};
        case ElementModel::LABELS3D: return {"z", "y", "x"};
        default:
            throw InvalidArgumentError(kComponent, elementModelToString(model) + " is not a raster model");
    }
}

// ==================== Raster ====================

Raster::Raster(LazyArrayPtr data,
               AxisList dims,
               ElementModel model,
               TransformationRegistry transformations,
               std::vector<std::string> channel_names)
    : data_(std::move(data)),
      dims_(std::move(dims)),
      model_(model),
      transformations_(std::move(transformations)),
      channel_names_(std::move(channel_names)) {
    if (!data_) {
        throw InvalidArgumentError(kComponent, "Raster needs data");
    }
    if (!isRasterModel(model_)) {
        throw InvalidArgumentError(kComponent, elementModelToString(model_) + " is not a raster model");
    }
    if (data_->ndim() != dims_.size()) {
        throw InvalidArgumentError(kComponent, "Raster data has " + std::to_string(data_->ndim()) +
                                   " dimensions but dims are " + math::transform::axesToString(dims_));
    }
}

AxisList Raster::spatialDims() const {
    return coordination::axes::spatialAxes(dims_);
}

size_t Raster::extent(const std::string& dim) const {
    return shape()[math::transform::axisIndex(dims_, dim)];
}

Raster Raster::withTransformations(TransformationRegistry transformations) const {
    Raster copy = *this;
    copy.transformations_ = std::move(transformations);
    return copy;
}

// ==================== MultiscaleRaster ====================

MultiscaleRaster::MultiscaleRaster(std::vector<Raster> levels,
                                   TransformationRegistry transformations,
                                   const std::string& default_coordinate_system)
    : levels_(std::move(levels)),
      transformations_(std::move(transformations)),
      default_coordinate_system_(default_coordinate_system) {
    if (levels_.empty()) {
        throw InvalidArgumentError(kComponent, "MultiscaleRaster needs at least one level");
    }
    for (size_t i = 1; i < levels_.size(); ++i) {
        if (levels_[i].dims() != levels_[0].dims() || levels_[i].model() != levels_[0].model()) {
            throw InvalidArgumentError(kComponent, "level " + levelName(i) +
                                       " does not share dims and model with " + levelName(0));
        }
    }
    propagateToLevels();
}

void MultiscaleRaster::propagateToLevels() {
    if (transformations_.isPlaceholder(default_coordinate_system_)) {
        for (auto& level : levels_) {
            level = level.withTransformations(transformations_);
        }
        return;
    }

    const AxisList spatial = levels_.front().spatialDims();
    const Shape& base_shape = levels_.front().shape();
    for (size_t i = 0; i < levels_.size(); ++i) {
        if (i == 0) {
            levels_[0] = levels_[0].withTransformations(transformations_);
            continue;
        }
        Eigen::VectorXd factors(spatial.size());
        for (size_t k = 0; k < spatial.size(); ++k) {
            const size_t d = math::transform::axisIndex(levels_[i].dims(), spatial[k]);
            factors[k] = static_cast<double>(base_shape[d]) / static_cast<double>(levels_[i].shape()[d]);
        }
        const auto scale = AffineTransform::Scale(factors, spatial);

        TransformationRegistry level_registry;
        for (const auto& [cs, t] : transformations_) {
            level_registry.set(cs, AffineTransform::Sequence({scale, t}));
        }
        levels_[i] = levels_[i].withTransformations(std::move(level_registry));
    }
}

AffineTransform MultiscaleRaster::levelScale(size_t i) const {
    const Raster& lvl = levels_.at(i);
    const AxisList spatial = lvl.spatialDims();

    // 优先使用层注册表中记录的缩放
    if (!lvl.transformations().empty()) {
        const AffineTransform& first = lvl.transformations().begin()->second;
        if (first.kind() == math::transform::TransformKind::SCALE) {
            return first;
        }
        if (first.kind() == math::transform::TransformKind::SEQUENCE) {
            for (const auto& t : first.transformations()) {
                if (t.kind() == math::transform::TransformKind::SCALE) {
                    return t;
                }
            }
        }
    }

    Eigen::VectorXd factors(spatial.size());
    for (size_t k = 0; k < spatial.size(); ++k) {
        factors[k] = static_cast<double>(levels_.front().extent(spatial[k])) /
                     static_cast<double>(lvl.extent(spatial[k]));
    }
    return AffineTransform::Scale(factors, spatial);
}

MultiscaleRaster MultiscaleRaster::withTransformations(TransformationRegistry transformations) const {
    return MultiscaleRaster(levels_, std::move(transformations), default_coordinate_system_);
}

// ==================== PointTable ====================

PointTable::PointTable(Eigen::MatrixXd coordinates,
                       AxisList axes,
                       AttributeTable attributes,
                       TransformationRegistry transformations)
    : coordinates_(std::move(coordinates)),
      axes_(std::move(axes)),
      attributes_(std::move(attributes)),
      transformations_(std::move(transformations)) {
    if (static_cast<size_t>(coordinates_.cols()) != axes_.size()) {
        throw InvalidArgumentError(kComponent, "PointTable has " + std::to_string(coordinates_.cols()) +
                                   " coordinate columns for axes " + math::transform::axesToString(axes_));
    }
    requireColumnLengths(attributes_, numPoints(), "PointTable");
}

PointTable PointTable::withTransformations(TransformationRegistry transformations) const {
    PointTable copy = *this;
    copy.transformations_ = std::move(transformations);
    return copy;
}

// ==================== Geometry / PolygonSet ====================

std::string geometryTypeToString(GeometryType type) {
    switch (type) {
        case GeometryType::POINT:         return "Point";
        case GeometryType::POLYGON:       return "Polygon";
        case GeometryType::MULTI_POLYGON: return "MultiPolygon";
    }
    return "Unknown";
}

Geometry Geometry::Point(const Eigen::RowVectorXd& coordinates) {
    Geometry g;
    g.type = GeometryType::POINT;
    g.point = coordinates;
    return g;
}

Geometry Geometry::Polygon(const Eigen::MatrixXd& exterior, std::vector<Eigen::MatrixXd> interiors) {
    Geometry g;
    g.type = GeometryType::POLYGON;
    g.parts.push_back(PolygonPart{exterior, std::move(interiors)});
    return g;
}

Geometry Geometry::MultiPolygon(std::vector<PolygonPart> parts) {
    Geometry g;
    g.type = GeometryType::MULTI_POLYGON;
    g.parts = std::move(parts);
    return g;
}

Eigen::Index Geometry::dimension() const {
    if (type == GeometryType::POINT) {
        return point.size();
    }
    return parts.empty() ? 0 : parts.front().exterior.cols();
}

bool Geometry::operator==(const Geometry& other) const {
    if (type != other.type || point.size() != other.point.size() || point != other.point ||
        parts.size() != other.parts.size()) {
        return false;
    }
    for (size_t i = 0; i < parts.size(); ++i) {
        const auto& a = parts[i];
        const auto& b = other.parts[i];
        if (!sameMatrix(a.exterior, b.exterior) || a.interiors.size() != b.interiors.size()) {
            return false;
        }
        for (size_t k = 0; k < a.interiors.size(); ++k) {
            if (!sameMatrix(a.interiors[k], b.interiors[k])) {
                return false;
            }
        }
    }
    return true;
}

PolygonSet::PolygonSet(std::vector<Geometry> geometries,
                       AxisList axes,
                       AttributeTable attributes,
                       TransformationRegistry transformations)
    : geometries_(std::move(geometries)),
      axes_(std::move(axes)),
      attributes_(std::move(attributes)),
      transformations_(std::move(transformations)) {
    const auto expected = static_cast<Eigen::Index>(axes_.size());
    const auto reject = [&](size_t index, Eigen::Index found) {
        throw InvalidArgumentError(kComponent, "PolygonSet geometry " + std::to_string(index) + " has " +
                                   std::to_string(found) + " coordinates per vertex for axes " +
                                   math::transform::axesToString(axes_));
    };
    for (size_t i = 0; i < geometries_.size(); ++i) {
        const Geometry& g = geometries_[i];
        if (g.type == GeometryType::POINT) {
            if (g.point.size() != expected) {
                reject(i, g.point.size());
            }
            continue;
        }
        // 外环和所有内环都必须与轴数一致
        for (const auto& part : g.parts) {
            if (part.exterior.cols() != expected) {
                reject(i, part.exterior.cols());
            }
            for (const auto& hole : part.interiors) {
                if (hole.cols() != expected) {
                    reject(i, hole.cols());
                }
            }
        }
    }
    requireColumnLengths(attributes_, geometries_.size(), "PolygonSet");
}

bool PolygonSet::hasPointGeometries() const {
    for (const auto& g : geometries_) {
        if (g.type == GeometryType::POINT) {
            return true;
        }
    }
    return false;
}

PolygonSet PolygonSet::withTransformations(TransformationRegistry transformations) const {
    PolygonSet copy = *this;
    copy.transformations_ = std::move(transformations);
    return copy;
}

// ==================== 变体辅助 ====================

std::string elementKindToString(ElementKind kind) {
    switch (kind) {
        case ElementKind::RASTER:            return "Raster";
        case ElementKind::MULTISCALE_RASTER: return "MultiscaleRaster";
        case ElementKind::POINT_TABLE:       return "PointTable";
        case ElementKind::POLYGON_SET:       return "PolygonSet";
    }
    return "Unknown";
}

ElementKind elementKind(const SpatialElement& element) {
    return static_cast<ElementKind>(element.index());
}

const TransformationRegistry& transformationsOf(const SpatialElement& element) {
    return std::visit([](const auto& e) -> const TransformationRegistry& {
        return e.transformations();
    }, element);
}

SpatialElement withTransformations(const SpatialElement& element, TransformationRegistry transformations) {
    return std::visit([&transformations](const auto& e) -> SpatialElement {
        return e.withTransformations(std::move(transformations));
    }, element);
}

const AxisList& axesOf(const SpatialElement& element) {
    return std::visit([](const auto& e) -> const AxisList& {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, Raster> || std::is_same_v<T, MultiscaleRaster>) {
            return e.dims();
        } else {
            return e.axes();
        }
    }, element);
}

} // namespace elements
} // namespace spalign
