/**
 * @file schema.cpp
 * @brief 默认模式校验实现
 */

#include "spalign/elements/schema.hpp"
#include "spalign/common/exceptions.hpp"
#include <cmath>
#include <type_traits>

namespace spalign {
namespace elements {

namespace {

const char* kComponent = "SchemaValidator";

void fail(const std::string& message) {
    throw SchemaValidationError(kComponent, message);
}

void requireVectorAxes(const AxisList& axes, const std::string& what) {
    const bool is_2d = axes == AxisList{"x", "y"};
    const bool is_3d = axes == AxisList{"x", "y", "z"};
    if (!is_2d && !is_3d) {
        fail(what + " axes must be (x, y) or (x, y, z), got " + math::transform::axesToString(axes));
    }
}

void requireRing(const Eigen::MatrixXd& ring, Eigen::Index dim, const std::string& what) {
    if (ring.rows() < 3) {
        fail(what + " ring has " + std::to_string(ring.rows()) + " vertices, at least 3 are required");
    }
    if (ring.cols() != dim) {
        fail(what + " ring is " + std::to_string(ring.cols()) + "-dimensional, expected " + std::to_string(dim));
    }
    if (!ring.allFinite()) {
        fail(what + " ring has non-finite coordinates");
    }
}

} // namespace

void DefaultSchemaValidator::validate(const SpatialElement& element) const {
    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, Raster>) {
            validateRaster(e, "Raster");
        } else if constexpr (std::is_same_v<T, MultiscaleRaster>) {
            validateMultiscale(e);
        } else if constexpr (std::is_same_v<T, PointTable>) {
            validatePoints(e);
        } else {
            validateShapes(e);
        }
    }, element);
}

ElementModel DefaultSchemaValidator::getModel(const SpatialElement& element) const {
    return std::visit([](const auto& e) -> ElementModel {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, Raster> || std::is_same_v<T, MultiscaleRaster>) {
            return e.model();
        } else if constexpr (std::is_same_v<T, PointTable>) {
            return ElementModel::POINTS;
        } else {
            return ElementModel::SHAPES;
        }
    }, element);
}

AxisList DefaultSchemaValidator::getAxesNames(const SpatialElement& element) const {
    return axesOf(element);
}

void DefaultSchemaValidator::validateRaster(const Raster& raster, const std::string& what) const {
    const AxisList expected = expectedDims(raster.model());
    if (raster.dims() != expected) {
        fail(what + " with model " + elementModelToString(raster.model()) + " must have dims " +
             math::transform::axesToString(expected) + ", got " + math::transform::axesToString(raster.dims()));
    }
    for (size_t d = 0; d < raster.shape().size(); ++d) {
        if (raster.shape()[d] == 0) {
            fail(what + " has an empty dimension '" + raster.dims()[d] + "'");
        }
    }
    if (!raster.channelNames().empty() &&
        !math::transform::containsAxis(raster.dims(), coordination::axes::C)) {
        fail(what + " has channel names but no channel dimension");
    }
    if (!raster.channelNames().empty() &&
        raster.channelNames().size() != raster.extent(coordination::axes::C)) {
        fail(what + " has " + std::to_string(raster.channelNames().size()) + " channel names for " +
             std::to_string(raster.extent(coordination::axes::C)) + " channels");
    }
    if (isLabelsModel(raster.model()) && !isIntegerType(raster.data()->dtype())) {
        fail(what + " labels must have an integer data type, got " + dataTypeToString(raster.data()->dtype()));
    }
    validateRegistry(raster.transformations(), raster.dims(), what);
}

void DefaultSchemaValidator::validateMultiscale(const MultiscaleRaster& raster) const {
    for (size_t i = 0; i < raster.numLevels(); ++i) {
        validateRaster(raster.level(i), "MultiscaleRaster level " + MultiscaleRaster::levelName(i));
        if (i == 0) {
            continue;
        }
        for (const auto& dim : raster.level(i).spatialDims()) {
            if (raster.level(i).extent(dim) > raster.level(i - 1).extent(dim)) {
                fail("MultiscaleRaster level " + MultiscaleRaster::levelName(i) + " is larger than level " +
                     MultiscaleRaster::levelName(i - 1) + " along '" + dim + "'");
            }
        }
    }
    validateRegistry(raster.transformations(), raster.dims(), "MultiscaleRaster");
}

void DefaultSchemaValidator::validatePoints(const PointTable& points) const {
    requireVectorAxes(points.axes(), "PointTable");
    if (!points.coordinates().allFinite()) {
        fail("PointTable has non-finite coordinates");
    }
    validateRegistry(points.transformations(), points.axes(), "PointTable");
}

void DefaultSchemaValidator::validateShapes(const PolygonSet& shapes) const {
    requireVectorAxes(shapes.axes(), "PolygonSet");
    const Eigen::Index dim = static_cast<Eigen::Index>(shapes.axes().size());

    for (size_t i = 0; i < shapes.size(); ++i) {
        const Geometry& g = shapes.geometries()[i];
        const std::string what = "PolygonSet geometry " + std::to_string(i);
        switch (g.type) {
            case GeometryType::POINT:
                if (g.point.size() != dim || !g.point.allFinite()) {
                    fail(what + " is not a finite " + std::to_string(dim) + "-dimensional point");
                }
                break;
            case GeometryType::POLYGON:
            case GeometryType::MULTI_POLYGON:
                if (g.parts.empty() || (g.type == GeometryType::POLYGON && g.parts.size() != 1)) {
                    fail(what + " has " + std::to_string(g.parts.size()) + " parts for type " +
                         geometryTypeToString(g.type));
                }
                for (const auto& part : g.parts) {
                    requireRing(part.exterior, dim, what);
                    for (const auto& hole : part.interiors) {
                        requireRing(hole, dim, what);
                    }
                }
                break;
        }
    }

    auto radius = shapes.attributes().find(PolygonSet::RADIUS);
    if (radius != shapes.attributes().end()) {
        for (double r : radius->second) {
            if (!std::isfinite(r) || r < 0.0) {
                fail("PolygonSet radius values must be finite and non-negative");
            }
        }
    }
    validateRegistry(shapes.transformations(), shapes.axes(), "PolygonSet");
}

void DefaultSchemaValidator::validateRegistry(const TransformationRegistry& registry, const AxisList& axes,
                                              const std::string& what) const {
    if (registry.empty()) {
        fail(what + " has an empty transformation registry");
    }
    for (const auto& [cs, t] : registry) {
        try {
            t.outputAxesFor(axes);
        } catch (const AxisMismatchError& e) {
            fail(what + " transformation to '" + cs + "' does not apply to axes " +
                 math::transform::axesToString(axes) + ": " + e.what());
        }
    }
}

std::shared_ptr<const ISchemaValidator> defaultSchemaValidator() {
    static const auto validator = std::make_shared<const DefaultSchemaValidator>();
    return validator;
}

} // namespace elements
} // namespace spalign
