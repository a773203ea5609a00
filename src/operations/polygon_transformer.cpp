/**
 * @file polygon_transformer.cpp
 * @brief 几何变换实现
 */

#include "spalign/operations/polygon_transformer.hpp"
#include "spalign/utility/simple_logger.hpp"
#include "math/tensor/tensor.hpp"
#include <Eigen/Eigenvalues>
#include <cmath>

namespace spalign {
namespace operations {

namespace {

const char* kComponent = "PolygonTransformer";

Eigen::MatrixXd transformRing(const Eigen::MatrixXd& matrix, const Eigen::MatrixXd& ring) {
    using namespace math::tensor::utils;
    return fromHomogeneous(math::transform::applyToPoints(matrix, toHomogeneous(ring)));
}

} // namespace

RadiusScale PolygonTransformer::radiusScaleFactor(const Eigen::MatrixXd& linear, double rtol, double atol) {
    Eigen::EigenSolver<Eigen::MatrixXd> solver(linear, false);
    const Eigen::VectorXd modules = solver.eigenvalues().cwiseAbs();

    RadiusScale scale;
    const double reference = modules[0];
    for (Eigen::Index i = 1; i < modules.size(); ++i) {
        if (std::abs(modules[i] - reference) > atol + rtol * std::abs(reference)) {
            scale.isotropic = false;
            break;
        }
    }
    scale.factor = scale.isotropic ? reference : modules.mean();
    return scale;
}

elements::PolygonSet PolygonTransformer::transform(const elements::PolygonSet& shapes,
                                                   const math::transform::AffineTransform& transformation) const {
    const auto& axes = shapes.axes();
    const Eigen::MatrixXd matrix = transformation.toAffineMatrix(axes, axes);

    std::vector<elements::Geometry> geometries;
    geometries.reserve(shapes.size());
    for (const auto& geometry : shapes.geometries()) {
        elements::Geometry g = geometry;
        if (g.type == elements::GeometryType::POINT) {
            g.point = transformRing(matrix, geometry.point);
        } else {
            for (auto& part : g.parts) {
                part.exterior = transformRing(matrix, part.exterior);
                for (auto& hole : part.interiors) {
                    hole = transformRing(matrix, hole);
                }
            }
        }
        geometries.push_back(std::move(g));
    }

    elements::AttributeTable attributes = shapes.attributes();
    auto radius = attributes.find(elements::PolygonSet::RADIUS);
    if (radius != attributes.end() && shapes.hasPointGeometries()) {
        const RadiusScale scale = radiusScaleFactor(math::tensor::utils::extractLinear(matrix),
                                                    options_.isotropy_rtol, options_.isotropy_atol);
        if (!scale.isotropic) {
            LOG_COMPONENT_NAMED_WARN(kComponent,
                "The transformation matrix is not isotropic, the radius will be scaled by the mean "
                "eigenvalue modulus {}", scale.factor);
        }
        for (size_t i = 0; i < geometries.size(); ++i) {
            if (geometries[i].type == elements::GeometryType::POINT) {
                radius->second[i] *= scale.factor;
            }
        }
    }

    LOG_COMPONENT_NAMED_DEBUG(kComponent, "{} geometries on {} with {}",
                              shapes.size(), math::transform::axesToString(axes), transformation.toString());

    return elements::PolygonSet(std::move(geometries),
                                axes,
                                std::move(attributes),
                                coordination::TransformationRegistry::withDefault(options_.default_coordinate_system));
}

} // namespace operations
} // namespace spalign
