/**
 * @file point_transformer.cpp
 * @brief 点表变换实现
 */

#include "spalign/operations/point_transformer.hpp"
#include "spalign/utility/simple_logger.hpp"
#include "math/tensor/tensor.hpp"

namespace spalign {
namespace operations {

elements::PointTable PointTransformer::transform(const elements::PointTable& points,
                                                 const math::transform::AffineTransform& transformation) const {
    const auto& axes = points.axes();
    const Eigen::MatrixXd matrix = transformation.toAffineMatrix(axes, axes);

    const Eigen::MatrixXd homogeneous = math::tensor::utils::toHomogeneous(points.coordinates());
    const Eigen::MatrixXd transformed = math::transform::applyToPoints(matrix, homogeneous);

    LOG_COMPONENT_NAMED_DEBUG("PointTransformer", "{} points on {} with {}",
                              points.numPoints(), math::transform::axesToString(axes), transformation.toString());

    return elements::PointTable(math::tensor::utils::fromHomogeneous(transformed),
                                axes,
                                points.attributes(),
                                coordination::TransformationRegistry::withDefault(options_.default_coordinate_system));
}

} // namespace operations
} // namespace spalign
