/**
 * @file raster_transformer.cpp
 * @brief 栅格变换实现
 */

#include "spalign/operations/raster_transformer.hpp"
#include "spalign/common/exceptions.hpp"
#include "spalign/utility/simple_logger.hpp"
#include <cmath>

namespace spalign {
namespace operations {

namespace {
const char* kComponent = "RasterTransformer";

bool samePermutation(const AxisList& candidate, const AxisList& spatial) {
    if (candidate.size() != spatial.size()) {
        return false;
    }
    for (const auto& axis : candidate) {
        if (!math::transform::containsAxis(spatial, axis)) {
            return false;
        }
    }
    return true;
}

/// 栅格平移沿用调用方变换的轴顺序，无法确定时退回栅格自身的空间轴顺序
AxisList translationAxes(const AffineTransform& transformation, const AxisList& spatial) {
    switch (transformation.kind()) {
        case math::transform::TransformKind::TRANSLATION:
        case math::transform::TransformKind::SCALE:
            if (samePermutation(transformation.axes(), spatial)) {
                return transformation.axes();
            }
            break;
        case math::transform::TransformKind::AFFINE:
            if (samePermutation(transformation.inputAxes(), spatial)) {
                return transformation.inputAxes();
            }
            break;
        default:
            break;
    }
    return spatial;
}

AffineTransform reorderedTranslation(const Eigen::VectorXd& values, const AxisList& spatial,
                                     const AxisList& axes) {
    Eigen::VectorXd reordered(values.size());
    for (size_t k = 0; k < axes.size(); ++k) {
        reordered[static_cast<Eigen::Index>(k)] =
            values[static_cast<Eigen::Index>(math::transform::axisIndex(spatial, axes[k]))];
    }
    return AffineTransform::Translation(reordered, axes);
}

} // namespace

RasterTransformer::RasterTransformer(utility::TransformOptions options,
                                     std::shared_ptr<const elements::IArrayCompute> compute)
    : options_(std::move(options)), compute_(std::move(compute)) {
    if (!compute_) {
        compute_ = elements::makeArrayCompute(options_.lazy_resampling);
    }
}

RasterOutputGeometry RasterTransformer::computeOutputGeometry(const Shape& spatial_shape,
                                                              const Eigen::MatrixXd& matrix,
                                                              double snap_tolerance) {
    const size_t d = spatial_shape.size();
    if (static_cast<size_t>(matrix.rows()) != d + 1 || static_cast<size_t>(matrix.cols()) != d + 1) {
        throw InvalidArgumentError(kComponent, "corner matrix does not match " + std::to_string(d) +
                                   " spatial dimensions");
    }

    // 2^d 个角点，每行一个齐次坐标
    const size_t n_corners = size_t(1) << d;
    Eigen::MatrixXd corners = Eigen::MatrixXd::Ones(n_corners, d + 1);
    for (size_t mask = 0; mask < n_corners; ++mask) {
        for (size_t k = 0; k < d; ++k) {
            corners(mask, k) = ((mask >> k) & 1u) ? static_cast<double>(spatial_shape[k]) : 0.0;
        }
    }
    const Eigen::MatrixXd mapped = math::transform::applyToPoints(matrix, corners);

    RasterOutputGeometry geometry;
    geometry.spatial_shape.resize(d);
    geometry.translation_vector.resize(d);
    for (size_t k = 0; k < d; ++k) {
        const double lo = mapped.col(k).minCoeff();
        const double hi = mapped.col(k).maxCoeff();
        double extent = hi - lo;
        const double nearest = std::round(extent);
        if (std::abs(extent - nearest) <= snap_tolerance) {
            extent = nearest;
        }
        geometry.spatial_shape[k] = static_cast<size_t>(std::ceil(extent));
        geometry.translation_vector[k] = lo;
    }
    return geometry;
}

RasterTransformResult RasterTransformer::transform(const LazyArrayPtr& data,
                                                   const AxisList& dims,
                                                   const AffineTransform& transformation,
                                                   int order) const {
    if (!data) {
        throw InvalidArgumentError(kComponent, "raster data is null");
    }
    if (data->ndim() != dims.size()) {
        throw InvalidArgumentError(kComponent, "raster has " + std::to_string(data->ndim()) +
                                   " dimensions but dims are " + math::transform::axesToString(dims));
    }

    const AxisList spatial = coordination::axes::spatialAxes(dims);
    Shape spatial_shape;
    for (const auto& axis : spatial) {
        spatial_shape.push_back(data->shape()[math::transform::axisIndex(dims, axis)]);
    }

    const Eigen::MatrixXd matrix = transformation.toAffineMatrix(spatial, spatial);
    const RasterOutputGeometry geometry =
        computeOutputGeometry(spatial_shape, matrix, options_.shape_snap_tolerance);
    const auto translation = AffineTransform::Translation(geometry.translation_vector, spatial);

    // 输出索引 -> 输入坐标
    const Eigen::MatrixXd sampling =
        AffineTransform::Sequence({translation, transformation.inverse()}).toAffineMatrix(dims, dims);

    Shape output_shape = data->shape();
    for (size_t k = 0; k < spatial.size(); ++k) {
        output_shape[math::transform::axisIndex(dims, spatial[k])] = geometry.spatial_shape[k];
    }

    elements::ResamplePlan plan;
    plan.matrix = sampling;
    plan.output_shape = output_shape;
    plan.order = order < 0 ? options_.interpolation_order : order;
    plan.prefilter = options_.prefilter;
    plan.fill_value = options_.fill_value;

    // 像素中心修正
    Eigen::VectorXd offset(spatial.size());
    for (size_t k = 0; k < spatial.size(); ++k) {
        const double new_pixel_size =
            static_cast<double>(geometry.spatial_shape[k]) / static_cast<double>(spatial_shape[k]);
        offset[k] = -new_pixel_size / 2.0 + 0.5;
    }

    RasterTransformResult result{compute_->affineResample(data, plan),
                                 reorderedTranslation(geometry.translation_vector + offset, spatial,
                                                      translationAxes(transformation, spatial))};

    LOG_COMPONENT_NAMED_DEBUG(kComponent, "{} {} -> {} with {}, raster translation {}",
                              math::transform::axesToString(dims),
                              elements::shapeToString(data->shape()),
                              elements::shapeToString(output_shape),
                              transformation.toString(),
                              result.raster_translation.toString());
    return result;
}

TransformedRaster RasterTransformer::transform(const elements::Raster& raster,
                                               const AffineTransform& transformation) const {
    const int order = elements::isLabelsModel(raster.model()) ? 0 : options_.interpolation_order;
    RasterTransformResult result = transform(raster.data(), raster.dims(), transformation, order);
    return TransformedRaster{
        elements::Raster(result.data, raster.dims(), raster.model(),
                         coordination::TransformationRegistry::withDefault(options_.default_coordinate_system),
                         raster.channelNames()),
        result.raster_translation
    };
}

} // namespace operations
} // namespace spalign
