/**
 * @file lazy_array.cpp
 * @brief 惰性数组与重采样内核实现
 */

#include "spalign/elements/lazy_array.hpp"
#include "spalign/common/exceptions.hpp"
#include <algorithm>
#include <cmath>

namespace spalign {
namespace elements {

namespace {

const char* kComponent = "ArrayCompute";

// 坐标落在网格端点附近时的容差
constexpr double kEdgeTolerance = 1e-9;

// 按行主序把扁平索引展开成多维索引
void unravel(size_t flat, const Shape& shape, std::vector<size_t>& index) {
    for (size_t d = shape.size(); d > 0; --d) {
        index[d - 1] = flat % shape[d - 1];
        flat /= shape[d - 1];
    }
}

double sampleNearest(const NDArray& input, const std::vector<size_t>& strides,
                     const Eigen::VectorXd& coord, double fill_value) {
    const Shape& shape = input.shape();
    size_t flat = 0;
    for (size_t d = 0; d < shape.size(); ++d) {
        const double k = std::floor(coord[d] + 0.5);
        if (k < 0.0 || k >= static_cast<double>(shape[d])) {
            return fill_value;
        }
        flat += static_cast<size_t>(k) * strides[d];
    }
    return input.data()[flat];
}

double sampleLinear(const NDArray& input, const std::vector<size_t>& strides,
                    const Eigen::VectorXd& coord, double fill_value) {
    const Shape& shape = input.shape();
    const size_t ndim = shape.size();
    std::vector<size_t> base(ndim);
    std::vector<double> frac(ndim);

    for (size_t d = 0; d < ndim; ++d) {
        const double upper = static_cast<double>(shape[d]) - 1.0;
        double x = coord[d];
        if (x < -kEdgeTolerance || x > upper + kEdgeTolerance) {
            return fill_value;
        }
        x = std::min(std::max(x, 0.0), upper);
        double i0 = std::floor(x);
        if (i0 >= upper) {
            i0 = std::max(upper - 1.0, 0.0);
        }
        base[d] = static_cast<size_t>(i0);
        frac[d] = x - i0;
    }

    // 遍历 2^ndim 个相邻格点
    double value = 0.0;
    const size_t corners = size_t(1) << ndim;
    for (size_t mask = 0; mask < corners; ++mask) {
        double weight = 1.0;
        size_t flat = 0;
        bool skip = false;
        for (size_t d = 0; d < ndim; ++d) {
            const bool high = (mask >> d) & 1u;
            size_t idx = base[d] + (high ? 1 : 0);
            if (idx >= shape[d]) {
                // 长度为 1 的维度只有一个格点
                if (frac[d] != 0.0) {
                    return fill_value;
                }
                skip = true;
                break;
            }
            weight *= high ? frac[d] : (1.0 - frac[d]);
            flat += idx * strides[d];
        }
        if (!skip && weight != 0.0) {
            value += weight * input.data()[flat];
        }
    }
    return value;
}

} // namespace

// ==================== DeferredResampledArray ====================

DeferredResampledArray::DeferredResampledArray(LazyArrayPtr source, ResamplePlan plan)
    : source_(std::move(source)), plan_(std::move(plan)) {
    if (!source_) {
        throw InvalidArgumentError(kComponent, "deferred resample needs a source array");
    }
    validatePlan(source_->shape(), plan_);
}

bool DeferredResampledArray::isMaterialized() const {
    return computed_;
}

const NDArray& DeferredResampledArray::realize() const {
    std::call_once(once_, [this]() {
        result_ = resampleAffine(source_->realize(), plan_);
        computed_ = true;
    });
    return result_;
}

// ==================== 计算协作者 ====================

LazyArrayPtr EagerArrayCompute::affineResample(const LazyArrayPtr& input, const ResamplePlan& plan) const {
    if (!input) {
        throw InvalidArgumentError(kComponent, "affineResample called with a null array");
    }
    return makeArray(resampleAffine(input->realize(), plan));
}

LazyArrayPtr DeferredArrayCompute::affineResample(const LazyArrayPtr& input, const ResamplePlan& plan) const {
    return std::make_shared<DeferredResampledArray>(input, plan);
}

std::shared_ptr<IArrayCompute> makeArrayCompute(bool lazy) {
    if (lazy) {
        return std::make_shared<DeferredArrayCompute>();
    }
    return std::make_shared<EagerArrayCompute>();
}

// ==================== 内核 ====================

void validatePlan(const Shape& input_shape, const ResamplePlan& plan) {
    const Eigen::Index n = static_cast<Eigen::Index>(input_shape.size());
    if (plan.matrix.rows() != n + 1 || plan.matrix.cols() != n + 1) {
        throw InvalidArgumentError(kComponent, "resample matrix is " + std::to_string(plan.matrix.rows()) + "x" +
                                   std::to_string(plan.matrix.cols()) + " for a " + std::to_string(n) +
                                   "-dimensional array");
    }
    if (plan.output_shape.size() != input_shape.size()) {
        throw InvalidArgumentError(kComponent, "output shape " + shapeToString(plan.output_shape) +
                                   " does not match input shape " + shapeToString(input_shape));
    }
    if (plan.order != 0 && plan.order != 1) {
        throw InvalidArgumentError(kComponent, "interpolation order " + std::to_string(plan.order) +
                                   " is not supported, use 0 or 1");
    }
}

NDArray resampleAffine(const NDArray& input, const ResamplePlan& plan) {
    validatePlan(input.shape(), plan);

    NDArray output(plan.output_shape, input.dtype(), plan.fill_value);
    if (output.size() == 0 || input.size() == 0) {
        return output;
    }

    const size_t ndim = input.ndim();
    const std::vector<size_t> strides = input.strides();
    std::vector<size_t> index(ndim);
    Eigen::VectorXd out_h = Eigen::VectorXd::Ones(ndim + 1);

    for (size_t flat = 0; flat < output.size(); ++flat) {
        unravel(flat, plan.output_shape, index);
        for (size_t d = 0; d < ndim; ++d) {
            out_h[d] = static_cast<double>(index[d]);
        }
        const Eigen::VectorXd in_h = plan.matrix * out_h;

        const double value = (plan.order == 0)
            ? sampleNearest(input, strides, in_h, plan.fill_value)
            : sampleLinear(input, strides, in_h, plan.fill_value);
        output.setFlat(flat, value);
    }

    return output;
}

} // namespace elements
} // namespace spalign
