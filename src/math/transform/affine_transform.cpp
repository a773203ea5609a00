/**
 * @file affine_transform.cpp
 * @brief 命名轴仿射变换的实现
 */

#include "math/transform/affine_transform.hpp"
#include "spalign/common/exceptions.hpp"
#include <Eigen/LU>
#include <cmath>
#include <sstream>
#include <unordered_set>

namespace spalign {
namespace math {
namespace transform {

namespace {

const char* kComponent = "AffineTransform";

void validateUniqueAxes(const AxisList& axes, const std::string& what) {
    std::unordered_set<AxisName> seen;
    for (const auto& axis : axes) {
        if (axis.empty()) {
            throw InvalidArgumentError(kComponent, what + " contains an empty axis name");
        }
        if (!seen.insert(axis).second) {
            throw InvalidArgumentError(kComponent, what + " contains duplicate axis '" + axis + "'");
        }
    }
}

void requireAxesPresent(const AxisList& required, const AxisList& available, const std::string& what) {
    for (const auto& axis : required) {
        if (!containsAxis(available, axis)) {
            throw AxisMismatchError(kComponent, what + " axis '" + axis + "' is not present in " +
                                    axesToString(available));
        }
    }
}

// 选择矩阵：把 from 轴上的齐次坐标按名称重排到 to 轴
MatrixXd selectionMatrix(const AxisList& from, const AxisList& to) {
    MatrixXd s = MatrixXd::Zero(to.size() + 1, from.size() + 1);
    for (size_t r = 0; r < to.size(); ++r) {
        s(r, axisIndex(from, to[r])) = 1.0;
    }
    s(to.size(), from.size()) = 1.0;
    return s;
}

std::string formatVector(const VectorXd& v) {
    std::ostringstream ss;
    ss << "[";
    for (Eigen::Index i = 0; i < v.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << v[i];
    }
    ss << "]";
    return ss.str();
}

} // namespace

// ==================== 辅助函数 ====================

bool containsAxis(const AxisList& axes, const AxisName& axis) {
    for (const auto& a : axes) {
        if (a == axis) {
            return true;
        }
    }
    return false;
}

size_t axisIndex(const AxisList& axes, const AxisName& axis) {
    for (size_t i = 0; i < axes.size(); ++i) {
        if (axes[i] == axis) {
            return i;
        }
    }
    throw AxisMismatchError(kComponent, "axis '" + axis + "' is not present in " + axesToString(axes));
}

std::string axesToString(const AxisList& axes) {
    std::string result = "(";
    for (size_t i = 0; i < axes.size(); ++i) {
        if (i > 0) result += ", ";
        result += axes[i];
    }
    return result + ")";
}

MatrixXd applyToPoints(const MatrixXd& matrix, const MatrixXd& homogeneous_coords) {
    if (homogeneous_coords.cols() != matrix.cols()) {
        throw InvalidArgumentError(kComponent,
            "homogeneous coordinates have " + std::to_string(homogeneous_coords.cols()) +
            " columns but the matrix expects " + std::to_string(matrix.cols()));
    }
    return homogeneous_coords * matrix.transpose();
}

// ==================== 构造与工厂 ====================

AffineTransform::AffineTransform() : AffineTransform(TransformKind::IDENTITY) {}

AffineTransform::AffineTransform(TransformKind kind) : kind_(kind) {}

AffineTransform AffineTransform::Identity() {
    return AffineTransform(TransformKind::IDENTITY);
}

AffineTransform AffineTransform::Translation(const VectorXd& translation, const AxisList& axes) {
    validateUniqueAxes(axes, "Translation axes");
    if (static_cast<size_t>(translation.size()) != axes.size()) {
        throw InvalidArgumentError(kComponent, "Translation has " + std::to_string(translation.size()) +
                                   " values for " + std::to_string(axes.size()) + " axes");
    }
    AffineTransform t(TransformKind::TRANSLATION);
    t.axes_ = axes;
    t.values_ = translation;
    return t;
}

AffineTransform AffineTransform::Scale(const VectorXd& factors, const AxisList& axes) {
    validateUniqueAxes(axes, "Scale axes");
    if (static_cast<size_t>(factors.size()) != axes.size()) {
        throw InvalidArgumentError(kComponent, "Scale has " + std::to_string(factors.size()) +
                                   " factors for " + std::to_string(axes.size()) + " axes");
    }
    AffineTransform t(TransformKind::SCALE);
    t.axes_ = axes;
    t.values_ = factors;
    return t;
}

AffineTransform AffineTransform::Affine(const MatrixXd& matrix,
                                        const AxisList& input_axes,
                                        const AxisList& output_axes) {
    validateUniqueAxes(input_axes, "Affine input axes");
    validateUniqueAxes(output_axes, "Affine output axes");
    if (static_cast<size_t>(matrix.rows()) != output_axes.size() + 1 ||
        static_cast<size_t>(matrix.cols()) != input_axes.size() + 1) {
        throw InvalidArgumentError(kComponent, "Affine matrix is " + std::to_string(matrix.rows()) + "x" +
                                   std::to_string(matrix.cols()) + " but the axes require " +
                                   std::to_string(output_axes.size() + 1) + "x" +
                                   std::to_string(input_axes.size() + 1));
    }
    const Eigen::Index last = matrix.rows() - 1;
    for (Eigen::Index c = 0; c < matrix.cols(); ++c) {
        double expected = (c == matrix.cols() - 1) ? 1.0 : 0.0;
        if (std::abs(matrix(last, c) - expected) > constants::EPSILON) {
            throw InvalidArgumentError(kComponent, "Affine matrix last row must be [0 ... 0 1]");
        }
    }
    AffineTransform t(TransformKind::AFFINE);
    t.matrix_ = matrix;
    t.input_axes_ = input_axes;
    t.output_axes_ = output_axes;
    return t;
}

AffineTransform AffineTransform::Rotation(double angle, const AxisList& axes) {
    if (axes.size() != 2) {
        throw InvalidArgumentError(kComponent, "Rotation requires exactly two axes, got " + axesToString(axes));
    }
    const double c = std::cos(angle);
    const double s = std::sin(angle);
    MatrixXd m(3, 3);
    m << c, -s, 0.0,
         s,  c, 0.0,
         0.0, 0.0, 1.0;
    return Affine(m, axes, axes);
}

AffineTransform AffineTransform::Sequence(std::vector<AffineTransform> transformations) {
    AffineTransform t(TransformKind::SEQUENCE);
    t.transformations_ = std::move(transformations);
    return t;
}

// ==================== 代数运算 ====================

AffineTransform AffineTransform::inverse() const {
    switch (kind_) {
        case TransformKind::IDENTITY:
            return Identity();

        case TransformKind::TRANSLATION:
            return Translation(-values_, axes_);

        case TransformKind::SCALE: {
            for (Eigen::Index i = 0; i < values_.size(); ++i) {
                if (std::abs(values_[i]) < constants::SINGULARITY_TOLERANCE) {
                    throw NonInvertibleTransformError(kComponent,
                        "Scale factor along axis '" + axes_[i] + "' is zero");
                }
            }
            return Scale(values_.cwiseInverse(), axes_);
        }

        case TransformKind::AFFINE: {
            if (matrix_.rows() != matrix_.cols()) {
                throw NonInvertibleTransformError(kComponent,
                    "Affine " + axesToString(input_axes_) + " -> " + axesToString(output_axes_) +
                    " is not square");
            }
            const Eigen::Index n = matrix_.rows() - 1;
            MatrixXd linear = matrix_.topLeftCorner(n, n);
            Eigen::FullPivLU<MatrixXd> lu(linear);
            if (!lu.isInvertible() || std::abs(lu.determinant()) < constants::SINGULARITY_TOLERANCE) {
                throw NonInvertibleTransformError(kComponent, "Affine linear part is singular");
            }
            MatrixXd inv = MatrixXd::Identity(n + 1, n + 1);
            MatrixXd linear_inv = lu.inverse();
            inv.topLeftCorner(n, n) = linear_inv;
            inv.topRightCorner(n, 1) = -linear_inv * matrix_.topRightCorner(n, 1);
            return Affine(inv, output_axes_, input_axes_);
        }

        case TransformKind::SEQUENCE: {
            std::vector<AffineTransform> inverted;
            inverted.reserve(transformations_.size());
            for (auto it = transformations_.rbegin(); it != transformations_.rend(); ++it) {
                inverted.push_back(it->inverse());
            }
            return Sequence(std::move(inverted));
        }
    }
    throw InvariantViolationError(kComponent, "unknown transform kind");
}

AffineTransform AffineTransform::compose(const AffineTransform& next) const {
    return Sequence({*this, next});
}

AxisList AffineTransform::outputAxesFor(const AxisList& input_axes) const {
    switch (kind_) {
        case TransformKind::IDENTITY:
            return input_axes;

        case TransformKind::TRANSLATION:
        case TransformKind::SCALE:
            requireAxesPresent(axes_, input_axes, kind_ == TransformKind::SCALE ? "Scale" : "Translation");
            return input_axes;

        case TransformKind::AFFINE: {
            requireAxesPresent(input_axes_, input_axes, "Affine input");
            AxisList result = output_axes_;
            for (const auto& axis : input_axes) {
                if (!containsAxis(input_axes_, axis) && !containsAxis(output_axes_, axis)) {
                    result.push_back(axis);
                }
            }
            return result;
        }

        case TransformKind::SEQUENCE: {
            AxisList current = input_axes;
            for (const auto& t : transformations_) {
                current = t.outputAxesFor(current);
            }
            return current;
        }
    }
    throw InvariantViolationError(kComponent, "unknown transform kind");
}

MatrixXd AffineTransform::toAffineMatrix(const AxisList& input_axes, const AxisList& output_axes) const {
    const size_t n_in = input_axes.size();
    const size_t n_out = output_axes.size();
    MatrixXd m = MatrixXd::Zero(n_out + 1, n_in + 1);
    m(n_out, n_in) = 1.0;

    switch (kind_) {
        case TransformKind::IDENTITY:
            for (size_t r = 0; r < n_out; ++r) {
                m(r, axisIndex(input_axes, output_axes[r])) = 1.0;
            }
            return m;

        case TransformKind::TRANSLATION:
        case TransformKind::SCALE: {
            const bool is_scale = kind_ == TransformKind::SCALE;
            requireAxesPresent(axes_, input_axes, is_scale ? "Scale" : "Translation");
            for (size_t r = 0; r < n_out; ++r) {
                const size_t c = axisIndex(input_axes, output_axes[r]);
                m(r, c) = 1.0;
                if (containsAxis(axes_, output_axes[r])) {
                    const double v = values_[axisIndex(axes_, output_axes[r])];
                    if (is_scale) {
                        m(r, c) = v;
                    } else {
                        m(r, n_in) = v;
                    }
                }
            }
            return m;
        }

        case TransformKind::AFFINE: {
            requireAxesPresent(input_axes_, input_axes, "Affine input");
            const Eigen::Index map_in = static_cast<Eigen::Index>(input_axes_.size());
            for (size_t r = 0; r < n_out; ++r) {
                const auto& axis = output_axes[r];
                if (containsAxis(output_axes_, axis)) {
                    const size_t k = axisIndex(output_axes_, axis);
                    for (Eigen::Index c = 0; c < map_in; ++c) {
                        m(r, axisIndex(input_axes, input_axes_[c])) = matrix_(k, c);
                    }
                    m(r, n_in) = matrix_(k, map_in);
                } else if (containsAxis(input_axes, axis) && !containsAxis(input_axes_, axis)) {
                    // 未被映射消费的轴直接透传（例如通道轴 c）
                    m(r, axisIndex(input_axes, axis)) = 1.0;
                } else {
                    throw AxisMismatchError(kComponent, "Affine " + axesToString(input_axes_) + " -> " +
                                            axesToString(output_axes_) + " cannot produce output axis '" +
                                            axis + "'");
                }
            }
            return m;
        }

        case TransformKind::SEQUENCE: {
            AxisList current = input_axes;
            MatrixXd acc = MatrixXd::Identity(n_in + 1, n_in + 1);
            for (const auto& t : transformations_) {
                AxisList next = t.outputAxesFor(current);
                acc = t.toAffineMatrix(current, next) * acc;
                current = std::move(next);
            }
            return selectionMatrix(current, output_axes) * acc;
        }
    }
    throw InvariantViolationError(kComponent, "unknown transform kind");
}

// ==================== 比较 ====================

bool AffineTransform::operator==(const AffineTransform& other) const {
    if (kind_ != other.kind_) {
        return false;
    }
    switch (kind_) {
        case TransformKind::IDENTITY:
            return true;
        case TransformKind::TRANSLATION:
        case TransformKind::SCALE:
            return axes_ == other.axes_ && values_.size() == other.values_.size() &&
                   values_ == other.values_;
        case TransformKind::AFFINE:
            return input_axes_ == other.input_axes_ && output_axes_ == other.output_axes_ &&
                   matrix_.rows() == other.matrix_.rows() && matrix_.cols() == other.matrix_.cols() &&
                   matrix_ == other.matrix_;
        case TransformKind::SEQUENCE:
            return transformations_ == other.transformations_;
    }
    return false;
}

bool AffineTransform::isApprox(const AffineTransform& other, const AxisList& axes, double tolerance) const {
    MatrixXd a = toAffineMatrix(axes, axes);
    MatrixXd b = other.toAffineMatrix(axes, axes);
    return (a - b).cwiseAbs().maxCoeff() <= tolerance;
}

bool AffineTransform::isIdentity(const AxisList& axes, double tolerance) const {
    return isApprox(Identity(), axes, tolerance);
}

std::string AffineTransform::toString() const {
    std::ostringstream ss;
    switch (kind_) {
        case TransformKind::IDENTITY:
            ss << "Identity";
            break;
        case TransformKind::TRANSLATION:
            ss << "Translation" << axesToString(axes_) << formatVector(values_);
            break;
        case TransformKind::SCALE:
            ss << "Scale" << axesToString(axes_) << formatVector(values_);
            break;
        case TransformKind::AFFINE: {
            ss << "Affine" << axesToString(input_axes_) << "->" << axesToString(output_axes_) << "[";
            for (Eigen::Index r = 0; r < matrix_.rows(); ++r) {
                if (r > 0) ss << "; ";
                ss << formatVector(matrix_.row(r).transpose());
            }
            ss << "]";
            break;
        }
        case TransformKind::SEQUENCE:
            ss << "Sequence[";
            for (size_t i = 0; i < transformations_.size(); ++i) {
                if (i > 0) ss << ", ";
                ss << transformations_[i].toString();
            }
            ss << "]";
            break;
    }
    return ss.str();
}

} // namespace transform
} // namespace math
} // namespace spalign
