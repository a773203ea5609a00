#pragma once

/**
 * @file affine_transform.hpp
 * @brief 命名轴上的仿射变换
 *
 * AffineTransform 是一个不可变的值类型，描述两个命名轴集合之间的仿射映射。
 * 支持的结构类型：Identity、Translation、Scale、Affine、Sequence。
 *
 * 矩阵始终在调用时按照请求的输入/输出轴顺序生成，
 * 因此同一个变换可以作用在 (c, y, x) 的栅格上，也可以作用在 (x, y) 的点表上。
 *
 * 使用示例：
 * @code
 * #include <math/transform/affine_transform.hpp>
 * using namespace spalign::math::transform;
 *
 * auto scale = AffineTransform::Scale(Eigen::Vector2d(2.0, 2.0), {"x", "y"});
 * auto shift = AffineTransform::Translation(Eigen::Vector2d(5.0, 0.0), {"x", "y"});
 *
 * // 先缩放，再平移
 * auto combined = scale.compose(shift);
 * MatrixXd m = combined.toAffineMatrix({"y", "x"}, {"y", "x"});
 * @endcode
 */

#include "types.hpp"
#include <string>
#include <vector>

namespace spalign {
namespace math {
namespace transform {

class AffineTransform {
public:
    // ==================== 构造函数 ====================

    /**
     * @brief 默认构造函数，创建单位变换
     */
    AffineTransform();

    // ==================== 静态工厂方法 ====================

    static AffineTransform Identity();

    /**
     * @brief 沿指定轴平移
     * @param translation 平移向量，长度必须等于轴数
     * @param axes 平移作用的轴
     */
    static AffineTransform Translation(const VectorXd& translation, const AxisList& axes);

    /**
     * @brief 沿指定轴缩放
     * @param factors 缩放因子，长度必须等于轴数
     * @param axes 缩放作用的轴
     */
    static AffineTransform Scale(const VectorXd& factors, const AxisList& axes);

    /**
     * @brief 任意仿射矩阵
     * @param matrix 齐次矩阵，尺寸为 (|output|+1) x (|input|+1)，最后一行必须为 [0 ... 0 1]
     * @param input_axes 输入轴
     * @param output_axes 输出轴
     */
    static AffineTransform Affine(const MatrixXd& matrix,
                                  const AxisList& input_axes,
                                  const AxisList& output_axes);

    /**
     * @brief 平面旋转（逆时针，弧度）
     *
     * 在 axes[0]-axes[1] 平面内旋转，输入输出轴相同。
     */
    static AffineTransform Rotation(double angle, const AxisList& axes = {"x", "y"});

    /**
     * @brief 变换序列，按列表顺序依次应用
     *
     * 保留字面上的嵌套结构，仅在生成矩阵时展开。
     */
    static AffineTransform Sequence(std::vector<AffineTransform> transformations);

    // ==================== 结构访问 ====================

    TransformKind kind() const { return kind_; }

    /// Translation/Scale 作用的轴
    const AxisList& axes() const { return axes_; }

    /// Translation 的平移量或 Scale 的缩放因子
    const VectorXd& values() const { return values_; }

    /// Affine 的原始矩阵
    const MatrixXd& matrix() const { return matrix_; }

    const AxisList& inputAxes() const { return input_axes_; }
    const AxisList& outputAxes() const { return output_axes_; }

    /// Sequence 的元素（按应用顺序）
    const std::vector<AffineTransform>& transformations() const { return transformations_; }

    // ==================== 代数运算 ====================

    /**
     * @brief 求逆
     * @throws NonInvertibleTransformError 线性部分奇异时
     */
    AffineTransform inverse() const;

    /**
     * @brief 组合：先应用 *this，再应用 next
     */
    AffineTransform compose(const AffineTransform& next) const;

    /**
     * @brief 推导输出轴
     *
     * 给定当前的输入轴，返回应用本变换后的轴集合。Sequence 借此推导中间轴。
     * @throws AxisMismatchError 变换需要的轴不在 input_axes 中
     */
    AxisList outputAxesFor(const AxisList& input_axes) const;

    /**
     * @brief 生成齐次仿射矩阵
     *
     * 按请求的轴顺序重新排列，尺寸为 (|output_axes|+1) x (|input_axes|+1)。
     * @throws AxisMismatchError 请求的轴不存在
     */
    MatrixXd toAffineMatrix(const AxisList& input_axes, const AxisList& output_axes) const;

    // ==================== 比较 ====================

    /**
     * @brief 精确的结构相等
     *
     * 类型、轴和数值完全一致才相等；Sequence 逐项比较。
     */
    bool operator==(const AffineTransform& other) const;
    bool operator!=(const AffineTransform& other) const { return !(*this == other); }

    /**
     * @brief 基于矩阵的近似相等
     */
    bool isApprox(const AffineTransform& other, const AxisList& axes,
                  double tolerance = constants::EPSILON) const;

    /**
     * @brief 在给定轴上是否近似为单位变换
     */
    bool isIdentity(const AxisList& axes, double tolerance = constants::EPSILON) const;

    std::string toString() const;

private:
    TransformKind kind_;
    AxisList axes_;
    VectorXd values_;
    MatrixXd matrix_;
    AxisList input_axes_;
    AxisList output_axes_;
    std::vector<AffineTransform> transformations_;

    explicit AffineTransform(TransformKind kind);
};

// ==================== 便利函数 ====================

/**
 * @brief 组合两个变换：先 a 后 b
 */
inline AffineTransform compose(const AffineTransform& a, const AffineTransform& b) {
    return a.compose(b);
}

/**
 * @brief 把齐次矩阵作用在一组齐次坐标上
 * @param matrix (m+1) x (n+1) 齐次矩阵
 * @param homogeneous_coords N x (n+1) 坐标，每行一个点，最后一列为 1
 * @return N x (m+1) 变换后的齐次坐标
 */
MatrixXd applyToPoints(const MatrixXd& matrix, const MatrixXd& homogeneous_coords);

/**
 * @brief 判断轴列表中是否包含某个轴
 */
bool containsAxis(const AxisList& axes, const AxisName& axis);

/**
 * @brief 轴在列表中的位置
 * @throws AxisMismatchError 不存在时
 */
size_t axisIndex(const AxisList& axes, const AxisName& axis);

std::string axesToString(const AxisList& axes);

} // namespace transform
} // namespace math
} // namespace spalign
