#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace spalign {
namespace math {
namespace transform {

// 基础类型定义
using VectorXd = Eigen::VectorXd;
using MatrixXd = Eigen::MatrixXd;

/// 轴名称，例如 "c", "z", "y", "x"
using AxisName = std::string;

/// 有序轴列表
using AxisList = std::vector<AxisName>;

/**
 * @brief 变换的结构类型
 */
enum class TransformKind {
    IDENTITY,     ///< 单位变换
    TRANSLATION,  ///< 平移
    SCALE,        ///< 缩放
    AFFINE,       ///< 任意仿射矩阵
    SEQUENCE      ///< 变换序列（按顺序依次应用）
};

/**
 * @brief 数学常量
 */
namespace constants {
    constexpr double EPSILON = 1e-9;
    constexpr double PI = 3.14159265358979323846;
    constexpr double HALF_PI = PI / 2.0;
    constexpr double SINGULARITY_TOLERANCE = 1e-12; ///< 行列式判零阈值
}

} // namespace transform
} // namespace math
} // namespace spalign
