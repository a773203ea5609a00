/**
 * @file tensor.hpp
 * @brief 数学张量类型
 *
 * 基于 Eigen 的统一类型别名以及齐次坐标相关的小工具。
 *
 * 使用示例：
 * @code
 * #include <math/tensor/tensor.hpp>
 * using namespace spalign::math::tensor;
 *
 * MatrixXd coords(3, 2);
 * coords << 0, 0, 1, 0, 0, 1;
 * MatrixXd h = utils::toHomogeneous(coords);   // 3 x 3，最后一列为 1
 * @endcode
 */

#pragma once

#include <Eigen/Dense>

namespace spalign {
namespace math {
namespace tensor {

// ==================== 基础类型 ====================

/**
 * @brief 动态大小双精度浮点向量
 */
using VectorXd = Eigen::VectorXd;

/**
 * @brief 动态大小双精度浮点矩阵
 * 点表坐标块按 N x D 存储，每行一个点
 */
using MatrixXd = Eigen::MatrixXd;

/**
 * @brief 动态大小行向量
 * 用于表示单个顶点
 */
using RowVectorXd = Eigen::RowVectorXd;

/**
 * @brief 张量工具函数命名空间
 */
namespace utils {

/**
 * @brief 追加一列 1，得到齐次坐标
 * @param coords N x D 坐标
 * @return N x (D+1) 齐次坐标
 */
inline MatrixXd toHomogeneous(const MatrixXd& coords) {
    MatrixXd h(coords.rows(), coords.cols() + 1);
    h.leftCols(coords.cols()) = coords;
    h.col(coords.cols()).setOnes();
    return h;
}

/**
 * @brief 去掉齐次坐标的最后一列
 * @param homogeneous N x (D+1) 齐次坐标
 * @return N x D 坐标
 */
inline MatrixXd fromHomogeneous(const MatrixXd& homogeneous) {
    return homogeneous.leftCols(homogeneous.cols() - 1);
}

/**
 * @brief 提取齐次矩阵的线性部分
 */
inline MatrixXd extractLinear(const MatrixXd& homogeneous_matrix) {
    return homogeneous_matrix.topLeftCorner(homogeneous_matrix.rows() - 1, homogeneous_matrix.cols() - 1);
}

} // namespace utils

} // namespace tensor
} // namespace math
} // namespace spalign
