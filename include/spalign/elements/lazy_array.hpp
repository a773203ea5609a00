/**
 * @file lazy_array.hpp
 * @brief 惰性数组与仿射重采样
 *
 * 变换引擎只构造重采样计划（矩阵 + 输出形状），
 * 具体何时计算由 IArrayCompute 的实现决定：
 * - EagerArrayCompute：立即计算，返回 MaterializedArray
 * - DeferredArrayCompute：返回 DeferredResampledArray，首次 realize() 时计算并缓存
 *
 * 使用示例：
 * @code
 * auto input = makeArray(NDArray({4, 6}, DataType::UINT8, 1.0));
 * ResamplePlan plan{matrix, {6, 4}, 0, false, 0.0};
 * auto output = DeferredArrayCompute().affineResample(input, plan);
 * const NDArray& values = output->realize();
 * @endcode
 */
#pragma once

#include "ndarray.hpp"
#include <Eigen/Dense>
#include <atomic>
#include <memory>
#include <mutex>

namespace spalign {
namespace elements {

/**
 * @brief 仿射重采样计划
 *
 * matrix 为 (ndim+1) x (ndim+1) 齐次矩阵，按数组维度顺序把输出索引映射到输入坐标。
 */
struct ResamplePlan {
    Eigen::MatrixXd matrix;
    Shape output_shape;
    int order = 0;              ///< 0 最近邻，1 多线性
    bool prefilter = false;     ///< order <= 1 时无效果
    double fill_value = 0.0;    ///< 输入网格之外的值
};

/**
 * @brief 惰性数组能力接口
 */
class ILazyArray {
public:
    virtual ~ILazyArray() = default;

    virtual const Shape& shape() const = 0;
    virtual DataType dtype() const = 0;

    /// 数值是否已经可用
    virtual bool isMaterialized() const = 0;

    /**
     * @brief 获取数值，必要时触发计算
     */
    virtual const NDArray& realize() const = 0;

    size_t ndim() const { return shape().size(); }
};

using LazyArrayPtr = std::shared_ptr<const ILazyArray>;

/**
 * @brief 已计算好的数组
 */
class MaterializedArray : public ILazyArray {
public:
    explicit MaterializedArray(NDArray data) : data_(std::move(data)) {}

    const Shape& shape() const override { return data_.shape(); }
    DataType dtype() const override { return data_.dtype(); }
    bool isMaterialized() const override { return true; }
    const NDArray& realize() const override { return data_; }

private:
    NDArray data_;
};

/**
 * @brief 延迟重采样的数组，线程安全地只计算一次
 */
class DeferredResampledArray : public ILazyArray {
public:
    DeferredResampledArray(LazyArrayPtr source, ResamplePlan plan);

    const Shape& shape() const override { return plan_.output_shape; }
    DataType dtype() const override { return source_->dtype(); }
    bool isMaterialized() const override;
    const NDArray& realize() const override;

    const ResamplePlan& plan() const { return plan_; }

private:
    LazyArrayPtr source_;
    ResamplePlan plan_;
    mutable std::once_flag once_;
    mutable NDArray result_;
    mutable std::atomic<bool> computed_{false};
};

/**
 * @brief 数组计算协作者接口
 */
class IArrayCompute {
public:
    virtual ~IArrayCompute() = default;

    /**
     * @brief 仿射重采样
     * @throws InvalidArgumentError 计划与输入维度不符
     */
    virtual LazyArrayPtr affineResample(const LazyArrayPtr& input, const ResamplePlan& plan) const = 0;
};

class EagerArrayCompute : public IArrayCompute {
public:
    LazyArrayPtr affineResample(const LazyArrayPtr& input, const ResamplePlan& plan) const override;
};

class DeferredArrayCompute : public IArrayCompute {
public:
    LazyArrayPtr affineResample(const LazyArrayPtr& input, const ResamplePlan& plan) const override;
};

/**
 * @brief 重采样内核
 *
 * 对每个输出索引 o 计算输入坐标 p = M [o, 1]：
 * - order 0：取 floor(p + 0.5)，越界写入 fill_value
 * - order 1：多线性插值，坐标落在 [0, n-1] 之外写入 fill_value
 * 结果按输入 dtype 取整截断。
 */
NDArray resampleAffine(const NDArray& input, const ResamplePlan& plan);

/**
 * @brief 检查计划与输入是否匹配
 * @throws InvalidArgumentError
 */
void validatePlan(const Shape& input_shape, const ResamplePlan& plan);

inline LazyArrayPtr makeArray(NDArray data) {
    return std::make_shared<MaterializedArray>(std::move(data));
}

/**
 * @brief 按配置选择计算协作者
 */
std::shared_ptr<IArrayCompute> makeArrayCompute(bool lazy);

} // namespace elements
} // namespace spalign
