/**
 * @file ndarray.hpp
 * @brief 行主序的 N 维稠密数组
 *
 * 元素统一以 double 存储，dtype 标签决定写入时的取整与截断，
 * 因此重采样结果保持与输入相同的数据类型语义。
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace spalign {
namespace elements {

/**
 * @brief 数组元素类型
 */
enum class DataType {
    UINT8,
    UINT16,
    UINT32,
    INT32,
    FLOAT32,
    FLOAT64
};

using Shape = std::vector<size_t>;

std::string dataTypeToString(DataType dtype);

/**
 * @throws InvalidArgumentError 未知名称
 */
DataType dataTypeFromString(const std::string& name);

bool isIntegerType(DataType dtype);

size_t shapeSize(const Shape& shape);

std::string shapeToString(const Shape& shape);

class NDArray {
public:
    NDArray() = default;

    /**
     * @brief 以常量填充构造
     */
    explicit NDArray(Shape shape, DataType dtype = DataType::FLOAT64, double fill_value = 0.0);

    /**
     * @brief 以现有数据构造
     * @throws InvalidArgumentError 数据长度与形状不符
     */
    NDArray(Shape shape, std::vector<double> data, DataType dtype);

    const Shape& shape() const { return shape_; }
    size_t ndim() const { return shape_.size(); }
    size_t size() const { return data_.size(); }
    DataType dtype() const { return dtype_; }

    const std::vector<double>& data() const { return data_; }

    /**
     * @brief 行主序步长（以元素计）
     */
    std::vector<size_t> strides() const;

    /**
     * @throws InvalidArgumentError 维度不符或越界
     */
    size_t flatIndex(const std::vector<size_t>& index) const;

    double at(const std::vector<size_t>& index) const;

    /**
     * @brief 写入一个元素，按 dtype 取整与截断
     */
    void set(const std::vector<size_t>& index, double value);

    /// 按扁平索引写入，不做边界检查
    void setFlat(size_t flat_index, double value) { data_[flat_index] = castValue(value, dtype_); }

    NDArray astype(DataType dtype) const;

    bool operator==(const NDArray& other) const;
    bool operator!=(const NDArray& other) const { return !(*this == other); }

    /**
     * @brief 把 double 值转换到 dtype 的取值范围
     *
     * 整数类型四舍五入（远离零）并截断到可表示范围；FLOAT32 舍入到单精度。
     */
    static double castValue(double value, DataType dtype);

private:
    Shape shape_;
    std::vector<double> data_;
    DataType dtype_ = DataType::FLOAT64;
};

} // namespace elements
} // namespace spalign
