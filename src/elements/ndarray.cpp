/**
 * @file ndarray.cpp
 * @brief N 维数组实现
 */

#include "spalign/elements/ndarray.hpp"
#include "spalign/common/exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace spalign {
namespace elements {

namespace {
const char* kComponent = "NDArray";

template<typename T>
double clampTo(double value) {
    const double lo = static_cast<double>(std::numeric_limits<T>::min());
    const double hi = static_cast<double>(std::numeric_limits<T>::max());
    return std::clamp(std::round(value), lo, hi);
}
} // namespace

std::string dataTypeToString(DataType dtype) {
    switch (dtype) {
        case DataType::UINT8:   return "uint8";
        case DataType::UINT16:  return "uint16";
        case DataType::UINT32:  return "uint32";
        case DataType::INT32:   return "int32";
        case DataType::FLOAT32: return "float32";
        case DataType::FLOAT64: return "float64";
    }
    return "unknown";
}

DataType dataTypeFromString(const std::string& name) {
    if (name == "uint8") return DataType::UINT8;
    if (name == "uint16") return DataType::UINT16;
    if (name == "uint32") return DataType::UINT32;
    if (name == "int32") return DataType::INT32;
    if (name == "float32") return DataType::FLOAT32;
    if (name == "float64") return DataType::FLOAT64;
    throw InvalidArgumentError(kComponent, "unknown data type '" + name + "'");
}

bool isIntegerType(DataType dtype) {
    return dtype != DataType::FLOAT32 && dtype != DataType::FLOAT64;
}

size_t shapeSize(const Shape& shape) {
    size_t n = 1;
    for (size_t extent : shape) {
        n *= extent;
    }
    return n;
}

std::string shapeToString(const Shape& shape) {
    std::string result = "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) result += ", ";
        result += std::to_string(shape[i]);
    }
    return result + ")";
}

double NDArray::castValue(double value, DataType dtype) {
    if (std::isnan(value) && isIntegerType(dtype)) {
        return 0.0;
    }
    switch (dtype) {
        case DataType::UINT8:   return clampTo<uint8_t>(value);
        case DataType::UINT16:  return clampTo<uint16_t>(value);
        case DataType::UINT32:  return clampTo<uint32_t>(value);
        case DataType::INT32:   return clampTo<int32_t>(value);
        case DataType::FLOAT32: return static_cast<double>(static_cast<float>(value));
        case DataType::FLOAT64: return value;
    }
    return value;
}

NDArray::NDArray(Shape shape, DataType dtype, double fill_value)
    : shape_(std::move(shape)), dtype_(dtype) {
    data_.assign(shapeSize(shape_), castValue(fill_value, dtype_));
}

NDArray::NDArray(Shape shape, std::vector<double> data, DataType dtype)
    : shape_(std::move(shape)), data_(std::move(data)), dtype_(dtype) {
    if (data_.size() != shapeSize(shape_)) {
        throw InvalidArgumentError(kComponent, "data has " + std::to_string(data_.size()) +
                                   " elements but shape " + shapeToString(shape_) + " needs " +
                                   std::to_string(shapeSize(shape_)));
    }
    for (auto& v : data_) {
        v = castValue(v, dtype_);
    }
}

std::vector<size_t> NDArray::strides() const {
    std::vector<size_t> result(shape_.size(), 1);
    for (size_t i = shape_.size(); i > 1; --i) {
        result[i - 2] = result[i - 1] * shape_[i - 1];
    }
    return result;
}

size_t NDArray::flatIndex(const std::vector<size_t>& index) const {
    if (index.size() != shape_.size()) {
        throw InvalidArgumentError(kComponent, "index has " + std::to_string(index.size()) +
                                   " dimensions, array has " + std::to_string(shape_.size()));
    }
    size_t flat = 0;
    for (size_t d = 0; d < index.size(); ++d) {
        if (index[d] >= shape_[d]) {
            throw InvalidArgumentError(kComponent, "index " + std::to_string(index[d]) +
                                       " out of range for dimension " + std::to_string(d) +
                                       " of shape " + shapeToString(shape_));
        }
        flat = flat * shape_[d] + index[d];
    }
    return flat;
}

double NDArray::at(const std::vector<size_t>& index) const {
    return data_[flatIndex(index)];
}

void NDArray::set(const std::vector<size_t>& index, double value) {
    data_[flatIndex(index)] = castValue(value, dtype_);
}

NDArray NDArray::astype(DataType dtype) const {
    return NDArray(shape_, data_, dtype);
}

bool NDArray::operator==(const NDArray& other) const {
    return dtype_ == other.dtype_ && shape_ == other.shape_ && data_ == other.data_;
}

} // namespace elements
} // namespace spalign
