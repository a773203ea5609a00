/**
 * @file exceptions.hpp
 * @brief spalign 异常类型
 *
 * 所有异常都派生自 SpalignException，消息格式为 "[组件] 消息"。
 * 变换是确定性的，任何异常都直接抛给 apply() 的调用者，不做重试。
 */
#pragma once

#include <stdexcept>
#include <string>

namespace spalign {

class SpalignException : public std::runtime_error {
public:
    SpalignException(const std::string& component, const std::string& message)
        : std::runtime_error("[" + component + "] " + message) {}
};

/// 请求的轴在变换或元素中不存在
class AxisMismatchError : public SpalignException {
public:
    using SpalignException::SpalignException;
};

/// 调用者给出的参数组合无法消歧
class AmbiguousTransformError : public SpalignException {
public:
    using SpalignException::SpalignException;
};

class InvalidArgumentError : public SpalignException {
public:
    using SpalignException::SpalignException;
};

/// 对奇异线性映射求逆
class NonInvertibleTransformError : public SpalignException {
public:
    using SpalignException::SpalignException;
};

/// 变换后的元素未通过模式校验
class SchemaValidationError : public SpalignException {
public:
    using SpalignException::SpalignException;
};

/// 内部前置条件被破坏，属于编程错误
class InvariantViolationError : public SpalignException {
public:
    using SpalignException::SpalignException;
};

class ConfigurationError : public SpalignException {
public:
    using SpalignException::SpalignException;
};

class IOError : public SpalignException {
public:
    using SpalignException::SpalignException;
};

/**
 * @brief 坐标系查找失败
 *
 * 在元素的变换注册表中找不到指定坐标系时抛出
 */
class CoordinateSystemNotFoundError : public SpalignException {
public:
    CoordinateSystemNotFoundError(const std::string& coordinate_system,
                                  const std::string& additional_info = "")
        : SpalignException("TransformationRegistry", createMessage(coordinate_system, additional_info)),
          coordinate_system_(coordinate_system) {}

    /**
     * @brief 获取缺失的坐标系名称
     */
    const std::string& getCoordinateSystem() const { return coordinate_system_; }

private:
    std::string coordinate_system_;

    static std::string createMessage(const std::string& coordinate_system,
                                     const std::string& additional_info) {
        std::string message = "Coordinate system '" + coordinate_system + "' not found";
        if (!additional_info.empty()) {
            message += ": " + additional_info;
        }
        return message;
    }
};

} // namespace spalign
