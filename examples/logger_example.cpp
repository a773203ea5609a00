/**
 * @file logger_example.cpp
 * @brief spalign 日志系统使用示例
 *
 * 本文件演示了如何使用日志系统：
 * 1. 基本日志记录
 * 2. 组件日志器
 * 3. 多线程下的组件日志
 */

#include "spalign/utility/simple_logger.hpp"
#include "spalign/operations/dispatcher.hpp"
#include <iostream>
#include <thread>
#include <vector>

using namespace spalign;
using namespace spalign::utility;

/**
 * @brief 在多个线程中同时变换点表，每个线程写自己的组件日志
 */
void demonstrateConcurrentLogging() {
    Eigen::MatrixXd coords = Eigen::MatrixXd::Random(100, 2);
    const elements::PointTable points(coords, {"x", "y"});
    const operations::Dispatcher dispatcher;

    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&, i]() {
            const auto shift = math::transform::AffineTransform::Translation(
                Eigen::Vector2d(static_cast<double>(i), 0.0), {"x", "y"});
            const auto result = dispatcher.apply(points, shift, true);
            LOG_COMPONENT_NAMED_INFO("Worker", "worker {} finished, registry {}",
                                     i, elements::transformationsOf(result).toString());
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
}

int main() {
    std::cout << "=== spalign 日志系统示例 ===" << std::endl;

    // 1. 初始化日志系统
    LogSinkConfig config;
    config.file_path = "logs/logger_example.log";
    SimpleLogger::getInstance().initialize("spalign", LogLevel::TRACE, config);

    // 2. 基本日志
    LOG_TRACE("This is a trace message - very detailed debugging info");
    LOG_DEBUG("This is a debug message - general debugging info");
    LOG_INFO("This is an info message - general information");
    LOG_WARN("This is a warning message - something might be wrong");
    LOG_ERROR("This is an error message - something went wrong");

    double value = 3.14159;
    int count = 42;
    LOG_INFO("Formatted log: value={:.2f}, count={}", value, count);

    // 3. 组件日志器，名称为 spalign.<组件>
    LOG_COMPONENT_NAMED_INFO("Example", "component logger ready");

    // 4. 提高级别后 DEBUG 不再输出
    SimpleLogger::getInstance().setLogLevel(LogLevel::WARN);
    LOG_DEBUG("This message is filtered out");
    LOG_WARN("Log level is now WARN");
    SimpleLogger::getInstance().setLogLevel(LogLevel::INFO);

    // 5. 多线程
    demonstrateConcurrentLogging();

    SimpleLogger::getInstance().flush();
    SimpleLogger::getInstance().shutdown();
    std::cout << "日志已写入 logs/logger_example.log" << std::endl;
    return 0;
}
