/**
 * @file simple_logger.hpp
 * @brief spalign 日志系统
 *
 * @details 日志系统设计
 *
 * 1. 核心功能
 *    - 统一的日志接口：主日志器与按模块命名的日志器（spalign.<模块>）
 *    - 多级别日志：支持 TRACE, DEBUG, INFO, WARN, ERR, CRITICAL
 *    - 多输出目标：彩色控制台与轮转文件
 *    - 可选异步：基于 spdlog 线程池
 *
 * 2. 设计模式
 *    - 单例模式：全局唯一的日志管理器，首次使用时从 ConfigManager 自动初始化
 *
 * 3. 使用方法
 *    @code
 *    SimpleLogger::getInstance().initialize("spalign", LogLevel::DEBUG);
 *
 *    LOG_INFO("Dataset has {} elements", count);
 *    LOG_COMPONENT_NAMED_DEBUG("RasterTransformer", "output shape {}", shape_str);
 *    @endcode
 */
#pragma once
// 使用编译好的 spdlog 库，避免头文件内联实现导致的符号重复
#ifndef SPDLOG_COMPILED_LIB
#define SPDLOG_COMPILED_LIB
#endif
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/async.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace spalign {
namespace utility {

/**
 * @brief 日志级别枚举
 */
enum class LogLevel {
    TRACE = 0,    ///< 最详细的调试信息
    DEBUG = 1,    ///< 调试信息
    INFO = 2,     ///< 一般信息
    WARN = 3,     ///< 警告信息
    ERR = 4,      ///< 错误信息
    CRITICAL = 5, ///< 严重错误
    OFF = 6       ///< 关闭日志
};

/**
 * @brief 日志输出目标配置
 */
struct LogSinkConfig {
    bool console_enabled = true;               ///< 是否输出到控制台
    bool file_enabled = true;                  ///< 是否输出到文件
    std::string file_path = "logs/spalign.log"; ///< 日志文件路径
    size_t max_file_size = 10 * 1024 * 1024;   ///< 最大文件大小 (10MB)
    size_t max_files = 5;                      ///< 最大文件数量
    bool async_enabled = false;                ///< 是否启用异步日志
};

/**
 * @brief 字符串转日志级别（trace/debug/info/warn/error/critical/off）
 *
 * 无法识别时返回 INFO
 */
LogLevel parseLogLevel(const std::string& level_str);

/**
 * @brief 简单日志管理器类
 *
 * 组件日志器的创建受互斥锁保护，可以在多个线程中同时调用 apply()
 */
class SimpleLogger {
public:
    static SimpleLogger& getInstance();

    /**
     * @brief 初始化日志系统
     * @param logger_name 主日志器名称
     * @param level 日志级别
     * @param config 日志配置
     */
    void initialize(const std::string& logger_name,
                    LogLevel level = LogLevel::INFO,
                    const LogSinkConfig& config = LogSinkConfig{});

    /**
     * @brief 从 ConfigManager 的 core.logger 节初始化
     */
    void initializeFromConfig();

    std::shared_ptr<spdlog::logger> getMainLogger();

    /**
     * @brief 获取或创建模块日志器
     * @param component_name 模块名称，实际日志器名为 "spalign.<模块>"
     */
    std::shared_ptr<spdlog::logger> getComponentLogger(const std::string& component_name);

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const { return current_level_; }

    void flush();

    /**
     * @brief 关闭日志系统，之后再次使用会重新初始化
     */
    void shutdown();

    bool isInitialized() const { return initialized_.load(); }

private:
    SimpleLogger() = default;
    ~SimpleLogger() = default;
    SimpleLogger(const SimpleLogger&) = delete;
    SimpleLogger& operator=(const SimpleLogger&) = delete;

    spdlog::level::level_enum toSpdlogLevel(LogLevel level) const;
    std::vector<spdlog::sink_ptr> createSinks(const LogSinkConfig& config);
    std::shared_ptr<spdlog::logger> createLogger(const std::string& name);
    void initializeLocked(const std::string& logger_name, LogLevel level, const LogSinkConfig& config);

private:
    std::shared_ptr<spdlog::logger> main_logger_;
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> component_loggers_;
    std::vector<spdlog::sink_ptr> sinks_;
    LogLevel current_level_ = LogLevel::INFO;
    std::atomic<bool> initialized_{false};
    bool async_ = false;
    std::recursive_mutex mutex_;
};

} // namespace utility
} // namespace spalign

// ============================================================================
// 便捷宏定义
// ============================================================================

#define LOG_TRACE(...)    if(auto spalign_logger_ = spalign::utility::SimpleLogger::getInstance().getMainLogger()) spalign_logger_->trace(__VA_ARGS__)
#define LOG_DEBUG(...)    if(auto spalign_logger_ = spalign::utility::SimpleLogger::getInstance().getMainLogger()) spalign_logger_->debug(__VA_ARGS__)
#define LOG_INFO(...)     if(auto spalign_logger_ = spalign::utility::SimpleLogger::getInstance().getMainLogger()) spalign_logger_->info(__VA_ARGS__)
#define LOG_WARN(...)     if(auto spalign_logger_ = spalign::utility::SimpleLogger::getInstance().getMainLogger()) spalign_logger_->warn(__VA_ARGS__)
#define LOG_ERROR(...)    if(auto spalign_logger_ = spalign::utility::SimpleLogger::getInstance().getMainLogger()) spalign_logger_->error(__VA_ARGS__)
#define LOG_CRITICAL(...) if(auto spalign_logger_ = spalign::utility::SimpleLogger::getInstance().getMainLogger()) spalign_logger_->critical(__VA_ARGS__)

/**
 * @brief 带模块名称的日志宏定义
 */
#define LOG_COMPONENT_NAMED_TRACE(name, ...)    if(auto spalign_logger_ = spalign::utility::SimpleLogger::getInstance().getComponentLogger(name)) spalign_logger_->trace(__VA_ARGS__)
#define LOG_COMPONENT_NAMED_DEBUG(name, ...)    if(auto spalign_logger_ = spalign::utility::SimpleLogger::getInstance().getComponentLogger(name)) spalign_logger_->debug(__VA_ARGS__)
#define LOG_COMPONENT_NAMED_INFO(name, ...)     if(auto spalign_logger_ = spalign::utility::SimpleLogger::getInstance().getComponentLogger(name)) spalign_logger_->info(__VA_ARGS__)
#define LOG_COMPONENT_NAMED_WARN(name, ...)     if(auto spalign_logger_ = spalign::utility::SimpleLogger::getInstance().getComponentLogger(name)) spalign_logger_->warn(__VA_ARGS__)
#define LOG_COMPONENT_NAMED_ERROR(name, ...)    if(auto spalign_logger_ = spalign::utility::SimpleLogger::getInstance().getComponentLogger(name)) spalign_logger_->error(__VA_ARGS__)
#define LOG_COMPONENT_NAMED_CRITICAL(name, ...) if(auto spalign_logger_ = spalign::utility::SimpleLogger::getInstance().getComponentLogger(name)) spalign_logger_->critical(__VA_ARGS__)
