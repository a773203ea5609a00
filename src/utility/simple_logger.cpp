/**
 * @file simple_logger.cpp
 * @brief spalign 日志系统实现
 */

#include "spalign/utility/simple_logger.hpp"
#include "spalign/utility/config_manager.hpp"
#include <filesystem>
#include <iostream>

namespace spalign {
namespace utility {

namespace {
const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";
}

LogLevel parseLogLevel(const std::string& level_str) {
    if (level_str == "trace") return LogLevel::TRACE;
    if (level_str == "debug") return LogLevel::DEBUG;
    if (level_str == "info") return LogLevel::INFO;
    if (level_str == "warn") return LogLevel::WARN;
    if (level_str == "error") return LogLevel::ERR;
    if (level_str == "critical") return LogLevel::CRITICAL;
    if (level_str == "off") return LogLevel::OFF;
    return LogLevel::INFO;
}

// ============================================================================
// SimpleLogger 实现
// ============================================================================

SimpleLogger& SimpleLogger::getInstance() {
    static SimpleLogger instance;

    // 自动初始化：首次使用时从配置管理器读取日志配置
    if (!instance.initialized_) {
        instance.initializeFromConfig();
    }

    return instance;
}

void SimpleLogger::initialize(const std::string& logger_name,
                              LogLevel level,
                              const LogSinkConfig& config) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    initializeLocked(logger_name, level, config);
}

void SimpleLogger::initializeLocked(const std::string& logger_name,
                                    LogLevel level,
                                    const LogSinkConfig& config) {
    if (initialized_) {
        if (main_logger_) {
            main_logger_->warn("Logger already initialized, skipping re-initialization");
        }
        return;
    }

    try {
        current_level_ = level;
        sinks_ = createSinks(config);

        if (sinks_.empty()) {
            // 所有输出都被关闭时仍然需要一个有效的日志器
            sinks_.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }

        async_ = config.async_enabled;
        if (async_ && !spdlog::thread_pool()) {
            // 8192 队列大小，1 个后台线程
            spdlog::init_thread_pool(8192, 1);
        }

        spdlog::drop(logger_name);
        main_logger_ = createLogger(logger_name);
        spdlog::register_logger(main_logger_);
        spdlog::set_default_logger(main_logger_);

        initialized_ = true;

        main_logger_->debug("spalign logger initialized");
        main_logger_->debug("Console output: {}", config.console_enabled ? "enabled" : "disabled");
        main_logger_->debug("File output: {}", config.file_enabled ? config.file_path : std::string("disabled"));

    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
    }
}

void SimpleLogger::initializeFromConfig() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (initialized_) {
        return;
    }

    try {
        auto& config_manager = ConfigManager::getInstance();
        auto logger_config = config_manager.getComponentConfig(ConfigFileType::CORE, "logger");

        LogSinkConfig sink_config;
        sink_config.console_enabled = logger_config.value("console_enabled", true);
        sink_config.file_enabled = logger_config.value("file_enabled", true);
        sink_config.file_path = logger_config.value("file_path", std::string("logs/spalign.log"));
        sink_config.max_file_size = logger_config.value("max_file_size", static_cast<size_t>(10485760));
        sink_config.max_files = logger_config.value("max_files", static_cast<size_t>(5));
        sink_config.async_enabled = logger_config.value("async_enabled", false);

        std::string logger_name = logger_config.value("name", std::string("spalign"));
        LogLevel level = parseLogLevel(logger_config.value("level", std::string("info")));

        initializeLocked(logger_name, level, sink_config);

    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger from config: " << e.what() << std::endl;
        initializeLocked("spalign", LogLevel::INFO, LogSinkConfig{});
    }
}

std::shared_ptr<spdlog::logger> SimpleLogger::getMainLogger() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!initialized_) {
        initializeLocked("spalign", LogLevel::INFO, LogSinkConfig{});
    }
    return main_logger_;
}

std::shared_ptr<spdlog::logger> SimpleLogger::getComponentLogger(const std::string& component_name) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!initialized_) {
        initializeLocked("spalign", LogLevel::INFO, LogSinkConfig{});
    }

    auto it = component_loggers_.find(component_name);
    if (it != component_loggers_.end()) {
        return it->second;
    }

    try {
        const std::string logger_name = "spalign." + component_name;
        spdlog::drop(logger_name);
        auto component_logger = createLogger(logger_name);
        spdlog::register_logger(component_logger);
        component_loggers_[component_name] = component_logger;
        return component_logger;

    } catch (const std::exception& e) {
        if (main_logger_) {
            main_logger_->error("Failed to create component logger for '{}': {}", component_name, e.what());
        }
        return main_logger_;
    }
}

void SimpleLogger::setLogLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    current_level_ = level;
    auto spdlog_level = toSpdlogLevel(level);

    if (main_logger_) {
        main_logger_->set_level(spdlog_level);
    }

    for (auto& [name, logger] : component_loggers_) {
        if (logger) {
            logger->set_level(spdlog_level);
        }
    }
}

void SimpleLogger::flush() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (main_logger_) {
        main_logger_->flush();
    }

    for (auto& [name, logger] : component_loggers_) {
        if (logger) {
            logger->flush();
        }
    }
}

void SimpleLogger::shutdown() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!initialized_) {
        return;
    }

    flush();

    component_loggers_.clear();
    main_logger_.reset();
    sinks_.clear();

    spdlog::shutdown();

    initialized_ = false;
}

spdlog::level::level_enum SimpleLogger::toSpdlogLevel(LogLevel level) const {
    switch (level) {
        case LogLevel::TRACE:    return spdlog::level::trace;
        case LogLevel::DEBUG:    return spdlog::level::debug;
        case LogLevel::INFO:     return spdlog::level::info;
        case LogLevel::WARN:     return spdlog::level::warn;
        case LogLevel::ERR:      return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        case LogLevel::OFF:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> SimpleLogger::createLogger(const std::string& name) {
    std::shared_ptr<spdlog::logger> logger;
    if (async_) {
        logger = std::make_shared<spdlog::async_logger>(
            name,
            sinks_.begin(),
            sinks_.end(),
            spdlog::thread_pool(),
            spdlog::async_overflow_policy::block
        );
    } else {
        logger = std::make_shared<spdlog::logger>(name, sinks_.begin(), sinks_.end());
    }
    logger->set_level(toSpdlogLevel(current_level_));
    logger->set_pattern(kPattern);
    return logger;
}

std::vector<spdlog::sink_ptr> SimpleLogger::createSinks(const LogSinkConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    try {
        if (config.console_enabled) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(spdlog::level::trace);
            sinks.push_back(console_sink);
        }

        if (config.file_enabled) {
            // 确保日志目录存在
            std::filesystem::path log_dir = std::filesystem::path(config.file_path).parent_path();
            if (!log_dir.empty()) {
                std::error_code ec;
                std::filesystem::create_directories(log_dir, ec);
                if (ec) {
                    std::cerr << "Failed to create log directory: " << ec.message() << std::endl;
                }
            }

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path,
                config.max_file_size,
                config.max_files
            );
            file_sink->set_level(spdlog::level::trace);
            sinks.push_back(file_sink);
        }

    } catch (const std::exception& e) {
        std::cerr << "Failed to create log sinks: " << e.what() << std::endl;
    }

    return sinks;
}

} // namespace utility
} // namespace spalign
