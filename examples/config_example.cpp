/**
 * @file config_example.cpp
 * @brief 配置管理器使用示例
 *
 * 本示例演示如何使用 ConfigManager 管理 core/operations/io 三个配置文件
 */

#include "spalign/utility/config_manager.hpp"
#include "spalign/utility/simple_logger.hpp"
#include "spalign/utility/transform_options.hpp"
#include <iostream>

using namespace spalign::utility;

void printSeparator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << std::string(60, '=') << std::endl;
}

void printConfigSection(const std::string& section_name, const nlohmann::json& config) {
    std::cout << "\n[" << section_name << "]" << std::endl;
    std::cout << config.dump(2) << std::endl;
}

int main() {
    try {
        printSeparator("spalign 配置管理器示例");

        // 1. 加载配置，缺失的文件会按默认值创建
        std::cout << "\n1. 加载配置..." << std::endl;
        auto& config_manager = ConfigManager::getInstance();
        if (config_manager.loadConfigs("config/")) {
            std::cout << "   配置文件加载成功" << std::endl;
        } else {
            std::cout << "   部分配置文件加载失败，使用默认配置" << std::endl;
        }

        // 2. 从配置初始化日志系统
        SimpleLogger::getInstance().initializeFromConfig();
        LOG_INFO("配置管理器示例开始");

        // 3. 显示各类型配置
        printSeparator("配置文件内容");
        for (ConfigFileType type : ConfigManager::allConfigTypes()) {
            printConfigSection(ConfigManager::configTypeToString(type), config_manager.getConfig(type));
        }

        // 4. 读取单个值
        printSeparator("读取配置值");
        const auto order = config_manager.getConfigValue<int>(
            ConfigFileType::OPERATIONS, "operations.transform.interpolation_order", 0);
        const auto cs = config_manager.getConfigValue<std::string>(
            ConfigFileType::CORE, "core.default_coordinate_system", "global");
        std::cout << "interpolation_order = " << order << std::endl;
        std::cout << "default_coordinate_system = " << cs << std::endl;

        // 5. 修改配置并监听变化
        printSeparator("修改配置");
        config_manager.registerConfigChangeCallback(
            ConfigFileType::OPERATIONS, "operations",
            [](ConfigFileType, const std::string& section, const nlohmann::json&) {
                LOG_INFO("配置节 {} 已修改", section);
            });
        config_manager.setConfigValue(ConfigFileType::OPERATIONS, "operations.transform.interpolation_order", 1);

        const TransformOptions options = TransformOptions::fromConfig();
        options.validate();
        std::cout << "TransformOptions.interpolation_order = " << options.interpolation_order << std::endl;

        // 6. 以 YAML 格式另存
        printSeparator("保存配置");
        if (config_manager.saveConfig(ConfigFileType::OPERATIONS, ConfigFileFormat::YAML, "config/operations_copy.yaml")) {
            std::cout << "已保存到 config/operations_copy.yaml" << std::endl;
        }

        std::cout << "\n配置校验: " << (config_manager.validateConfigs() ? "通过" : "失败") << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "错误: " << e.what() << std::endl;
        return 1;
    }

    SimpleLogger::getInstance().shutdown();
    return 0;
}
