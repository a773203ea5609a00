/**
 * @file config_manager.hpp
 * @brief spalign 配置管理器
 *
 * @details 配置管理系统设计
 *
 * 1. 核心功能
 *    - JSON / YAML 配置文件读取：按扩展名自动检测格式
 *    - 统一配置接口：点分路径访问，缺失时返回默认值
 *    - 参数验证：确保配置参数的有效性
 *    - 热重载：支持运行时重新加载配置并通知回调
 *
 * 2. 配置文件分类
 *    - core: 日志与默认坐标系
 *    - operations: 变换引擎参数（插值阶数、填充值、容差等）
 *    - io: HDF5 写出参数
 *
 * 3. 使用方法
 *    @code
 *    ConfigManager::getInstance().loadConfigs("config/");
 *
 *    auto logger_config = ConfigManager::getInstance().getComponentConfig(ConfigFileType::CORE, "logger");
 *    int order = ConfigManager::getInstance().getConfigValue<int>(
 *        ConfigFileType::OPERATIONS, "operations.transform.interpolation_order", 0);
 *    @endcode
 */
#pragma once

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace spalign {
namespace utility {

/**
 * @brief 配置文件类型枚举
 */
enum class ConfigFileType {
    CORE,        // 核心配置（日志、默认坐标系）
    OPERATIONS,  // 变换引擎
    IO           // 持久化
};

/**
 * @brief 配置文件格式枚举
 */
enum class ConfigFileFormat {
    JSON,
    YAML
};

/**
 * @brief 按扩展名检测配置文件格式，.yaml/.yml 为 YAML，其余为 JSON
 */
ConfigFileFormat detectConfigFormat(const std::string& file_path);

/**
 * @brief 配置变更回调函数类型
 */
using ConfigChangeCallback = std::function<void(ConfigFileType type, const std::string& section, const nlohmann::json& config)>;

/**
 * @brief 配置管理器类
 *
 * 采用单例模式；文件不存在时以默认配置创建，已有文件会合并到默认配置之上
 */
class ConfigManager {
public:
    static ConfigManager& getInstance();

    /**
     * @brief 加载目录下所有配置文件（优先 .yaml/.yml，其次 .json）
     * @param config_dir_path 配置文件目录路径
     * @return bool 全部加载成功
     */
    bool loadConfigs(const std::string& config_dir_path);

    /**
     * @brief 加载目录下所有配置文件（指定格式）
     */
    bool loadConfigs(const std::string& config_dir_path, ConfigFileFormat format);

    /**
     * @brief 加载单个配置文件（自动检测格式）
     */
    bool loadConfig(ConfigFileType type, const std::string& config_file_path);

    /**
     * @brief 加载单个配置文件（指定格式）
     */
    bool loadConfig(ConfigFileType type, const std::string& config_file_path, ConfigFileFormat format);

    bool reloadConfigs();
    bool reloadConfig(ConfigFileType type);

    /**
     * @brief 获取组件配置，即 config[类别][组件名]
     * @return nlohmann::json 组件配置，不存在时为空对象
     */
    nlohmann::json getComponentConfig(ConfigFileType config_type, const std::string& component_name) const;

    /**
     * @brief 获取组件配置（通过字符串类型）
     */
    nlohmann::json getComponentConfig(const std::string& config_type_str, const std::string& component_name) const;

    /**
     * @brief 获取指定类型的完整配置，未加载时返回默认配置
     */
    nlohmann::json getConfig(ConfigFileType type) const;

    /**
     * @brief 获取指定路径的配置值
     * @param json_path 点分路径（如 "operations.transform.fill_value"）
     * @param default_value 路径不存在或类型不符时的返回值
     */
    template<typename T>
    T getConfigValue(ConfigFileType type, const std::string& json_path, const T& default_value) const;

    void setConfigValue(ConfigFileType type, const std::string& json_path, const nlohmann::json& value);

    /**
     * @brief 恢复全部默认配置，不触碰磁盘文件
     */
    void resetToDefaults();

    /**
     * @brief 保存所有配置到各自的文件（使用原格式）
     */
    bool saveConfigs() const;

    /**
     * @brief 保存指定类型的配置（按路径扩展名决定格式）
     * @param config_file_path 为空时使用加载时的路径
     */
    bool saveConfig(ConfigFileType type, const std::string& config_file_path = "") const;

    bool saveConfig(ConfigFileType type, ConfigFileFormat format, const std::string& config_file_path) const;

    void registerConfigChangeCallback(ConfigFileType type, const std::string& section, ConfigChangeCallback callback);

    bool validateConfigs() const;

    /**
     * @brief 验证指定类型的配置
     * @return bool 配置是否有效
     */
    bool validateConfig(ConfigFileType type) const;

    static nlohmann::json getDefaultConfig(ConfigFileType type);

    static std::string configTypeToString(ConfigFileType type);

    /**
     * @throws ConfigurationError 未知类型
     */
    static ConfigFileType stringToConfigType(const std::string& type_str);

    static const std::vector<ConfigFileType>& allConfigTypes();

private:
    ConfigManager();
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    std::vector<std::string> parseJsonPath(const std::string& json_path) const;
    nlohmann::json getValueByPath(const nlohmann::json& json, const std::vector<std::string>& path) const;
    void setValueByPath(nlohmann::json& json, const std::vector<std::string>& path, const nlohmann::json& value);

    /**
     * @brief 递归合并，overlay 覆盖 base
     */
    nlohmann::json mergeConfigs(const nlohmann::json& base, const nlohmann::json& overlay) const;

    void notifyConfigChange(ConfigFileType type, const std::string& section);

    nlohmann::json loadJsonFile(const std::string& file_path) const;
    nlohmann::json loadYamlFile(const std::string& file_path) const;
    bool saveJsonFile(const nlohmann::json& config, const std::string& file_path) const;
    bool saveYamlFile(const nlohmann::json& config, const std::string& file_path) const;

    nlohmann::json yamlToJson(const YAML::Node& yaml_node) const;
    YAML::Node jsonToYaml(const nlohmann::json& json_obj) const;

    std::string getConfigFileExtension(ConfigFileFormat format) const;

    std::unordered_map<ConfigFileType, nlohmann::json> configs_;                 ///< 配置存储
    std::unordered_map<ConfigFileType, std::string> config_file_paths_;          ///< 配置文件路径
    std::unordered_map<ConfigFileType, ConfigFileFormat> config_file_formats_;   ///< 配置文件格式
    std::string config_dir_path_;                                                ///< 配置目录路径
    std::unordered_map<ConfigFileType, std::unordered_map<std::string, ConfigChangeCallback>> callbacks_;
};

// 模板方法实现
template<typename T>
T ConfigManager::getConfigValue(ConfigFileType type, const std::string& json_path, const T& default_value) const {
    auto it = configs_.find(type);
    const nlohmann::json& config = (it == configs_.end()) ? getDefaultConfig(type) : it->second;

    auto value = getValueByPath(config, parseJsonPath(json_path));
    if (value.is_null()) {
        return default_value;
    }

    try {
        return value.template get<T>();
    } catch (const nlohmann::json::type_error&) {
        return default_value;
    }
}

} // namespace utility
} // namespace spalign
