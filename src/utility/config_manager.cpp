/**
 * @file config_manager.cpp
 * @brief spalign 配置管理器实现
 */

#include "spalign/utility/config_manager.hpp"
#include "spalign/common/exceptions.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace spalign {
namespace utility {

ConfigFileFormat detectConfigFormat(const std::string& file_path) {
    std::string ext = std::filesystem::path(file_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".yaml" || ext == ".yml") {
        return ConfigFileFormat::YAML;
    }
    return ConfigFileFormat::JSON;
}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

ConfigManager::ConfigManager() {
    resetToDefaults();
}

const std::vector<ConfigFileType>& ConfigManager::allConfigTypes() {
    static const std::vector<ConfigFileType> types = {
        ConfigFileType::CORE,
        ConfigFileType::OPERATIONS,
        ConfigFileType::IO
    };
    return types;
}

bool ConfigManager::loadConfigs(const std::string& config_dir_path) {
    config_dir_path_ = config_dir_path;

    if (!std::filesystem::exists(config_dir_path)) {
        std::filesystem::create_directories(config_dir_path);
    }

    bool all_success = true;

    for (auto type : allConfigTypes()) {
        // 同名文件优先使用 YAML
        std::string base = config_dir_path + "/" + configTypeToString(type);
        std::string filepath = base + ".json";
        for (const char* ext : {".yaml", ".yml"}) {
            if (std::filesystem::exists(base + ext)) {
                filepath = base + ext;
                break;
            }
        }

        if (!loadConfig(type, filepath)) {
            all_success = false;
        }
    }

    return all_success;
}

bool ConfigManager::loadConfigs(const std::string& config_dir_path, ConfigFileFormat format) {
    config_dir_path_ = config_dir_path;

    if (!std::filesystem::exists(config_dir_path)) {
        std::filesystem::create_directories(config_dir_path);
    }

    bool all_success = true;
    for (auto type : allConfigTypes()) {
        std::string filepath = config_dir_path + "/" + configTypeToString(type) + getConfigFileExtension(format);
        if (!loadConfig(type, filepath, format)) {
            all_success = false;
        }
    }
    return all_success;
}

bool ConfigManager::loadConfig(ConfigFileType type, const std::string& config_file_path) {
    return loadConfig(type, config_file_path, detectConfigFormat(config_file_path));
}

bool ConfigManager::loadConfig(ConfigFileType type, const std::string& config_file_path, ConfigFileFormat format) {
    config_file_paths_[type] = config_file_path;
    config_file_formats_[type] = format;

    try {
        if (!std::filesystem::exists(config_file_path)) {
            // 文件不存在时以默认配置创建
            auto default_config = getDefaultConfig(type);
            configs_[type] = default_config;
            bool saved = (format == ConfigFileFormat::YAML)
                ? saveYamlFile(default_config, config_file_path)
                : saveJsonFile(default_config, config_file_path);
            if (!saved) {
                std::cerr << "Failed to create default config file: " << config_file_path << std::endl;
            }
            return saved;
        }

        nlohmann::json config = (format == ConfigFileFormat::YAML)
            ? loadYamlFile(config_file_path)
            : loadJsonFile(config_file_path);

        // 合并默认配置和加载的配置
        configs_[type] = mergeConfigs(getDefaultConfig(type), config);
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Error loading config file " << config_file_path << ": " << e.what() << std::endl;
        configs_[type] = getDefaultConfig(type);
        return false;
    }
}

bool ConfigManager::reloadConfigs() {
    bool all_success = true;

    // 复制一份路径，reloadConfig 会写回 config_file_paths_
    auto paths = config_file_paths_;
    for (const auto& [type, path] : paths) {
        if (!reloadConfig(type)) {
            all_success = false;
        }
    }

    return all_success;
}

bool ConfigManager::reloadConfig(ConfigFileType type) {
    auto it = config_file_paths_.find(type);
    if (it == config_file_paths_.end()) {
        return false;
    }

    const std::string path = it->second;
    auto format_it = config_file_formats_.find(type);
    const ConfigFileFormat format =
        format_it != config_file_formats_.end() ? format_it->second : detectConfigFormat(path);

    bool success = loadConfig(type, path, format);
    if (success) {
        notifyConfigChange(type, "");
    }

    return success;
}

nlohmann::json ConfigManager::getComponentConfig(ConfigFileType config_type, const std::string& component_name) const {
    auto config = getConfig(config_type);

    // 配置结构：类别 -> 组件名
    std::string category = configTypeToString(config_type);

    if (config.contains(category) && config[category].is_object() && config[category].contains(component_name)) {
        return config[category][component_name];
    }

    return nlohmann::json::object();
}

nlohmann::json ConfigManager::getComponentConfig(const std::string& config_type_str, const std::string& component_name) const {
    try {
        return getComponentConfig(stringToConfigType(config_type_str), component_name);
    } catch (const ConfigurationError&) {
        return nlohmann::json::object();
    }
}

nlohmann::json ConfigManager::getConfig(ConfigFileType type) const {
    auto it = configs_.find(type);
    if (it != configs_.end()) {
        return it->second;
    }

    return getDefaultConfig(type);
}

void ConfigManager::setConfigValue(ConfigFileType type, const std::string& json_path, const nlohmann::json& value) {
    auto path_components = parseJsonPath(json_path);
    if (path_components.empty()) {
        throw ConfigurationError("ConfigManager", "empty configuration path");
    }
    setValueByPath(configs_[type], path_components, value);

    notifyConfigChange(type, path_components[0]);
}

void ConfigManager::resetToDefaults() {
    configs_.clear();
    for (auto type : allConfigTypes()) {
        configs_[type] = getDefaultConfig(type);
    }
}

bool ConfigManager::saveConfigs() const {
    bool all_success = true;

    for (const auto& [type, config] : configs_) {
        if (config_file_paths_.count(type) == 0) {
            continue;
        }
        if (!saveConfig(type)) {
            all_success = false;
        }
    }

    return all_success;
}

bool ConfigManager::saveConfig(ConfigFileType type, const std::string& config_file_path) const {
    std::string filepath = config_file_path;
    if (filepath.empty()) {
        auto it = config_file_paths_.find(type);
        if (it == config_file_paths_.end()) {
            return false;
        }
        filepath = it->second;
    }
    return saveConfig(type, detectConfigFormat(filepath), filepath);
}

bool ConfigManager::saveConfig(ConfigFileType type, ConfigFileFormat format, const std::string& config_file_path) const {
    auto it = configs_.find(type);
    if (it == configs_.end() || config_file_path.empty()) {
        return false;
    }

    return format == ConfigFileFormat::YAML
        ? saveYamlFile(it->second, config_file_path)
        : saveJsonFile(it->second, config_file_path);
}

void ConfigManager::registerConfigChangeCallback(ConfigFileType type, const std::string& section, ConfigChangeCallback callback) {
    callbacks_[type][section] = std::move(callback);
}

bool ConfigManager::validateConfigs() const {
    for (const auto& [type, config] : configs_) {
        if (!validateConfig(type)) {
            return false;
        }
    }
    return true;
}

bool ConfigManager::validateConfig(ConfigFileType type) const {
    auto it = configs_.find(type);
    if (it == configs_.end()) {
        return false;
    }

    const std::string category = configTypeToString(type);
    if (!it->second.contains(category) || !it->second[category].is_object()) {
        return false;
    }
    const auto& section = it->second[category];

    try {
        switch (type) {
            case ConfigFileType::CORE:
                if (section.contains("logger")) {
                    const auto& logger_config = section["logger"];
                    if (logger_config.contains("max_file_size") && logger_config["max_file_size"].get<long long>() <= 0) {
                        return false;
                    }
                    if (logger_config.contains("max_files") && logger_config["max_files"].get<long long>() <= 0) {
                        return false;
                    }
                }
                if (section.contains("default_coordinate_system")) {
                    const auto& cs = section["default_coordinate_system"];
                    if (!cs.is_string() || cs.get<std::string>().empty()) {
                        return false;
                    }
                }
                break;

            case ConfigFileType::OPERATIONS:
                if (section.contains("transform")) {
                    const auto& transform = section["transform"];
                    if (transform.contains("interpolation_order")) {
                        int order = transform["interpolation_order"].get<int>();
                        if (order != 0 && order != 1) {
                            return false;
                        }
                    }
                    for (const char* key : {"isotropy_rtol", "isotropy_atol", "shape_snap_tolerance"}) {
                        if (transform.contains(key) && transform[key].get<double>() < 0.0) {
                            return false;
                        }
                    }
                }
                break;

            case ConfigFileType::IO:
                if (section.contains("hdf5") && section["hdf5"].contains("overwrite") &&
                    !section["hdf5"]["overwrite"].is_boolean()) {
                    return false;
                }
                break;
        }
    } catch (const nlohmann::json::exception&) {
        // 类型不符视为无效配置
        return false;
    }

    return true;
}

nlohmann::json ConfigManager::getDefaultConfig(ConfigFileType type) {
    switch (type) {
        case ConfigFileType::CORE:
            return nlohmann::json::parse(R"({
                "core": {
                    "logger": {
                        "name": "spalign",
                        "console_enabled": true,
                        "file_enabled": true,
                        "file_path": "logs/spalign.log",
                        "max_file_size": 10485760,
                        "max_files": 5,
                        "async_enabled": false,
                        "level": "info"
                    },
                    "default_coordinate_system": "global"
                }
            })");

        case ConfigFileType::OPERATIONS:
            return nlohmann::json::parse(R"({
                "operations": {
                    "transform": {
                        "interpolation_order": 0,
                        "fill_value": 0.0,
                        "prefilter": false,
                        "isotropy_rtol": 1e-5,
                        "isotropy_atol": 1e-8,
                        "shape_snap_tolerance": 1e-6,
                        "allow_explicit_transform_shim": true,
                        "lazy_resampling": false
                    }
                }
            })");

        case ConfigFileType::IO:
            return nlohmann::json::parse(R"({
                "io": {
                    "hdf5": {
                        "overwrite": true,
                        "output_path": "output/dataset.h5"
                    }
                }
            })");
    }
    return nlohmann::json::object();
}

std::string ConfigManager::configTypeToString(ConfigFileType type) {
    switch (type) {
        case ConfigFileType::CORE: return "core";
        case ConfigFileType::OPERATIONS: return "operations";
        case ConfigFileType::IO: return "io";
    }
    return "unknown";
}

ConfigFileType ConfigManager::stringToConfigType(const std::string& type_str) {
    if (type_str == "core") return ConfigFileType::CORE;
    if (type_str == "operations") return ConfigFileType::OPERATIONS;
    if (type_str == "io") return ConfigFileType::IO;

    throw ConfigurationError("ConfigManager", "Unknown config type: " + type_str);
}

std::vector<std::string> ConfigManager::parseJsonPath(const std::string& json_path) const {
    std::vector<std::string> path_components;
    std::stringstream ss(json_path);
    std::string component;

    while (std::getline(ss, component, '.')) {
        if (!component.empty()) {
            path_components.push_back(component);
        }
    }

    return path_components;
}

nlohmann::json ConfigManager::getValueByPath(const nlohmann::json& json, const std::vector<std::string>& path) const {
    const nlohmann::json* current = &json;

    for (const auto& component : path) {
        if (!current->is_object() || !current->contains(component)) {
            return nlohmann::json();
        }
        current = &(*current)[component];
    }

    return *current;
}

void ConfigManager::setValueByPath(nlohmann::json& json, const std::vector<std::string>& path, const nlohmann::json& value) {
    nlohmann::json* current = &json;

    for (size_t i = 0; i + 1 < path.size(); ++i) {
        if (!current->contains(path[i]) || !(*current)[path[i]].is_object()) {
            (*current)[path[i]] = nlohmann::json::object();
        }
        current = &((*current)[path[i]]);
    }

    (*current)[path.back()] = value;
}

nlohmann::json ConfigManager::mergeConfigs(const nlohmann::json& base, const nlohmann::json& overlay) const {
    if (!overlay.is_object()) {
        return base;
    }

    nlohmann::json result = base;

    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        if (it.value().is_object() && result.contains(it.key()) && result[it.key()].is_object()) {
            result[it.key()] = mergeConfigs(result[it.key()], it.value());
        } else {
            result[it.key()] = it.value();
        }
    }

    return result;
}

void ConfigManager::notifyConfigChange(ConfigFileType type, const std::string& section) {
    auto type_it = callbacks_.find(type);
    if (type_it == callbacks_.end()) {
        return;
    }
    auto section_it = type_it->second.find(section);
    if (section_it == type_it->second.end()) {
        return;
    }
    auto config = getConfig(type);
    if (section.empty() || config.contains(section)) {
        nlohmann::json section_config = section.empty() ? config : config[section];
        section_it->second(type, section, section_config);
    }
}

nlohmann::json ConfigManager::loadJsonFile(const std::string& file_path) const {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigurationError("ConfigManager", "Failed to open config file: " + file_path);
    }
    nlohmann::json config;
    file >> config;
    return config;
}

nlohmann::json ConfigManager::loadYamlFile(const std::string& file_path) const {
    YAML::Node root = YAML::LoadFile(file_path);
    return yamlToJson(root);
}

bool ConfigManager::saveJsonFile(const nlohmann::json& config, const std::string& file_path) const {
    std::ofstream file(file_path);
    if (!file.is_open()) {
        return false;
    }
    file << config.dump(4);
    return static_cast<bool>(file);
}

bool ConfigManager::saveYamlFile(const nlohmann::json& config, const std::string& file_path) const {
    std::ofstream file(file_path);
    if (!file.is_open()) {
        return false;
    }
    YAML::Emitter emitter;
    emitter << jsonToYaml(config);
    file << emitter.c_str() << "\n";
    return static_cast<bool>(file);
}

nlohmann::json ConfigManager::yamlToJson(const YAML::Node& yaml_node) const {
    switch (yaml_node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;

        case YAML::NodeType::Scalar: {
            // 带引号的标量保持字符串
            if (yaml_node.Tag() == "!") {
                return yaml_node.Scalar();
            }
            bool b = false;
            if (YAML::convert<bool>::decode(yaml_node, b)) {
                return b;
            }
            long long i = 0;
            if (YAML::convert<long long>::decode(yaml_node, i)) {
                return i;
            }
            double d = 0.0;
            if (YAML::convert<double>::decode(yaml_node, d)) {
                return d;
            }
            return yaml_node.Scalar();
        }

        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : yaml_node) {
                array.push_back(yamlToJson(item));
            }
            return array;
        }

        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& kv : yaml_node) {
                object[kv.first.as<std::string>()] = yamlToJson(kv.second);
            }
            return object;
        }
    }
    return nullptr;
}

YAML::Node ConfigManager::jsonToYaml(const nlohmann::json& json_obj) const {
    YAML::Node node;
    switch (json_obj.type()) {
        case nlohmann::json::value_t::object:
            node = YAML::Node(YAML::NodeType::Map);
            for (auto it = json_obj.begin(); it != json_obj.end(); ++it) {
                node[it.key()] = jsonToYaml(it.value());
            }
            break;
        case nlohmann::json::value_t::array:
            node = YAML::Node(YAML::NodeType::Sequence);
            for (const auto& item : json_obj) {
                node.push_back(jsonToYaml(item));
            }
            break;
        case nlohmann::json::value_t::string:
            node = json_obj.get<std::string>();
            break;
        case nlohmann::json::value_t::boolean:
            node = json_obj.get<bool>();
            break;
        case nlohmann::json::value_t::number_integer:
            node = json_obj.get<long long>();
            break;
        case nlohmann::json::value_t::number_unsigned:
            node = json_obj.get<unsigned long long>();
            break;
        case nlohmann::json::value_t::number_float:
            node = json_obj.get<double>();
            break;
        default:
            node = YAML::Node(YAML::NodeType::Null);
            break;
    }
    return node;
}

std::string ConfigManager::getConfigFileExtension(ConfigFileFormat format) const {
    return format == ConfigFileFormat::YAML ? ".yaml" : ".json";
}

} // namespace utility
} // namespace spalign
