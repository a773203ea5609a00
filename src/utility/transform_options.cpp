/**
 * @file transform_options.cpp
 * @brief 从配置读取变换参数
 */

#include "spalign/utility/transform_options.hpp"
#include "spalign/utility/config_manager.hpp"
#include "spalign/common/exceptions.hpp"

namespace spalign {
namespace utility {

TransformOptions TransformOptions::fromConfig() {
    const auto& config = ConfigManager::getInstance();
    TransformOptions options;

    options.default_coordinate_system = config.getConfigValue<std::string>(
        ConfigFileType::CORE, "core.default_coordinate_system", options.default_coordinate_system);

    const auto op = ConfigFileType::OPERATIONS;
    options.interpolation_order = config.getConfigValue<int>(
        op, "operations.transform.interpolation_order", options.interpolation_order);
    options.fill_value = config.getConfigValue<double>(op, "operations.transform.fill_value", options.fill_value);
    options.prefilter = config.getConfigValue<bool>(op, "operations.transform.prefilter", options.prefilter);
    options.isotropy_rtol = config.getConfigValue<double>(op, "operations.transform.isotropy_rtol", options.isotropy_rtol);
    options.isotropy_atol = config.getConfigValue<double>(op, "operations.transform.isotropy_atol", options.isotropy_atol);
    options.shape_snap_tolerance = config.getConfigValue<double>(
        op, "operations.transform.shape_snap_tolerance", options.shape_snap_tolerance);
    options.allow_explicit_transform_shim = config.getConfigValue<bool>(
        op, "operations.transform.allow_explicit_transform_shim", options.allow_explicit_transform_shim);
    options.lazy_resampling = config.getConfigValue<bool>(
        op, "operations.transform.lazy_resampling", options.lazy_resampling);

    options.validate();
    return options;
}

void TransformOptions::validate() const {
    if (default_coordinate_system.empty()) {
        throw ConfigurationError("TransformOptions", "default_coordinate_system must not be empty");
    }
    if (interpolation_order != 0 && interpolation_order != 1) {
        throw ConfigurationError("TransformOptions",
            "interpolation_order must be 0 or 1, got " + std::to_string(interpolation_order));
    }
    if (isotropy_rtol < 0.0 || isotropy_atol < 0.0 || shape_snap_tolerance < 0.0) {
        throw ConfigurationError("TransformOptions", "tolerances must be non-negative");
    }
}

} // namespace utility
} // namespace spalign
