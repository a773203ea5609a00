/**
 * @file transform_options.hpp
 * @brief 变换引擎的共享配置值
 *
 * 所有算法都以显式参数（带默认值）接收 TransformOptions，
 * 不在算法内部读取可变的全局状态。
 */
#pragma once

#include <string>

namespace spalign {
namespace utility {

struct TransformOptions {
    std::string default_coordinate_system = "global";  ///< 保留的默认坐标系名称
    int interpolation_order = 0;                       ///< 0 最近邻，1 多线性
    double fill_value = 0.0;                           ///< 源网格之外的填充值
    bool prefilter = false;                            ///< 仅为接口兼容保留，order <= 1 时无效果
    double isotropy_rtol = 1e-5;                       ///< 各向同性判断的相对容差
    double isotropy_atol = 1e-8;                       ///< 各向同性判断的绝对容差
    double shape_snap_tolerance = 1e-6;                ///< 输出尺寸贴近整数时的吸附容差
    bool allow_explicit_transform_shim = true;         ///< 是否接受已弃用的显式变换写法
    bool lazy_resampling = false;                      ///< 是否延迟栅格重采样

    /**
     * @brief 从 ConfigManager 读取（operations.transform.* 与 core.default_coordinate_system）
     * @throws ConfigurationError 配置值非法
     */
    static TransformOptions fromConfig();

    /**
     * @brief 检查数值范围
     * @throws ConfigurationError
     */
    void validate() const;
};

} // namespace utility
} // namespace spalign
