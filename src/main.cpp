// main.cpp
#include <iostream>
#include "spalign/utility/config_manager.hpp"
#include "spalign/utility/simple_logger.hpp"
#include "spalign/utility/transform_options.hpp"
#include "spalign/operations/dispatcher.hpp"
#include "spalign/io/hdf5_element_writer.hpp"

using namespace spalign;
using namespace spalign::elements;
using spalign::math::transform::AffineTransform;

namespace {

/// 构造一个包含图像、标签、点和几何的小数据集，全部锚定在 global 与 aligned 两个坐标系
SpatialDataset buildSampleDataset() {
    SpatialDataset dataset;
    dataset.catalog().registerCoordinateSystem(
        coordination::CoordinateSystem::fromAxisNames("global", {"c", "y", "x"}));
    dataset.catalog().registerCoordinateSystem(
        coordination::CoordinateSystem::fromAxisNames("aligned", {"c", "y", "x"}));

    const auto to_aligned = AffineTransform::Scale(Eigen::Vector2d(2.0, 2.0), {"y", "x"});

    coordination::TransformationRegistry registry = coordination::TransformationRegistry::withDefault();
    registry.set("aligned", to_aligned);

    NDArray image({1, 4, 6}, DataType::UINT8, 0.0);
    for (size_t y = 0; y < 4; ++y) {
        for (size_t x = 0; x < 6; ++x) {
            image.set({0, y, x}, static_cast<double>(10 * y + x));
        }
    }
    dataset.add(ElementGroup::IMAGES, "image",
                Raster(makeArray(image), {"c", "y", "x"}, ElementModel::IMAGE2D, registry, {"dapi"}));

    NDArray labels({4, 6}, DataType::UINT16, 0.0);
    labels.set({1, 1}, 1.0);
    labels.set({2, 4}, 2.0);
    dataset.add(ElementGroup::LABELS, "cells",
                Raster(makeArray(labels), {"y", "x"}, ElementModel::LABELS2D, registry));

    Eigen::MatrixXd coords(3, 2);
    coords << 0.5, 0.5,
              3.0, 1.0,
              5.5, 3.5;
    dataset.add(ElementGroup::POINTS, "transcripts",
                PointTable(coords, {"x", "y"}, {{"gene_id", {1.0, 2.0, 3.0}}}, registry));

    Eigen::MatrixXd square(4, 2);
    square << 1.0, 1.0,
              2.0, 1.0,
              2.0, 2.0,
              1.0, 2.0;
    std::vector<Geometry> geometries = {
        Geometry::Polygon(square),
        Geometry::Point(Eigen::RowVector2d(4.0, 2.0))
    };
    dataset.add(ElementGroup::SHAPES, "regions",
                PolygonSet(geometries, {"x", "y"}, {{PolygonSet::RADIUS, {0.0, 1.5}}}, registry));

    return dataset;
}

} // namespace

int main(int argc, char** argv) {
    try {
        // 1. 加载配置（可选的配置目录作为第一个参数）
        auto& config_manager = utility::ConfigManager::getInstance();
        if (argc > 1) {
            if (!config_manager.loadConfigs(argv[1])) {
                LOG_WARN("Some configuration files in {} failed to load, defaults are used", argv[1]);
            }
        }

        LOG_INFO("spalign demo initializing...");

        // 2. 构造分派器
        const utility::TransformOptions options = utility::TransformOptions::fromConfig();
        operations::Dispatcher dispatcher(options);

        // 3. 构造示例数据集
        const SpatialDataset dataset = buildSampleDataset();
        LOG_INFO("Sample dataset: {} elements, coordinate systems: {}",
                 dataset.size(), dataset.catalog().generateDescription());

        // 4. 把全部元素变换到 aligned 坐标系
        const SpatialDataset aligned = dispatcher.transformToCoordinateSystem(dataset, "aligned");
        for (ElementGroup group : SpatialDataset::allGroups()) {
            for (const auto& [name, element] : aligned.group(group)) {
                LOG_INFO("{}/{} -> {}", elementGroupToString(group), name,
                         transformationsOf(element).toString());
            }
        }

        // 5. 保持定位地旋转图像
        const auto rotation = AffineTransform::Rotation(math::transform::constants::HALF_PI, {"y", "x"});
        const SpatialElement rotated = dispatcher.apply(dataset.get("image"), rotation, true);
        const auto& rotated_raster = std::get<Raster>(rotated);
        LOG_INFO("Rotated image shape: {}, registry: {}",
                 shapeToString(rotated_raster.shape()), rotated_raster.transformations().toString());

        // 6. 写出结果
        if (io::HDF5ElementWriter::isHDF5Available()) {
            const auto output_path = config_manager.getConfigValue<std::string>(
                utility::ConfigFileType::IO, "io.hdf5.output_path", "output/dataset.h5");
            const bool overwrite = config_manager.getConfigValue<bool>(
                utility::ConfigFileType::IO, "io.hdf5.overwrite", true);
            io::HDF5ElementWriter::writeToFile(aligned, output_path, overwrite);
            LOG_INFO("Aligned dataset written to {}", output_path);
        } else {
            LOG_INFO("HDF5 not available, skipping output");
        }

    } catch (const std::exception& e) {
        LOG_CRITICAL("An unhandled exception occurred: {}", e.what());
        std::cerr << e.what() << std::endl;
        return 1;
    }

    // 正常结束时关闭日志系统
    LOG_INFO("Program terminating normally");
    utility::SimpleLogger::getInstance().shutdown();
    return 0;
}
