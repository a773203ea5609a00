/**
 * @file hdf5_element_writer.cpp
 * @brief HDF5 element writer implementation
 */

#include "spalign/io/hdf5_element_writer.hpp"
#include "spalign/common/exceptions.hpp"
#include "spalign/utility/simple_logger.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <type_traits>
#include <vector>

// Conditional HDF5 includes
#ifdef SPALIGN_HDF5_AVAILABLE
#include <H5Cpp.h>
using namespace H5;
#endif

namespace spalign {
namespace io {

namespace {
const char* kComponent = "HDF5ElementWriter";
}

// PIMPL implementation struct
struct HDF5ElementWriter::HDF5ElementWriterImpl {
#ifdef SPALIGN_HDF5_AVAILABLE
    std::unique_ptr<H5File> file;

    /// 取得（必要时创建）一级分组，例如 /images
    Group rootGroup(const std::string& name) {
        const std::string path = "/" + name;
        if (H5Lexists(file->getId(), path.c_str(), H5P_DEFAULT) > 0) {
            return file->openGroup(path);
        }
        return file->createGroup(path);
    }

    static void writeStringAttribute(H5Object& object, const std::string& name, const std::string& value) {
        DataSpace scalar_space(H5S_SCALAR);
        StrType str_type(PredType::C_S1, value.length() + 1);
        Attribute attr = object.createAttribute(name, str_type, scalar_space);
        attr.write(str_type, value.c_str());
    }

    /// 写一个 double 数据集，空数据只建不写
    static DataSet writeDoubles(Group& group, const std::string& name,
                                const std::vector<hsize_t>& dims, const std::vector<double>& values) {
        DataSpace space(static_cast<int>(dims.size()), dims.data());
        DataSet dataset = group.createDataSet(name, PredType::NATIVE_DOUBLE, space);
        if (!values.empty()) {
            dataset.write(values.data(), PredType::NATIVE_DOUBLE);
        }
        return dataset;
    }

    static DataSet writeIndices(Group& group, const std::string& name, const std::vector<unsigned long long>& values) {
        hsize_t dims[1] = {values.size()};
        DataSpace space(1, dims);
        DataSet dataset = group.createDataSet(name, PredType::NATIVE_ULLONG, space);
        if (!values.empty()) {
            dataset.write(values.data(), PredType::NATIVE_ULLONG);
        }
        return dataset;
    }

    static void writeMatrixRows(const Eigen::MatrixXd& matrix, std::vector<double>& out) {
        for (Eigen::Index r = 0; r < matrix.rows(); ++r) {
            for (Eigen::Index c = 0; c < matrix.cols(); ++c) {
                out.push_back(matrix(r, c));
            }
        }
    }

    static void writeAttributesGroup(Group& parent, const elements::AttributeTable& attributes) {
        Group attr_group = parent.createGroup("attributes");
        for (const auto& [column, values] : attributes) {
            writeDoubles(attr_group, column, {values.size()}, values);
        }
    }

    static void writeHeader(Group& group, elements::ElementKind kind,
                            const math::transform::AxisList& axes,
                            const coordination::TransformationRegistry& registry) {
        writeStringAttribute(group, "element_kind", elements::elementKindToString(kind));
        writeStringAttribute(group, "axes", nlohmann::json(axes).dump());
        writeStringAttribute(group, "transformations", nlohmann::json(registry).dump());
    }

    static void writeRasterLevel(Group& group, const std::string& name, const elements::Raster& raster) {
        const elements::NDArray& values = raster.data()->realize();
        std::vector<hsize_t> dims(values.shape().begin(), values.shape().end());
        DataSet dataset = writeDoubles(group, name, dims, values.data());
        writeStringAttribute(dataset, "dtype", elements::dataTypeToString(values.dtype()));
    }

    void writeRaster(Group& group, const elements::Raster& raster) {
        writeHeader(group, elements::ElementKind::RASTER, raster.dims(), raster.transformations());
        writeStringAttribute(group, "model", elements::elementModelToString(raster.model()));
        writeStringAttribute(group, "channel_names", nlohmann::json(raster.channelNames()).dump());
        writeRasterLevel(group, "scale0", raster);
    }

    void writeMultiscale(Group& group, const elements::MultiscaleRaster& raster) {
        writeHeader(group, elements::ElementKind::MULTISCALE_RASTER, raster.dims(), raster.transformations());
        writeStringAttribute(group, "model", elements::elementModelToString(raster.model()));
        for (size_t i = 0; i < raster.numLevels(); ++i) {
            writeRasterLevel(group, raster.levelName(i), raster.level(i));
        }
    }

    void writePoints(Group& group, const elements::PointTable& points) {
        writeHeader(group, elements::ElementKind::POINT_TABLE, points.axes(), points.transformations());
        std::vector<double> coords;
        coords.reserve(static_cast<size_t>(points.coordinates().size()));
        writeMatrixRows(points.coordinates(), coords);
        writeDoubles(group, "coords",
                     {static_cast<hsize_t>(points.coordinates().rows()),
                      static_cast<hsize_t>(points.coordinates().cols())},
                     coords);
        writeAttributesGroup(group, points.attributes());
    }

    /**
     * 多边形按 GeoArrow 风格展平：
     * coords 为全部顶点，ring_offsets/part_offsets/geometry_offsets 为前缀和；
     * POINT 几何记作单顶点单环。
     */
    void writeShapes(Group& group, const elements::PolygonSet& shapes) {
        writeHeader(group, elements::ElementKind::POLYGON_SET, shapes.axes(), shapes.transformations());

        const auto dim = static_cast<hsize_t>(shapes.axes().size());
        std::vector<double> coords;
        std::vector<unsigned long long> geometry_types;
        std::vector<unsigned long long> ring_offsets{0};
        std::vector<unsigned long long> part_offsets{0};
        std::vector<unsigned long long> geometry_offsets{0};
        unsigned long long vertex_count = 0;

        auto add_ring = [&](const Eigen::MatrixXd& ring) {
            writeMatrixRows(ring, coords);
            vertex_count += static_cast<unsigned long long>(ring.rows());
            ring_offsets.push_back(vertex_count);
        };

        for (const auto& geometry : shapes.geometries()) {
            geometry_types.push_back(static_cast<unsigned long long>(geometry.type));
            if (geometry.type == elements::GeometryType::POINT) {
                add_ring(Eigen::MatrixXd(geometry.point));
                part_offsets.push_back(ring_offsets.size() - 1);
                geometry_offsets.push_back(part_offsets.size() - 1);
                continue;
            }
            for (const auto& part : geometry.parts) {
                add_ring(part.exterior);
                for (const auto& interior : part.interiors) {
                    add_ring(interior);
                }
                part_offsets.push_back(ring_offsets.size() - 1);
            }
            geometry_offsets.push_back(part_offsets.size() - 1);
        }

        writeDoubles(group, "coords", {vertex_count, dim}, coords);
        writeIndices(group, "geometry_type", geometry_types);
        writeIndices(group, "ring_offsets", ring_offsets);
        writeIndices(group, "part_offsets", part_offsets);
        writeIndices(group, "geometry_offsets", geometry_offsets);
        writeAttributesGroup(group, shapes.attributes());
    }
#endif

    HDF5ElementWriterImpl() = default;
    ~HDF5ElementWriterImpl() = default;
};

HDF5ElementWriter::HDF5ElementWriter()
    : impl_(std::make_unique<HDF5ElementWriterImpl>())
    , open_(false)
{
}

HDF5ElementWriter::~HDF5ElementWriter() {
    if (open_) {
        try {
            close();
        } catch (const std::exception& e) {
            // Log error but don't throw in destructor
            LOG_COMPONENT_NAMED_ERROR(kComponent, "Error in HDF5ElementWriter destructor: {}", e.what());
        }
    }
}

bool HDF5ElementWriter::isHDF5Available() {
#ifdef SPALIGN_HDF5_AVAILABLE
    return true;
#else
    return false;
#endif
}

void HDF5ElementWriter::open(const std::string& file_path, bool overwrite) {
#ifndef SPALIGN_HDF5_AVAILABLE
    (void)file_path;
    (void)overwrite;
    throw IOError(kComponent, "HDF5 library is not available. Please install HDF5 development libraries and recompile.");
#else
    if (open_) {
        throw IOError(kComponent, "writer already open: " + file_path_);
    }
    if (file_path.empty()) {
        throw IOError(kComponent, "empty output path");
    }

    try {
        std::filesystem::path path_obj(file_path);
        if (path_obj.has_parent_path()) {
            std::filesystem::create_directories(path_obj.parent_path());
        }
        if (!overwrite && std::filesystem::exists(path_obj)) {
            throw IOError(kComponent, "output file exists and overwrite is disabled: " + file_path);
        }

        Exception::dontPrint();
        impl_->file = std::make_unique<H5File>(file_path, overwrite ? H5F_ACC_TRUNC : H5F_ACC_EXCL);
        impl_->writeStringAttribute(*impl_->file, "spalign_format", "spalign-hdf5/1");

        open_ = true;
        file_path_ = file_path;
        LOG_COMPONENT_NAMED_INFO(kComponent, "Created HDF5 file: {}", file_path);
    } catch (const Exception& e) {
        throw IOError(kComponent, "HDF5 open failed: " + std::string(e.getCDetailMsg()));
    } catch (const std::filesystem::filesystem_error& e) {
        throw IOError(kComponent, std::string("cannot prepare output path: ") + e.what());
    }
#endif
}

void HDF5ElementWriter::writeElement(elements::ElementGroup group,
                                     const std::string& name,
                                     const elements::SpatialElement& element) {
#ifndef SPALIGN_HDF5_AVAILABLE
    (void)group;
    (void)name;
    (void)element;
    throw IOError(kComponent, "HDF5 library is not available");
#else
    if (!open_) {
        throw IOError(kComponent, "writer not open");
    }
    if (name.empty() || name.find('/') != std::string::npos) {
        throw IOError(kComponent, "invalid element name '" + name + "'");
    }

    try {
        Group parent = impl_->rootGroup(elements::elementGroupToString(group));
        Group element_group = parent.createGroup(name);

        std::visit([&](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, elements::Raster>) {
                impl_->writeRaster(element_group, e);
            } else if constexpr (std::is_same_v<T, elements::MultiscaleRaster>) {
                impl_->writeMultiscale(element_group, e);
            } else if constexpr (std::is_same_v<T, elements::PointTable>) {
                impl_->writePoints(element_group, e);
            } else {
                impl_->writeShapes(element_group, e);
            }
        }, element);

        LOG_COMPONENT_NAMED_DEBUG(kComponent, "Wrote /{}/{} ({})",
                                  elements::elementGroupToString(group), name,
                                  elements::elementKindToString(elements::elementKind(element)));
    } catch (const Exception& e) {
        throw IOError(kComponent, "HDF5 write of '" + name + "' failed: " + std::string(e.getCDetailMsg()));
    }
#endif
}

void HDF5ElementWriter::writeDataset(const elements::SpatialDataset& dataset) {
#ifndef SPALIGN_HDF5_AVAILABLE
    (void)dataset;
    throw IOError(kComponent, "HDF5 library is not available");
#else
    if (!open_) {
        throw IOError(kComponent, "writer not open");
    }
    for (elements::ElementGroup group : elements::SpatialDataset::allGroups()) {
        for (const auto& [name, element] : dataset.group(group)) {
            writeElement(group, name, element);
        }
    }
    try {
        impl_->writeStringAttribute(*impl_->file, "coordinate_systems",
                                    nlohmann::json(dataset.coordinateSystems()).dump());
    } catch (const Exception& e) {
        throw IOError(kComponent, "HDF5 metadata write failed: " + std::string(e.getCDetailMsg()));
    }
    LOG_COMPONENT_NAMED_INFO(kComponent, "Wrote {} elements to {}", dataset.size(), file_path_);
#endif
}

void HDF5ElementWriter::close() {
#ifdef SPALIGN_HDF5_AVAILABLE
    if (!open_) {
        return;
    }
    try {
        impl_->file->flush(H5F_SCOPE_GLOBAL);
        impl_->file->close();
        impl_->file.reset();
        open_ = false;
        LOG_COMPONENT_NAMED_DEBUG(kComponent, "Closed HDF5 file: {}", file_path_);
    } catch (const Exception& e) {
        impl_->file.reset();
        open_ = false;
        throw IOError(kComponent, "HDF5 close failed: " + std::string(e.getCDetailMsg()));
    }
#endif
}

void HDF5ElementWriter::writeToFile(const elements::SpatialDataset& dataset,
                                    const std::string& file_path,
                                    bool overwrite) {
    HDF5ElementWriter writer;
    writer.open(file_path, overwrite);
    writer.writeDataset(dataset);
    writer.close();
}

} // namespace io
} // namespace spalign
