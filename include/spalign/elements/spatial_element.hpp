/**
 * @file spatial_element.hpp
 * @brief 四种空间元素及其封闭变体
 *
 * 每个元素独占一个 TransformationRegistry，所有元素都是不可变值：
 * 变换操作总是构造新元素，原元素保持不变。栅格数据通过
 * shared_ptr<const ILazyArray> 在副本之间共享。
 */
#pragma once

#include "lazy_array.hpp"
#include "spalign/coordination/transformation_registry.hpp"
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace spalign {
namespace elements {

using coordination::TransformationRegistry;
using math::transform::AffineTransform;
using math::transform::AxisList;

/**
 * @brief 元素的结构模型
 */
enum class ElementModel {
    IMAGE2D,    ///< (c, y, x)
    IMAGE3D,    ///< (c, z, y, x)
    LABELS2D,   ///< (y, x)
    LABELS3D,   ///< (z, y, x)
    POINTS,     ///< 点表
    SHAPES      ///< 几何集合
};

std::string elementModelToString(ElementModel model);

bool isRasterModel(ElementModel model);
bool isLabelsModel(ElementModel model);

/**
 * @brief 栅格模型规定的维度顺序
 */
AxisList expectedDims(ElementModel model);

/// 带属性列的表，列长度等于行数
using AttributeTable = std::map<std::string, std::vector<double>>;

// ==================== Raster ====================

class Raster {
public:
    /**
     * @param data 数组数据
     * @param dims 维度名称，按数组维度顺序
     * @param model 栅格模型
     * @param transformations 变换注册表
     * @param channel_names 通道坐标名称，可为空
     */
    Raster(LazyArrayPtr data,
           AxisList dims,
           ElementModel model,
           TransformationRegistry transformations = TransformationRegistry::withDefault(),
           std::vector<std::string> channel_names = {});

    const LazyArrayPtr& data() const { return data_; }
    const AxisList& dims() const { return dims_; }
    ElementModel model() const { return model_; }
    const TransformationRegistry& transformations() const { return transformations_; }
    const std::vector<std::string>& channelNames() const { return channel_names_; }

    const Shape& shape() const { return data_->shape(); }

    /// 除通道轴之外的维度
    AxisList spatialDims() const;

    /// 某个维度的长度
    size_t extent(const std::string& dim) const;

    Raster withTransformations(TransformationRegistry transformations) const;

private:
    LazyArrayPtr data_;
    AxisList dims_;
    ElementModel model_;
    TransformationRegistry transformations_;
    std::vector<std::string> channel_names_;
};

// ==================== MultiscaleRaster ====================

/**
 * @brief 多尺度金字塔
 *
 * 整个金字塔持有一个注册表。设置注册表时派生每一层的注册表：
 * 第 0 层与金字塔相同，第 i 层为 Sequence([Scale(shape0 / shape_i), t])。
 * 注册表为占位（仅默认坐标系 Identity）时，各层同样是占位。
 */
class MultiscaleRaster {
public:
    MultiscaleRaster(std::vector<Raster> levels,
                     TransformationRegistry transformations = TransformationRegistry::withDefault(),
                     const std::string& default_coordinate_system = coordination::coordinate_systems::GLOBAL);

    const std::vector<Raster>& levels() const { return levels_; }
    const Raster& level(size_t i) const { return levels_.at(i); }
    size_t numLevels() const { return levels_.size(); }

    /// 层名称 "scale0", "scale1", ...
    static std::string levelName(size_t i) { return "scale" + std::to_string(i); }

    const TransformationRegistry& transformations() const { return transformations_; }
    const AxisList& dims() const { return levels_.front().dims(); }
    ElementModel model() const { return levels_.front().model(); }

    /**
     * @brief 第 i 层相对第 0 层的缩放，按空间维度
     */
    AffineTransform levelScale(size_t i) const;

    MultiscaleRaster withTransformations(TransformationRegistry transformations) const;

private:
    std::vector<Raster> levels_;
    TransformationRegistry transformations_;
    std::string default_coordinate_system_;

    void propagateToLevels();
};

// ==================== PointTable ====================

class PointTable {
public:
    /**
     * @param coordinates N x D 坐标，列顺序与 axes 一致
     * @param axes 坐标轴，(x, y) 或 (x, y, z)
     * @param attributes 属性列
     */
    PointTable(Eigen::MatrixXd coordinates,
               AxisList axes,
               AttributeTable attributes = {},
               TransformationRegistry transformations = TransformationRegistry::withDefault());

    const Eigen::MatrixXd& coordinates() const { return coordinates_; }
    const AxisList& axes() const { return axes_; }
    const AttributeTable& attributes() const { return attributes_; }
    const TransformationRegistry& transformations() const { return transformations_; }

    size_t numPoints() const { return static_cast<size_t>(coordinates_.rows()); }

    PointTable withTransformations(TransformationRegistry transformations) const;

private:
    Eigen::MatrixXd coordinates_;
    AxisList axes_;
    AttributeTable attributes_;
    TransformationRegistry transformations_;
};

// ==================== PolygonSet ====================

enum class GeometryType {
    POINT,
    POLYGON,
    MULTI_POLYGON
};

std::string geometryTypeToString(GeometryType type);

/**
 * @brief 一个多边形：外环加若干内环，每个环为 K x D 顶点矩阵
 */
struct PolygonPart {
    Eigen::MatrixXd exterior;
    std::vector<Eigen::MatrixXd> interiors;
};

struct Geometry {
    GeometryType type = GeometryType::POINT;
    Eigen::RowVectorXd point;          ///< POINT 的坐标
    std::vector<PolygonPart> parts;    ///< POLYGON 有一个部分，MULTI_POLYGON 有多个

    static Geometry Point(const Eigen::RowVectorXd& coordinates);
    static Geometry Polygon(const Eigen::MatrixXd& exterior, std::vector<Eigen::MatrixXd> interiors = {});
    static Geometry MultiPolygon(std::vector<PolygonPart> parts);

    /// 坐标维度
    Eigen::Index dimension() const;

    bool operator==(const Geometry& other) const;
    bool operator!=(const Geometry& other) const { return !(*this == other); }
};

class PolygonSet {
public:
    /// 点几何的半径属性列名
    static constexpr const char* RADIUS = "radius";

    PolygonSet(std::vector<Geometry> geometries,
               AxisList axes,
               AttributeTable attributes = {},
               TransformationRegistry transformations = TransformationRegistry::withDefault());

    const std::vector<Geometry>& geometries() const { return geometries_; }
    const AxisList& axes() const { return axes_; }
    const AttributeTable& attributes() const { return attributes_; }
    const TransformationRegistry& transformations() const { return transformations_; }

    size_t size() const { return geometries_.size(); }

    bool hasPointGeometries() const;

    PolygonSet withTransformations(TransformationRegistry transformations) const;

private:
    std::vector<Geometry> geometries_;
    AxisList axes_;
    AttributeTable attributes_;
    TransformationRegistry transformations_;
};

// ==================== 变体 ====================

using SpatialElement = std::variant<Raster, MultiscaleRaster, PointTable, PolygonSet>;

enum class ElementKind {
    RASTER,
    MULTISCALE_RASTER,
    POINT_TABLE,
    POLYGON_SET
};

std::string elementKindToString(ElementKind kind);

ElementKind elementKind(const SpatialElement& element);

const TransformationRegistry& transformationsOf(const SpatialElement& element);

SpatialElement withTransformations(const SpatialElement& element, TransformationRegistry transformations);

/**
 * @brief 元素数据的全部轴（栅格为 dims，点表与几何为 axes）
 */
const AxisList& axesOf(const SpatialElement& element);

} // namespace elements
} // namespace spalign
