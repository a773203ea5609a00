/**
 * @file transform_json.cpp
 * @brief AffineTransform 的 JSON 编解码实现
 */

#include "math/transform/transform_json.hpp"
#include "spalign/common/exceptions.hpp"

namespace spalign {
namespace math {
namespace transform {

namespace {

const char* kComponent = "TransformJson";

nlohmann::json vectorToJson(const VectorXd& v) {
    nlohmann::json arr = nlohmann::json::array();
    for (Eigen::Index i = 0; i < v.size(); ++i) {
        arr.push_back(v[i]);
    }
    return arr;
}

VectorXd jsonToVector(const nlohmann::json& j) {
    auto values = j.get<std::vector<double>>();
    return Eigen::Map<VectorXd>(values.data(), static_cast<Eigen::Index>(values.size()));
}

const nlohmann::json& requireField(const nlohmann::json& j, const char* field, const std::string& type) {
    if (!j.contains(field)) {
        throw InvalidArgumentError(kComponent, "'" + type + "' transformation is missing field '" + field + "'");
    }
    return j.at(field);
}

} // namespace

std::string transformKindToString(TransformKind kind) {
    switch (kind) {
        case TransformKind::IDENTITY: return "identity";
        case TransformKind::TRANSLATION: return "translation";
        case TransformKind::SCALE: return "scale";
        case TransformKind::AFFINE: return "affine";
        case TransformKind::SEQUENCE: return "sequence";
        default: return "unknown";
    }
}

void to_json(nlohmann::json& j, const AffineTransform& t) {
    j = nlohmann::json::object();
    j["type"] = transformKindToString(t.kind());

    switch (t.kind()) {
        case TransformKind::IDENTITY:
            break;
        case TransformKind::TRANSLATION:
            j["translation"] = vectorToJson(t.values());
            j["axes"] = t.axes();
            break;
        case TransformKind::SCALE:
            j["scale"] = vectorToJson(t.values());
            j["axes"] = t.axes();
            break;
        case TransformKind::AFFINE: {
            nlohmann::json rows = nlohmann::json::array();
            const auto& m = t.matrix();
            for (Eigen::Index r = 0; r < m.rows(); ++r) {
                rows.push_back(vectorToJson(m.row(r).transpose()));
            }
            j["affine"] = rows;
            j["input"] = t.inputAxes();
            j["output"] = t.outputAxes();
            break;
        }
        case TransformKind::SEQUENCE: {
            nlohmann::json items = nlohmann::json::array();
            for (const auto& item : t.transformations()) {
                items.push_back(item);
            }
            j["transformations"] = items;
            break;
        }
    }
}

void from_json(const nlohmann::json& j, AffineTransform& t) {
    if (!j.is_object() || !j.contains("type")) {
        throw InvalidArgumentError(kComponent, "transformation must be an object with a 'type' field");
    }
    const std::string type = j.at("type").get<std::string>();

    if (type == "identity") {
        t = AffineTransform::Identity();
    } else if (type == "translation") {
        t = AffineTransform::Translation(jsonToVector(requireField(j, "translation", type)),
                                         requireField(j, "axes", type).get<AxisList>());
    } else if (type == "scale") {
        t = AffineTransform::Scale(jsonToVector(requireField(j, "scale", type)),
                                   requireField(j, "axes", type).get<AxisList>());
    } else if (type == "affine") {
        const auto& rows = requireField(j, "affine", type);
        auto input = requireField(j, "input", type).get<AxisList>();
        auto output = requireField(j, "output", type).get<AxisList>();
        MatrixXd m(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(input.size() + 1));
        for (size_t r = 0; r < rows.size(); ++r) {
            auto row = rows[r].get<std::vector<double>>();
            if (row.size() != input.size() + 1) {
                throw InvalidArgumentError(kComponent, "affine row " + std::to_string(r) + " has " +
                                           std::to_string(row.size()) + " entries, expected " +
                                           std::to_string(input.size() + 1));
            }
            for (size_t c = 0; c < row.size(); ++c) {
                m(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = row[c];
            }
        }
        t = AffineTransform::Affine(m, input, output);
    } else if (type == "sequence") {
        std::vector<AffineTransform> items;
        for (const auto& item : requireField(j, "transformations", type)) {
            items.push_back(item.get<AffineTransform>());
        }
        t = AffineTransform::Sequence(std::move(items));
    } else {
        throw InvalidArgumentError(kComponent, "unknown transformation type '" + type + "'");
    }
}

} // namespace transform
} // namespace math
} // namespace spalign
