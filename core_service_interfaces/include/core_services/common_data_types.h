/**
 * @file common_data_types.h
 * @brief Defines shared data types for core service interfaces
 */

#pragma once

#ifndef GEOBRIDGE_CORE_SERVICES_COMMON_DATA_TYPES_H
#define GEOBRIDGE_CORE_SERVICES_COMMON_DATA_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace geobridge::core_services {

/**
 * @brief 属性值，可以是多种类型之一
 *
 * std::monostate 表示空值（null）。
 */
using AttributeValue = std::variant<
    std::monostate,
    std::string,
    std::int64_t,
    double,
    bool>;

/**
 * @brief 字段类型
 */
enum class FieldType {
    INTEGER,
    REAL,
    STRING,
    BOOLEAN
};

/**
 * @struct FieldDefinition
 * @brief 表示矢量数据中的一个字段定义
 */
struct FieldDefinition {
    std::string name;
    FieldType type = FieldType::STRING;

    bool operator==(const FieldDefinition& other) const {
        return name == other.name && type == other.type;
    }
};

/**
 * @brief 支持的地理数据交换格式
 */
enum class GeodataFormat {
    GEOJSON,
    KML,
    GPKG,
    SHAPEFILE
};

/**
 * @brief 载荷编码方式
 */
enum class DataEncoding {
    UTF8,
    BASE64
};

inline std::string toString(GeodataFormat format) {
    switch (format) {
        case GeodataFormat::GEOJSON: return "geojson";
        case GeodataFormat::KML: return "kml";
        case GeodataFormat::GPKG: return "gpkg";
        case GeodataFormat::SHAPEFILE: return "shapefile";
    }
    return "geojson";
}

inline std::string toString(DataEncoding encoding) {
    return encoding == DataEncoding::BASE64 ? "base64" : "utf8";
}

/**
 * @brief GeoPackage 和 Shapefile 以 base64 交换，其余为 UTF-8 文本
 */
inline bool isBinaryFormat(GeodataFormat format) {
    return format == GeodataFormat::GPKG || format == GeodataFormat::SHAPEFILE;
}

inline DataEncoding encodingFor(GeodataFormat format) {
    return isBinaryFormat(format) ? DataEncoding::BASE64 : DataEncoding::UTF8;
}

/**
 * @struct GeodataEnvelope
 * @brief 每个几何操作的输出载体
 *
 * encoding 由 format 决定：二进制格式为 base64，文本格式为 utf8。
 */
struct GeodataEnvelope {
    GeodataFormat format = GeodataFormat::GEOJSON;
    DataEncoding encoding = DataEncoding::UTF8;
    std::optional<std::string> crs;  ///< "EPSG:<code>"、WKT，未知时为空
    std::string payload;
};

inline void to_json(nlohmann::json& j, const GeodataEnvelope& envelope) {
    j = nlohmann::json{
        {"format", toString(envelope.format)},
        {"encoding", toString(envelope.encoding)},
        {"crs", envelope.crs ? nlohmann::json(*envelope.crs) : nlohmann::json(nullptr)},
        {"payload", envelope.payload}
    };
}

/**
 * @struct BoundingBox
 * @brief 表示一个地理或投影坐标系下的边界框
 */
struct BoundingBox {
    double minX = 0.0;
    double minY = 0.0;
    double maxX = 0.0;
    double maxY = 0.0;
    std::optional<std::string> crs;

    bool contains(const BoundingBox& other) const {
        return minX <= other.minX && minY <= other.minY &&
               maxX >= other.maxX && maxY >= other.maxY;
    }

    bool strictlyContains(const BoundingBox& other) const {
        return minX < other.minX && minY < other.minY &&
               maxX > other.maxX && maxY > other.maxY;
    }
};

inline void to_json(nlohmann::json& j, const BoundingBox& bbox) {
    j = nlohmann::json{
        {"format", "bbox"},
        {"crs", bbox.crs ? nlohmann::json(*bbox.crs) : nlohmann::json(nullptr)},
        {"bounds", {
            {"minx", bbox.minX},
            {"miny", bbox.minY},
            {"maxx", bbox.maxX},
            {"maxy", bbox.maxY}
        }}
    };
}

} // namespace geobridge::core_services

#endif // GEOBRIDGE_CORE_SERVICES_COMMON_DATA_TYPES_H
