#include "codec/format_codec.h"
#include "codec/vsi_staging_area.h"
#include "crs/crs_reconciler.h"
#include "impl/gdal_environment.h"
#include "core_services/geo_processing/geo_processing_exceptions.h"
#include "common_utils/utilities/logging_utils.h"
#include "common_utils/utilities/string_utils.h"

#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <cpl_conv.h>
#include <cpl_string.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <set>
#include <vector>

namespace geobridge::core_services::geo_processing::codec {

using common_utils::StringUtils;
using engine::FeatureRow;
using engine::FeatureTable;

namespace {

constexpr const char* kLayerName = "result";

void ensureGdal() {
    impl::GdalEnvironment::require();
}

FieldType toFieldType(const OGRFieldDefn& field) {
    switch (field.GetType()) {
        case OFTInteger:
            return field.GetSubType() == OFSTBoolean ? FieldType::BOOLEAN : FieldType::INTEGER;
        case OFTInteger64:
            return FieldType::INTEGER;
        case OFTReal:
            return FieldType::REAL;
        default:
            return FieldType::STRING;
    }
}

AttributeValue readField(const OGRFeature& feature, int index, FieldType type) {
    if (!feature.IsFieldSetAndNotNull(index)) {
        return AttributeValue{};
    }
    switch (type) {
        case FieldType::BOOLEAN:
            return feature.GetFieldAsInteger(index) != 0;
        case FieldType::INTEGER:
            return static_cast<std::int64_t>(feature.GetFieldAsInteger64(index));
        case FieldType::REAL:
            return feature.GetFieldAsDouble(index);
        case FieldType::STRING:
            return std::string(feature.GetFieldAsString(index));
    }
    return AttributeValue{};
}

void configureOgrField(OGRFieldDefn& defn, FieldType type) {
    switch (type) {
        case FieldType::BOOLEAN:
            defn.SetType(OFTInteger);
            defn.SetSubType(OFSTBoolean);
            break;
        case FieldType::INTEGER:
            defn.SetType(OFTInteger64);
            break;
        case FieldType::REAL:
            defn.SetType(OFTReal);
            break;
        case FieldType::STRING:
            defn.SetType(OFTString);
            break;
    }
}

void writeField(OGRFeature& feature, int index, const AttributeValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        feature.SetFieldNull(index);
    } else if (auto s = std::get_if<std::string>(&value)) {
        feature.SetField(index, s->c_str());
    } else if (auto i = std::get_if<std::int64_t>(&value)) {
        feature.SetField(index, static_cast<GIntBig>(*i));
    } else if (auto d = std::get_if<double>(&value)) {
        feature.SetField(index, *d);
    } else if (auto b = std::get_if<bool>(&value)) {
        feature.SetField(index, *b ? 1 : 0);
    }
}

/**
 * One driver per format, used for reading and for writing so that attributes
 * survive a round trip. KML goes through LIBKML: the legacy KML reader only
 * keeps Name and Description.
 */
const char* driverName(GeodataFormat format) {
    switch (format) {
        case GeodataFormat::GEOJSON: return "GeoJSON";
        case GeodataFormat::KML: return "LIBKML";
        case GeodataFormat::GPKG: return "GPKG";
        case GeodataFormat::SHAPEFILE: return "ESRI Shapefile";
    }
    return "GeoJSON";
}

GDALDriver* writerFor(GeodataFormat format) {
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(driverName(format));
    if (!driver) {
        GEOBRIDGE_THROW(OperationFailedException, "encode",
                        std::string("GDAL driver ") + driverName(format) + " is not available for " + toString(format));
    }
    return driver;
}

/**
 * KML SchemaData has no 64-bit integer type. Integer columns are written as
 * "int" when every value fits, otherwise as text to keep the digits.
 */
OGRFieldType kmlIntegerType(const FeatureTable& table, const std::string& field) {
    for (const auto& row : table.rows()) {
        auto it = row.attributes.find(field);
        if (it == row.attributes.end()) {
            continue;
        }
        if (auto i = std::get_if<std::int64_t>(&it->second)) {
            if (*i < std::numeric_limits<std::int32_t>::min() || *i > std::numeric_limits<std::int32_t>::max()) {
                return OFTString;
            }
        }
    }
    return OFTInteger;
}

// Placemark properties LIBKML exposes as columns on every layer
const std::set<std::string>& kmlPresentationFields() {
    static const std::set<std::string> kFields = {
        "name", "description", "timestamp", "begin", "end", "altitudeMode",
        "tessellate", "extrude", "visibility", "drawOrder", "icon", "snippet"};
    return kFields;
}

bool carriesNoData(const AttributeValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return true;
    }
    if (auto i = std::get_if<std::int64_t>(&value)) {
        return *i == -1;   // LIBKML's "unset" for tessellate/extrude/visibility
    }
    if (auto s = std::get_if<std::string>(&value)) {
        return s->empty();
    }
    return false;
}

void dropUnusedKmlFields(FeatureTable& table) {
    std::vector<std::string> unused;
    for (const auto& field : table.fields()) {
        if (!kmlPresentationFields().count(field.name)) {
            continue;
        }
        const bool empty = std::all_of(table.rows().begin(), table.rows().end(), [&field](const FeatureRow& row) {
            auto it = row.attributes.find(field.name);
            return it == row.attributes.end() || carriesNoData(it->second);
        });
        if (empty) {
            unused.push_back(field.name);
        }
    }
    for (const auto& name : unused) {
        table.removeField(name);
    }
}

std::string outputFileName(GeodataFormat format) {
    switch (format) {
        case GeodataFormat::GEOJSON: return std::string(kLayerName) + ".geojson";
        case GeodataFormat::KML: return std::string(kLayerName) + ".kml";
        case GeodataFormat::GPKG: return std::string(kLayerName) + ".gpkg";
        case GeodataFormat::SHAPEFILE: return std::string(kLayerName) + ".shp";
    }
    return std::string(kLayerName) + ".geojson";
}

/**
 * Shapefile layers hold a single geometry family. Multi-part variants are
 * used as soon as one row needs them.
 */
OGRwkbGeometryType shapefileGeometryType(const FeatureTable& table) {
    std::set<OGRwkbGeometryType> families;
    bool anyMulti = false;
    for (const auto& row : table.rows()) {
        const auto type = wkbFlatten(row.geometry->getGeometryType());
        switch (type) {
            case wkbPoint: families.insert(wkbPoint); break;
            case wkbMultiPoint: families.insert(wkbPoint); anyMulti = true; break;
            case wkbLineString: families.insert(wkbLineString); break;
            case wkbMultiLineString: families.insert(wkbLineString); anyMulti = true; break;
            case wkbPolygon: families.insert(wkbPolygon); break;
            case wkbMultiPolygon: families.insert(wkbPolygon); anyMulti = true; break;
            default:
                GEOBRIDGE_THROW(InvalidParameterException, "output_format",
                                std::string("shapefile cannot store geometry type ") +
                                row.geometry->getGeometryName());
        }
    }
    if (families.size() > 1) {
        GEOBRIDGE_THROW(InvalidParameterException, "output_format",
                        "shapefile cannot mix point, line and polygon geometries");
    }
    const auto family = families.empty() ? wkbPoint : *families.begin();
    if (!anyMulti) {
        return family;
    }
    return OGR_GT_GetCollection(family);
}

bool isBase64Char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

} // anonymous namespace

GeodataFormat FormatCodec::parseFormat(const std::string& format) {
    const std::string key = StringUtils::toLower(StringUtils::trim(format));
    if (key == "geojson" || key == "json") return GeodataFormat::GEOJSON;
    if (key == "kml") return GeodataFormat::KML;
    if (key == "gpkg") return GeodataFormat::GPKG;
    if (key == "shapefile") return GeodataFormat::SHAPEFILE;
    GEOBRIDGE_THROW(UnsupportedFormatException, format);
}

GeodataFormat FormatCodec::parseOutputFormat(const std::optional<std::string>& format) {
    if (!format || format->empty()) {
        return GeodataFormat::GEOJSON;
    }
    return parseFormat(*format);
}

std::string FormatCodec::encodeBase64(const std::string& bytes) {
    char* encoded = CPLBase64Encode(static_cast<int>(bytes.size()),
                                    reinterpret_cast<const GByte*>(bytes.data()));
    if (!encoded) {
        GEOBRIDGE_THROW(OperationFailedException, "encode", "base64 encoding failed");
    }
    std::string result(encoded);
    CPLFree(encoded);
    return result;
}

std::string FormatCodec::decodeBase64(const std::string& text) {
    std::string compact;
    compact.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact.push_back(c);
        }
    }

    bool valid = !compact.empty() && compact.size() % 4 == 0;
    std::size_t padding = 0;
    for (std::size_t i = 0; valid && i < compact.size(); ++i) {
        const char c = compact[i];
        if (c == '=') {
            ++padding;
            valid = i >= compact.size() - 2;
        } else {
            valid = padding == 0 && isBase64Char(c);
        }
    }
    if (!valid) {
        GEOBRIDGE_THROW(InvalidParameterException, "data", "binary formats expect a base64 encoded payload");
    }

    const int length = CPLBase64DecodeInPlace(reinterpret_cast<GByte*>(&compact[0]));
    compact.resize(static_cast<std::size_t>(length));
    return compact;
}

FeatureTable FormatCodec::load(const std::string& data,
                               const std::string& format,
                               const std::optional<std::string>& sourceCrs) {
    const GeodataFormat fmt = parseFormat(format);
    if (data.empty()) {
        GEOBRIDGE_THROW(MissingParameterException, "data");
    }
    // Parse the override before any decoding so a bad CRS string fails fast.
    std::optional<crs::SpatialReference> overrideCrs;
    if (sourceCrs && !sourceCrs->empty()) {
        overrideCrs = crs::SpatialReference::fromUserInput(*sourceCrs);
    }
    const std::string bytes = isBinaryFormat(fmt) ? decodeBase64(data) : data;

    ensureGdal();
    VsiStagingArea staging;

    std::string openPath;
    switch (fmt) {
        case GeodataFormat::GEOJSON:
            staging.writeFile("input.geojson", bytes);
            openPath = staging.path("input.geojson");
            break;
        case GeodataFormat::KML:
            staging.writeFile("input.kml", bytes);
            openPath = staging.path("input.kml");
            break;
        case GeodataFormat::GPKG:
            staging.writeFile("input.gpkg", bytes);
            openPath = staging.path("input.gpkg");
            break;
        case GeodataFormat::SHAPEFILE:
            staging.writeFile("input.zip", bytes);
            openPath = "/vsizip/" + staging.path("input.zip");
            break;
    }

    const char* const drivers[] = {driverName(fmt), nullptr};
    GDALDatasetUniquePtr dataset(GDALDataset::Open(openPath.c_str(),
                                                   GDAL_OF_VECTOR | GDAL_OF_READONLY,
                                                   drivers, nullptr, nullptr));
    if (!dataset) {
        GEOBRIDGE_THROW(InvalidParameterException, "data",
                        "payload cannot be read as " + toString(fmt) + ": " + impl::GdalEnvironment::lastError());
    }
    if (dataset->GetLayerCount() == 0) {
        GEOBRIDGE_THROW(EmptyResultException, "The input contains no layer");
    }

    OGRLayer* layer = dataset->GetLayer(0);
    OGRFeatureDefn* defn = layer->GetLayerDefn();

    FeatureTable table;
    std::vector<FieldType> types;
    for (int i = 0; i < defn->GetFieldCount(); ++i) {
        const OGRFieldDefn* field = defn->GetFieldDefn(i);
        types.push_back(toFieldType(*field));
        table.addField(FieldDefinition{field->GetNameRef(), types.back()});
    }

    std::size_t totalRows = 0;
    for (auto& feature : *layer) {
        ++totalRows;
        FeatureRow row;
        for (int i = 0; i < defn->GetFieldCount(); ++i) {
            row.attributes[defn->GetFieldDefn(i)->GetNameRef()] = readField(*feature, i, types[i]);
        }
        row.geometry.reset(feature->StealGeometry());
        if (row.geometry) {
            row.geometry->flattenTo2D();
        }
        table.addRow(std::move(row));
    }

    if (totalRows == 0) {
        GEOBRIDGE_THROW(EmptyResultException, "The input contains no features");
    }
    const std::size_t dropped = table.dropNullGeometries();
    if (table.empty()) {
        GEOBRIDGE_THROW(EmptyResultException, "All geometries of the input are null");
    }

    if (fmt == GeodataFormat::KML) {
        dropUnusedKmlFields(table);
    }

    if (overrideCrs) {
        table.setCrs(std::move(overrideCrs));
    } else if (const OGRSpatialReference* srs = layer->GetSpatialRef()) {
        table.setCrs(crs::SpatialReference::fromOgr(*srs));
    }

    GEOBRIDGE_LOG_DEBUG("FormatCodec", "Loaded {} features from {} ({} without geometry dropped)",
                        table.size(), toString(fmt), dropped);
    return table;
}

GeodataEnvelope FormatCodec::dump(FeatureTable table, GeodataFormat format) {
    table.dropNullGeometries();
    if (table.empty()) {
        GEOBRIDGE_THROW(EmptyResultException, "The result is empty after the requested operation");
    }

    if (format == GeodataFormat::KML) {
        const auto wgs84 = crs::SpatialReference::fromUserInput("EPSG:4326");
        if (table.crs()) {
            table = crs::CrsReconciler::reproject(std::move(table), wgs84);
        } else {
            GEOBRIDGE_LOG_WARN("FormatCodec", "KML output of data without CRS, coordinates written as-is");
            table.setCrs(wgs84);
        }
    }

    const OGRwkbGeometryType layerType =
        format == GeodataFormat::SHAPEFILE ? shapefileGeometryType(table) : wkbUnknown;

    ensureGdal();
    VsiStagingArea staging;
    const std::string fileName = outputFileName(format);

    {
        GDALDriver* driver = writerFor(format);
        GDALDatasetUniquePtr dataset(driver->Create(staging.path(fileName).c_str(), 0, 0, 0, GDT_Unknown, nullptr));
        if (!dataset) {
            GEOBRIDGE_THROW(OperationFailedException, "encode",
                            "cannot create " + toString(format) + " dataset: " + impl::GdalEnvironment::lastError());
        }

        std::optional<OGRSpatialReference> srs;
        if (table.crs()) {
            srs.emplace(*table.crs()->get());
        }
        OGRLayer* layer = dataset->CreateLayer(kLayerName, srs ? &*srs : nullptr, layerType, nullptr);
        if (!layer) {
            GEOBRIDGE_THROW(OperationFailedException, "encode", std::string("cannot create layer: ") + impl::GdalEnvironment::lastError());
        }

        const auto& fields = table.fields();
        for (const auto& field : fields) {
            OGRFieldDefn defn(field.name.c_str(), OFTString);
            configureOgrField(defn, field.type);
            if (format == GeodataFormat::KML && field.type == FieldType::INTEGER) {
                defn.SetType(kmlIntegerType(table, field.name));
            }
            if (layer->CreateField(&defn, TRUE) != OGRERR_NONE) {
                GEOBRIDGE_THROW(OperationFailedException, "encode", "cannot create field '" + field.name + "'");
            }
        }

        for (const auto& row : table.rows()) {
            OGRFeatureUniquePtr feature(OGRFeature::CreateFeature(layer->GetLayerDefn()));
            for (std::size_t i = 0; i < fields.size(); ++i) {
                auto it = row.attributes.find(fields[i].name);
                writeField(*feature, static_cast<int>(i),
                           it == row.attributes.end() ? AttributeValue{} : it->second);
            }
            feature->SetGeometry(row.geometry.get());
            if (layer->CreateFeature(feature.get()) != OGRERR_NONE) {
                GEOBRIDGE_THROW(OperationFailedException, "encode",
                                std::string("cannot write feature: ") + impl::GdalEnvironment::lastError());
            }
        }
    } // dataset closed and flushed here

    GeodataEnvelope envelope;
    envelope.format = format;
    envelope.encoding = encodingFor(format);
    envelope.crs = crsIdentifier(table);

    switch (format) {
        case GeodataFormat::GEOJSON:
        case GeodataFormat::KML:
            envelope.payload = staging.readFile(fileName);
            break;
        case GeodataFormat::GPKG:
            envelope.payload = encodeBase64(staging.readFile(fileName));
            break;
        case GeodataFormat::SHAPEFILE: {
            std::vector<std::string> parts;
            for (const auto& name : staging.listFiles()) {
                if (StringUtils::startsWith(name, std::string(kLayerName) + ".")) {
                    parts.push_back(name);
                }
            }
            staging.zipFiles(parts, "archive.zip");
            envelope.payload = encodeBase64(staging.readFile("archive.zip"));
            break;
        }
    }

    GEOBRIDGE_LOG_DEBUG("FormatCodec", "Encoded {} features as {}", table.size(), toString(format));
    return envelope;
}

std::optional<std::string> FormatCodec::crsIdentifier(const FeatureTable& table) {
    if (!table.crs()) {
        return std::nullopt;
    }
    return table.crs()->toIdentifier();
}

} // namespace geobridge::core_services::geo_processing::codec
