/**
 * @file test_format_codec.cpp
 * @brief 格式编解码单元测试 - 基于真实GDAL驱动
 *
 * 🎯 测试目标：
 * ✅ 格式名称解析（大小写、json别名、不支持的格式）
 * ✅ 四种格式的加载与导出
 * ✅ source_crs 覆盖、空几何过滤、空结果错误
 */

#include <gtest/gtest.h>

#include "codec/format_codec.h"
#include "engine/feature_table.h"
#include "core_services/geo_processing/geo_processing_exceptions.h"
#include "test_geodata.h"

#include <cstdint>
#include <string>
#include <variant>

using namespace geobridge::core_services;
using namespace geobridge::core_services::geo_processing;
using geobridge::core_services::geo_processing::codec::FormatCodec;
using geobridge::core_services::geo_processing::engine::FeatureTable;
namespace test_data = geobridge::test_data;

namespace {

std::string stringAttribute(const FeatureTable& table, std::size_t row, const std::string& name) {
    const auto& value = table.rows().at(row).attributes.at(name);
    return std::get<std::string>(value);
}

} // anonymous namespace

class FormatCodecTest : public ::testing::Test {};

// ========== 格式名称 ==========

TEST_F(FormatCodecTest, ParseFormatIsCaseInsensitiveAndAliasesJson) {
    EXPECT_EQ(FormatCodec::parseFormat("GeoJSON"), GeodataFormat::GEOJSON);
    EXPECT_EQ(FormatCodec::parseFormat("json"), GeodataFormat::GEOJSON);
    EXPECT_EQ(FormatCodec::parseFormat("JSON"), GeodataFormat::GEOJSON);
    EXPECT_EQ(FormatCodec::parseFormat("KML"), GeodataFormat::KML);
    EXPECT_EQ(FormatCodec::parseFormat("gpkg"), GeodataFormat::GPKG);
    EXPECT_EQ(FormatCodec::parseFormat("Shapefile"), GeodataFormat::SHAPEFILE);
}

TEST_F(FormatCodecTest, ParseFormatRejectsUnknownNames) {
    EXPECT_THROW(FormatCodec::parseFormat("csv"), UnsupportedFormatException);
    EXPECT_THROW(FormatCodec::parseFormat(""), UnsupportedFormatException);

    try {
        FormatCodec::parseFormat("topojson");
        FAIL() << "expected UnsupportedFormatException";
    } catch (const UnsupportedFormatException& e) {
        EXPECT_EQ(e.getErrorCode(), "UNSUPPORTED_FORMAT");
    }
}

TEST_F(FormatCodecTest, OutputFormatDefaultsToGeoJson) {
    EXPECT_EQ(FormatCodec::parseOutputFormat(std::nullopt), GeodataFormat::GEOJSON);
    EXPECT_EQ(FormatCodec::parseOutputFormat(std::string("gpkg")), GeodataFormat::GPKG);
}

// ========== base64 ==========

TEST_F(FormatCodecTest, Base64RoundTripKeepsBinaryBytes) {
    const std::string bytes("PK\x03\x04\x00\xff binary", 13);
    const std::string encoded = FormatCodec::encodeBase64(bytes);
    EXPECT_EQ(FormatCodec::decodeBase64(encoded), bytes);
}

TEST_F(FormatCodecTest, InvalidBase64IsRejectedBeforeParsing) {
    EXPECT_THROW(FormatCodec::decodeBase64("not base64 !!"), InvalidParameterException);
    EXPECT_THROW(FormatCodec::decodeBase64("abc"), InvalidParameterException);
    EXPECT_THROW(FormatCodec::load("%%%%", "gpkg"), InvalidParameterException);
    EXPECT_THROW(FormatCodec::load("a=bc", "shapefile"), InvalidParameterException);
}

// ========== 加载 ==========

TEST_F(FormatCodecTest, LoadGeoJsonReadsRowsFieldsAndEmbeddedCrs) {
    auto table = FormatCodec::load(test_data::kSquares, "geojson");

    ASSERT_EQ(table.size(), 3u);
    EXPECT_TRUE(table.hasField("name"));
    EXPECT_EQ(table.fieldType("value"), FieldType::INTEGER);
    EXPECT_EQ(table.fieldType("weight"), FieldType::REAL);
    EXPECT_EQ(stringAttribute(table, 1, "name"), "b");

    // GeoJSON 默认为 WGS84
    ASSERT_TRUE(table.crs().has_value());
    EXPECT_EQ(FormatCodec::crsIdentifier(table), std::optional<std::string>("EPSG:4326"));
}

TEST_F(FormatCodecTest, SourceCrsOverridesEmbeddedCrs) {
    auto table = FormatCodec::load(test_data::kLines, "json", std::string("EPSG:2154"));
    EXPECT_EQ(FormatCodec::crsIdentifier(table), std::optional<std::string>("EPSG:2154"));
}

TEST_F(FormatCodecTest, UnparseableSourceCrsIsInvalidParameter) {
    EXPECT_THROW(FormatCodec::load(test_data::kLines, "geojson", std::string("EPSG:not-a-code")),
                 InvalidParameterException);
}

TEST_F(FormatCodecTest, NullGeometriesAreDropped) {
    auto table = FormatCodec::load(test_data::kWithNullGeometry, "geojson");
    ASSERT_EQ(table.size(), 1u);
    EXPECT_EQ(stringAttribute(table, 0, "name"), "solid");
}

TEST_F(FormatCodecTest, InputWithoutUsableRowsIsEmptyResult) {
    EXPECT_THROW(FormatCodec::load(test_data::kOnlyNullGeometry, "geojson"), EmptyResultException);
    EXPECT_THROW(FormatCodec::load(test_data::kEmptyCollection, "geojson"), EmptyResultException);
}

TEST_F(FormatCodecTest, UnreadablePayloadIsInvalidParameter) {
    EXPECT_THROW(FormatCodec::load("this is not geojson", "geojson"), InvalidParameterException);
    EXPECT_THROW(FormatCodec::load("", "geojson"), MissingParameterException);
}

// ========== 导出 ==========

TEST_F(FormatCodecTest, DumpGeoJsonProducesUtf8EnvelopeWithCrs) {
    auto envelope = FormatCodec::dump(FormatCodec::load(test_data::kSquares, "geojson"));

    EXPECT_EQ(envelope.format, GeodataFormat::GEOJSON);
    EXPECT_EQ(envelope.encoding, DataEncoding::UTF8);
    EXPECT_EQ(envelope.crs, std::optional<std::string>("EPSG:4326"));
    EXPECT_NE(envelope.payload.find("FeatureCollection"), std::string::npos);

    nlohmann::json j = envelope;
    EXPECT_EQ(j["format"], "geojson");
    EXPECT_EQ(j["encoding"], "utf8");
    EXPECT_TRUE(j.contains("payload"));
}

TEST_F(FormatCodecTest, DumpOfEmptyTableIsEmptyResult) {
    FeatureTable table;
    EXPECT_THROW(FormatCodec::dump(std::move(table)), EmptyResultException);
}

TEST_F(FormatCodecTest, BinaryFormatsAreBase64AndReloadable) {
    for (auto format : {GeodataFormat::GPKG, GeodataFormat::SHAPEFILE}) {
        SCOPED_TRACE(toString(format));
        auto envelope = FormatCodec::dump(FormatCodec::load(test_data::kLines, "geojson",
                                                            std::string("EPSG:2154")), format);
        EXPECT_EQ(envelope.encoding, DataEncoding::BASE64);
        EXPECT_EQ(envelope.crs, std::optional<std::string>("EPSG:2154"));

        auto reloaded = FormatCodec::load(envelope.payload, toString(format));
        ASSERT_EQ(reloaded.size(), 2u);
        EXPECT_EQ(stringAttribute(reloaded, 0, "road"), "N7");
        EXPECT_EQ(stringAttribute(reloaded, 1, "road"), "A6");
        EXPECT_EQ(FormatCodec::crsIdentifier(reloaded), std::optional<std::string>("EPSG:2154"));
    }
}

TEST_F(FormatCodecTest, ShapefileRejectsMixedGeometryFamilies) {
    auto table = FormatCodec::load(test_data::kMixedFamilies, "geojson");
    EXPECT_THROW(FormatCodec::dump(std::move(table), GeodataFormat::SHAPEFILE), InvalidParameterException);
}

TEST_F(FormatCodecTest, KmlOutputIsAlwaysWgs84) {
    auto table = FormatCodec::load(test_data::kLines, "geojson", std::string("EPSG:3857"));
    auto envelope = FormatCodec::dump(std::move(table), GeodataFormat::KML);

    EXPECT_EQ(envelope.encoding, DataEncoding::UTF8);
    EXPECT_EQ(envelope.crs, std::optional<std::string>("EPSG:4326"));
    EXPECT_NE(envelope.payload.find("<kml"), std::string::npos);

    auto reloaded = FormatCodec::load(envelope.payload, "kml");
    EXPECT_EQ(reloaded.size(), 2u);
}

TEST_F(FormatCodecTest, KmlKeepsIntegersThatOverflowInt32AsText) {
    auto table = FormatCodec::load(R"({"type":"FeatureCollection","features":[
        {"type":"Feature","properties":{"small":7,"big":5000000000},
         "geometry":{"type":"Point","coordinates":[1,2]}}]})", "geojson");
    auto reloaded = FormatCodec::load(FormatCodec::dump(std::move(table), GeodataFormat::KML).payload, "kml");

    ASSERT_EQ(reloaded.size(), 1u);
    const auto& attributes = reloaded.rows()[0].attributes;
    ASSERT_TRUE(attributes.count("small"));
    ASSERT_TRUE(std::holds_alternative<std::int64_t>(attributes.at("small")));
    EXPECT_EQ(std::get<std::int64_t>(attributes.at("small")), 7);
    ASSERT_TRUE(attributes.count("big"));
    ASSERT_TRUE(std::holds_alternative<std::string>(attributes.at("big")));
    EXPECT_EQ(std::get<std::string>(attributes.at("big")), "5000000000");
}

TEST(FeatureTableTest, RemoveFieldDropsColumnAndValues) {
    auto table = FormatCodec::load(test_data::kSquares, "geojson");
    table.removeField("weight");
    EXPECT_FALSE(table.hasField("weight"));
    for (const auto& row : table.rows()) {
        EXPECT_FALSE(row.attributes.count("weight"));
        EXPECT_TRUE(row.attributes.count("value"));
    }
}
