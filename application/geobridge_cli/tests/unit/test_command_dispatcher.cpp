/**
 * @file test_command_dispatcher.cpp
 * @brief 命令分发测试：选项解析、@文件载荷、缓存命令流程
 */

#include <gtest/gtest.h>

#include "app/command_dispatcher.h"
#include "core_services/geo_processing/geo_processing_exceptions.h"
#include "core_services/geo_processing/geo_processing_service_factory.h"
#include "core_services/result_cache/result_cache.h"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <filesystem>
#include <fstream>
#include <memory>

using namespace geobridge::application;
using namespace geobridge::core_services::geo_processing;
using geobridge::core_services::result_cache::CacheConfig;
using geobridge::core_services::result_cache::ResultCache;
using nlohmann::json;
namespace fs = std::filesystem;

namespace {

const std::string kTriangle = R"({"type":"FeatureCollection","features":[
  {"type":"Feature","properties":{"name":"t"},
   "geometry":{"type":"Polygon","coordinates":[[[0,0],[4,0],[0,3],[0,0]]]}}]})";

json routeResult(std::size_t points) {
    json coords = json::array();
    for (std::size_t i = 0; i < points; ++i) {
        coords.push_back({static_cast<double>(i), 0.0});
    }
    return {{"distance", 10.0}, {"geometry", {{"type", "LineString"}, {"coordinates", coords}}}};
}

} // anonymous namespace

class CommandDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("geobridge_cli_test_" + boost::uuids::to_string(boost::uuids::random_generator()()));
        CacheConfig config;
        config.rootDirectory = dir / "cache";
        cache = std::make_shared<ResultCache>(config);
        GeoProcessingConfig processing;
        processing.workerThreads = 1;
        dispatcher = std::make_unique<CommandDispatcher>(
            std::shared_ptr<IGeoProcessingService>(GeoProcessingServiceFactory::createService(processing)), cache);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
    std::shared_ptr<ResultCache> cache;
    std::unique_ptr<CommandDispatcher> dispatcher;
};

TEST_F(CommandDispatcherTest, BboxCommandReturnsBoundsDocument) {
    const json out = dispatcher->execute("bbox", {{"data", kTriangle}, {"input_format", "geojson"}});
    EXPECT_EQ(out["format"], "bbox");
    EXPECT_DOUBLE_EQ(out["bounds"]["maxx"].get<double>(), 4.0);
    EXPECT_DOUBLE_EQ(out["bounds"]["maxy"].get<double>(), 3.0);
    EXPECT_EQ(out["crs"], "EPSG:4326");
}

TEST_F(CommandDispatcherTest, DataOptionReadsFileWithAtPrefix) {
    const fs::path file = dir / "triangle.geojson";
    fs::create_directories(dir);
    std::ofstream(file) << kTriangle;

    const json out = dispatcher->execute(
        "convert", {{"data", "@" + file.string()}, {"input_format", "geojson"}, {"output_format", "kml"}});
    EXPECT_EQ(out["format"], "kml");
    EXPECT_EQ(out["encoding"], "utf8");
    EXPECT_NE(out["payload"].get<std::string>().find("<kml"), std::string::npos);

    EXPECT_THROW(dispatcher->execute("bbox", {{"data", "@" + (dir / "missing.json").string()},
                                              {"input_format", "geojson"}}),
                 InvalidParameterException);
}

TEST_F(CommandDispatcherTest, OptionsAreValidated) {
    EXPECT_THROW(dispatcher->execute("bbox", {{"input_format", "geojson"}}), MissingParameterException);
    EXPECT_THROW(dispatcher->execute("buffer", {{"data", kTriangle}, {"input_format", "geojson"},
                                                {"distance", "ten"}}),
                 InvalidParameterException);
    EXPECT_THROW(dispatcher->execute("explode", {{"data", kTriangle}, {"input_format", "geojson"},
                                                 {"keep_index", "maybe"}}),
                 InvalidParameterException);
    EXPECT_THROW(dispatcher->execute("dissolve", {{"data", kTriangle}, {"input_format", "geojson"},
                                                  {"aggregate", "name"}}),
                 InvalidParameterException);
    EXPECT_THROW(dispatcher->execute("teleport", {}), InvalidParameterException);
}

TEST_F(CommandDispatcherTest, ServiceErrorsKeepTheirCodes) {
    try {
        dispatcher->execute("reproject", {{"data", kTriangle}, {"input_format", "geojson"}});
        FAIL() << "expected MissingParameterException";
    } catch (const GeoProcessingException& e) {
        EXPECT_EQ(e.getErrorCode(), "MISSING_PARAMETER");
    }
}

TEST_F(CommandDispatcherTest, CacheCommandsRoundTrip) {
    const json put = dispatcher->execute(
        "cache-put", {{"tool_name", "calculate_route"}, {"data", routeResult(300).dump()}, {"params", R"({"p":1})"}});
    ASSERT_EQ(put["cached"], true);
    const std::string cacheId = put["cache_id"];

    const json entry = dispatcher->execute("cache-get", {{"cache_id", cacheId}});
    EXPECT_EQ(entry["tool_name"], "calculate_route");
    EXPECT_EQ(entry["params"]["p"], 1);

    const json listing = dispatcher->execute("cache-list", {});
    EXPECT_EQ(listing["count"], 1);

    const json sample = dispatcher->execute("cache-sample", {{"cache_id", cacheId}, {"max_points", "20"}});
    EXPECT_EQ(sample["coordinates"].size(), 20u);
    EXPECT_EQ(sample["sampling_ratio"], "20/300");

    const fs::path target = dir / "out" / "route.json";
    const json exported = dispatcher->execute("cache-export", {{"cache_id", cacheId}, {"output_path", target.string()}});
    EXPECT_EQ(exported["success"], true);
    EXPECT_TRUE(fs::exists(target));

    const json cleared = dispatcher->execute("cache-clear", {});
    EXPECT_EQ(cleared["removed"], 2);
    EXPECT_THROW(dispatcher->execute("cache-get", {{"cache_id", cacheId}}), CacheEntryNotFoundException);
}

TEST_F(CommandDispatcherTest, SmallResultsAreReturnedInlineUnlessForced) {
    const json small = {{"answer", 42}};
    const json inlineOut = dispatcher->execute("cache-put", {{"tool_name", "lookup"}, {"data", small.dump()}});
    EXPECT_EQ(inlineOut["cached"], false);
    EXPECT_EQ(inlineOut["result"], small);

    const json forced = dispatcher->execute(
        "cache-put", {{"tool_name", "lookup"}, {"data", small.dump()}, {"force", "true"}});
    EXPECT_EQ(forced["cached"], true);

    EXPECT_THROW(dispatcher->execute("cache-put", {{"tool_name", "lookup"}, {"data", "{oops"}}),
                 InvalidParameterException);
}

TEST(CommandDispatcherErrorTest, ErrorDocumentShape) {
    const json doc = CommandDispatcher::errorDocument("NOT_FOUND", "gone");
    EXPECT_EQ(doc["error"]["code"], "NOT_FOUND");
    EXPECT_EQ(doc["error"]["message"], "gone");
}
