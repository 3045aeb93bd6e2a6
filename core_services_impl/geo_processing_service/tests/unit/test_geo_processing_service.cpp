/**
 * @file test_geo_processing_service.cpp
 * @brief 地理处理服务（工厂 + 异步接口）单元测试
 *
 * 🎯 测试目标：
 * ✅ 工厂配置校验与线程池注入
 * ✅ future 交付结果与类型化异常
 * ✅ 并发请求互不干扰
 */

#include <gtest/gtest.h>

#include "core_services/geo_processing/geo_processing_service_factory.h"
#include "core_services/geo_processing/geo_processing_exceptions.h"
#include "common_utils/infrastructure/unified_thread_pool_manager.h"
#include "codec/format_codec.h"
#include "test_geodata.h"

#include <algorithm>
#include <memory>
#include <vector>

using namespace geobridge::core_services;
using namespace geobridge::core_services::geo_processing;
using geobridge::common_utils::infrastructure::UnifiedThreadPoolManager;
using geobridge::core_services::geo_processing::codec::FormatCodec;
namespace test_data = geobridge::test_data;

class GeoProcessingServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        UnifiedThreadPoolManager::PoolConfiguration poolConfig;
        poolConfig.threadCount = 2;
        threadPool = std::make_shared<UnifiedThreadPoolManager>(poolConfig);
        service = GeoProcessingServiceFactory::createService(GeoProcessingServiceFactory::getDefaultConfig(),
                                                             threadPool);
    }

    std::shared_ptr<UnifiedThreadPoolManager> threadPool;
    std::unique_ptr<IGeoProcessingService> service;
};

TEST_F(GeoProcessingServiceTest, ReportsReadyAndCapabilities) {
    ASSERT_TRUE(service);
    EXPECT_TRUE(service->isReady());
    EXPECT_FALSE(service->getVersion().empty());

    auto capabilities = service->getCapabilities().get();
    for (const char* name : {"reproject", "buffer", "intersect", "clip", "convert", "bbox", "dissolve",
                             "explode", "geojson", "kml", "gpkg", "shapefile"}) {
        EXPECT_NE(std::find(capabilities.begin(), capabilities.end(), name), capabilities.end()) << name;
    }
}

TEST_F(GeoProcessingServiceTest, FactoryRejectsInvalidConfiguration) {
    GeoProcessingConfig config;
    config.defaultResolution = 0;
    EXPECT_FALSE(GeoProcessingServiceFactory::validateConfig(config));
    EXPECT_THROW(GeoProcessingServiceFactory::createService(config, threadPool), ServiceCreationException);
    EXPECT_THROW(GeoProcessingServiceFactory::createService(GeoProcessingConfig{}, nullptr),
                 ServiceCreationException);
}

TEST_F(GeoProcessingServiceTest, FactoryWithoutPoolCreatesOwnPool) {
    GeoProcessingConfig config;
    config.workerThreads = 0;
    auto own = GeoProcessingServiceFactory::createService(config);
    ASSERT_TRUE(own);
    EXPECT_TRUE(own->isReady());
    EXPECT_EQ(own->bbox(BboxRequest{test_data::kSquares, "geojson"}).get().maxX, 11.0);
}

TEST_F(GeoProcessingServiceTest, FutureDeliversEnvelope) {
    ConvertRequest request{test_data::kSquares, "geojson", "gpkg"};
    auto envelope = service->convert(request).get();
    EXPECT_EQ(envelope.format, GeodataFormat::GPKG);
    EXPECT_EQ(envelope.encoding, DataEncoding::BASE64);
    EXPECT_EQ(envelope.crs, std::optional<std::string>("EPSG:4326"));
    EXPECT_EQ(FormatCodec::load(envelope.payload, "gpkg").size(), 3u);
}

TEST_F(GeoProcessingServiceTest, FutureCarriesTypedExceptions) {
    ReprojectRequest missingTarget{test_data::kSquares, "geojson", std::nullopt};
    EXPECT_THROW(service->reproject(missingTarget).get(), MissingParameterException);

    ConvertRequest badFormat{test_data::kSquares, "csv", "geojson"};
    EXPECT_THROW(service->convert(badFormat).get(), UnsupportedFormatException);

    ExplodeRequest empty;
    empty.data = test_data::kEmptyCollection;
    empty.inputFormat = "geojson";
    try {
        service->explode(empty).get();
        FAIL() << "expected EmptyResultException";
    } catch (const GeoProcessingException& e) {
        EXPECT_EQ(e.getErrorCode(), "EMPTY_RESULT");
    }
}

TEST_F(GeoProcessingServiceTest, ConcurrentRequestsAreIndependent) {
    std::vector<boost::future<BoundingBox>> boxes;
    std::vector<boost::future<GeodataEnvelope>> dissolved;
    for (int i = 0; i < 8; ++i) {
        boxes.push_back(service->bbox(BboxRequest{test_data::kDiamond, "geojson"}));
        DissolveRequest request;
        request.data = test_data::kSquares;
        request.inputFormat = "geojson";
        request.by = "group";
        dissolved.push_back(service->dissolve(request));
    }
    for (auto& f : boxes) {
        const auto box = f.get();
        EXPECT_DOUBLE_EQ(box.minX, -1.0);
        EXPECT_DOUBLE_EQ(box.maxY, 1.0);
    }
    for (auto& f : dissolved) {
        EXPECT_EQ(FormatCodec::load(f.get().payload, "geojson").size(), 2u);
    }
}

TEST_F(GeoProcessingServiceTest, SingleThreadModeRunsInline) {
    threadPool->setRunMode(UnifiedThreadPoolManager::RunMode::SINGLE_THREAD);
    auto future = service->bbox(BboxRequest{test_data::kSquares, "geojson"});
    EXPECT_TRUE(future.is_ready());
    EXPECT_DOUBLE_EQ(future.get().minX, 0.0);
}
