/**
 * @file test_geobridge_config_factory.cpp
 * @brief 配置键到服务配置结构的映射测试
 */

#include <gtest/gtest.h>

#include "app/geobridge_config_factory.h"
#include "common_utils/utilities/exceptions.h"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace geobridge::application;
using geobridge::common_utils::AppConfigLoader;
using geobridge::common_utils::ConfigurationException;
namespace fs = std::filesystem;

class GeoBridgeConfigFactoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("GEOBRIDGE_CACHE_TTL_HOURS");
        GeoBridgeConfigFactory::registerDefaults(loader);
    }

    void TearDown() override {
        unsetenv("GEOBRIDGE_CACHE_TTL_HOURS");
    }

    AppConfigLoader loader;
};

TEST_F(GeoBridgeConfigFactoryTest, DefaultsMatchServiceDefaults) {
    const auto settings = GeoBridgeConfigFactory::build(loader);

    EXPECT_GE(settings.processing.workerThreads, 1u);
    EXPECT_EQ(settings.processing.defaultResolution, 16);
    EXPECT_EQ(settings.cache.ttl, std::chrono::hours(24));
    EXPECT_EQ(settings.cache.inlineSizeLimitBytes, 10240u);
    EXPECT_EQ(settings.cache.featureCountLimit, 50u);
    EXPECT_EQ(settings.cache.rootDirectory.filename(), "cache");
    EXPECT_EQ(settings.logging.level, "info");
    EXPECT_FALSE(settings.logging.writesFile());
}

TEST_F(GeoBridgeConfigFactoryTest, OverridesFollowSourcePrecedence) {
    const fs::path file = fs::temp_directory_path() / "geobridge_factory_test.json";
    {
        std::ofstream out(file);
        out << R"({"cache": {"ttl_hours": 6, "root_dir": "/tmp/geobridge-factory"},
                   "processing": {"default_resolution": 8}})";
    }
    ASSERT_TRUE(loader.loadFromFile(file));
    setenv("GEOBRIDGE_CACHE_TTL_HOURS", "3", 1);
    loader.loadFromEnvironment("GEOBRIDGE_");
    loader.loadFromCommandLine({"--processing.default_resolution=4", "--logging.file=/tmp/geobridge.log"});

    const auto settings = GeoBridgeConfigFactory::build(loader);
    EXPECT_EQ(settings.cache.ttl, std::chrono::hours(3));
    EXPECT_EQ(settings.cache.rootDirectory, fs::path("/tmp/geobridge-factory"));
    EXPECT_EQ(settings.processing.defaultResolution, 4);
    EXPECT_TRUE(settings.logging.writesFile());
    EXPECT_EQ(settings.logging.filePath, "/tmp/geobridge.log");

    std::error_code ec;
    fs::remove(file, ec);
}

TEST_F(GeoBridgeConfigFactoryTest, HomeDirectoryIsExpanded) {
    loader.loadFromCommandLine({"--cache.root_dir=~/geobridge-cache"});
    const auto config = GeoBridgeConfigFactory::cacheConfig(loader);
    const char* home = std::getenv("HOME");
    if (home != nullptr) {
        EXPECT_EQ(config.rootDirectory, fs::path(home) / "geobridge-cache");
    }
}

TEST_F(GeoBridgeConfigFactoryTest, NonPositiveValuesAreRejected) {
    loader.loadFromCommandLine({"--cache.ttl_hours=0"});
    EXPECT_THROW(GeoBridgeConfigFactory::cacheConfig(loader), ConfigurationException);

    AppConfigLoader other;
    GeoBridgeConfigFactory::registerDefaults(other);
    other.loadFromCommandLine({"--processing.default_resolution=-2"});
    EXPECT_THROW(GeoBridgeConfigFactory::processingConfig(other), ConfigurationException);

    AppConfigLoader garbage;
    GeoBridgeConfigFactory::registerDefaults(garbage);
    garbage.loadFromCommandLine({"--processing.worker_threads=many"});
    EXPECT_THROW(GeoBridgeConfigFactory::processingConfig(garbage), ConfigurationException);
}
