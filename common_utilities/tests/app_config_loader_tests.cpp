/**
 * @file app_config_loader_tests.cpp
 * @brief AppConfigLoader 单元测试：文件解析、环境变量、命令行优先级
 */

#include <gtest/gtest.h>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "common_utils/utilities/app_config_loader.h"
#include "common_utils/utilities/exceptions.h"

namespace fs = std::filesystem;

namespace geobridge::common_utils::tests {

class AppConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("geobridge_cfg_test_" + std::to_string(
                   std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(dir);
        unsetenv("GEOBRIDGE_CACHE_TTL_HOURS");
        unsetenv("GEOBRIDGE_PROCESSING_WORKER_THREADS");
    }

    void TearDown() override {
        unsetenv("GEOBRIDGE_CACHE_TTL_HOURS");
        unsetenv("GEOBRIDGE_PROCESSING_WORKER_THREADS");
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path writeFile(const std::string& name, const std::string& content) {
        auto path = dir / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    fs::path dir;
};

TEST_F(AppConfigLoaderTest, YamlNestedKeysAreFlattened) {
    auto path = writeFile("geobridge.yaml",
                          "logging:\n"
                          "  level: debug\n"
                          "cache:\n"
                          "  root_dir: /tmp/geobridge-cache\n"
                          "  ttl_hours: 12\n"
                          "formats: [geojson, kml]\n");

    AppConfigLoader loader;
    ASSERT_TRUE(loader.loadFromFile(path));

    EXPECT_EQ(loader.getString("logging.level"), "debug");
    EXPECT_EQ(loader.getString("cache.root_dir"), "/tmp/geobridge-cache");
    EXPECT_EQ(loader.getInt("cache.ttl_hours"), 12);
    auto formats = loader.get("formats");
    ASSERT_TRUE(formats.has_value());
    EXPECT_EQ(formats->asList().size(), 2u);
    EXPECT_EQ(formats->source, ConfigSource::FILE);
}

TEST_F(AppConfigLoaderTest, JsonFileIsParsedWithTypes) {
    auto path = writeFile("geobridge.json",
                          R"({"processing": {"worker_threads": 3, "default_resolution": 8},
                              "cache": {"inline_size_limit_bytes": 2048}, "logging": {"file": null}})");

    AppConfigLoader loader;
    ASSERT_TRUE(loader.loadFromFile(path));

    EXPECT_EQ(loader.getInt("processing.worker_threads"), 3);
    EXPECT_EQ(loader.getInt("processing.default_resolution"), 8);
    EXPECT_EQ(loader.getInt("cache.inline_size_limit_bytes"), 2048);
    EXPECT_FALSE(loader.has("logging.file"));
}

TEST_F(AppConfigLoaderTest, MalformedFileIsRejected) {
    auto path = writeFile("broken.json", "{ not json");
    AppConfigLoader loader;
    EXPECT_FALSE(loader.loadFromFile(path));
    EXPECT_FALSE(loader.loadFromFile(dir / "missing.yaml"));
}

TEST_F(AppConfigLoaderTest, PrecedenceCommandLineOverEnvironmentOverFileOverDefault) {
    AppConfigLoader loader;
    loader.setDefault("cache.ttl_hours", "24");
    loader.setDefault("processing.worker_threads", "4");
    EXPECT_EQ(loader.getInt("cache.ttl_hours"), 24);

    auto path = writeFile("geobridge.yaml", "cache:\n  ttl_hours: 6\nprocessing:\n  worker_threads: 2\n");
    ASSERT_TRUE(loader.loadFromFile(path));
    EXPECT_EQ(loader.getInt("cache.ttl_hours"), 6);

    setenv("GEOBRIDGE_CACHE_TTL_HOURS", "3", 1);
    setenv("GEOBRIDGE_PROCESSING_WORKER_THREADS", "7", 1);
    EXPECT_EQ(loader.loadFromEnvironment(), 2);
    EXPECT_EQ(loader.getInt("cache.ttl_hours"), 3);

    // 加载顺序不影响优先级
    EXPECT_EQ(loader.loadFromCommandLine({"buffer", "--cache.ttl_hours=1", "--distance", "500"}), 1);
    EXPECT_EQ(loader.getInt("cache.ttl_hours"), 1);
    EXPECT_EQ(loader.get("cache.ttl_hours")->source, ConfigSource::COMMAND_LINE);
    EXPECT_EQ(loader.getInt("processing.worker_threads"), 7);
    EXPECT_FALSE(loader.has("distance"));
}

TEST_F(AppConfigLoaderTest, NonNumericValueThrowsConfigurationException) {
    AppConfigLoader loader;
    loader.setDefault("processing.worker_threads", "many");
    EXPECT_THROW(loader.getInt("processing.worker_threads"), ConfigurationException);
    EXPECT_EQ(loader.getInt("processing.unset", 5), 5);
}

TEST_F(AppConfigLoaderTest, ValueRemembersWhereItCameFrom) {
    AppConfigLoader loader;
    loader.setDefault("cache.ttl_hours", "24", "缓存条目生存期");
    EXPECT_EQ(loader.get("cache.ttl_hours")->origin, "缓存条目生存期");

    auto path = writeFile("override.yaml", "cache:\n  ttl_hours: 6\n  keep: yes\n");
    ASSERT_TRUE(loader.loadFromFile(path));
    EXPECT_EQ(loader.get("cache.ttl_hours")->origin, path.string());
    EXPECT_TRUE(loader.get("cache.keep")->asBool());

    setenv("GEOBRIDGE_CACHE_TTL_HOURS", "2", 1);
    loader.loadFromEnvironment();
    EXPECT_EQ(loader.get("cache.ttl_hours")->origin, "GEOBRIDGE_CACHE_TTL_HOURS");
    EXPECT_EQ(loader.get("cache.ttl_hours")->source, ConfigSource::ENVIRONMENT);
}

TEST_F(AppConfigLoaderTest, FailedParseKeepsPreviouslyLoadedFileValues) {
    AppConfigLoader loader;
    ASSERT_TRUE(loader.loadFromFile(writeFile("good.yaml", "logging:\n  level: warn\n")));
    EXPECT_FALSE(loader.loadFromFile(writeFile("bad.json", R"({"logging": {"level": )")));
    EXPECT_EQ(loader.getString("logging.level"), "warn");
}

} // namespace geobridge::common_utils::tests
