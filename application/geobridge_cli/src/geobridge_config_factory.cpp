#include "app/geobridge_config_factory.h"

#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/filesystem_utils.h"

#include <algorithm>
#include <thread>

namespace geobridge::application {

using common_utils::AppConfigLoader;
using common_utils::ConfigurationException;
using core_services::geo_processing::GeoProcessingConfig;
using core_services::result_cache::CacheConfig;

namespace {

int requirePositive(const AppConfigLoader& loader, const std::string& key, int fallback) {
    const int value = loader.getInt(key, fallback);
    if (value < 1) {
        GEOBRIDGE_THROW(ConfigurationException, key + " must be at least 1, got " + std::to_string(value));
    }
    return value;
}

} // anonymous namespace

void GeoBridgeConfigFactory::registerDefaults(AppConfigLoader& loader) {
    const unsigned hardwareThreads = std::max(1u, std::thread::hardware_concurrency());

    loader.setDefault("logging.level", "info", "控制台日志级别");
    loader.setDefault("logging.file", "", "日志文件路径，为空时不写文件");
    loader.setDefault("processing.worker_threads", std::to_string(hardwareThreads), "几何处理线程数");
    loader.setDefault("processing.default_resolution", "16", "缓冲区默认象限分段数");
    loader.setDefault("cache.root_dir", "~/.geobridge/cache", "结果缓存目录");
    loader.setDefault("cache.ttl_hours", "24", "缓存条目生存期（小时）");
    loader.setDefault("cache.inline_size_limit_bytes", "10240", "超过该大小的结果写入缓存");
    loader.setDefault("cache.feature_count_limit", "50", "features 超过该数量的结果写入缓存");
}

common_utils::LoggingConfig GeoBridgeConfigFactory::loggingConfig(const AppConfigLoader& loader) {
    common_utils::LoggingConfig config;
    config.level = loader.getString("logging.level", "info");
    const std::string file = loader.getString("logging.file");
    if (!file.empty()) {
        config.filePath = common_utils::FilesystemUtils::expandUser(file).string();
    }
    return config;
}

GeoProcessingConfig GeoBridgeConfigFactory::processingConfig(const AppConfigLoader& loader) {
    GeoProcessingConfig config;
    config.workerThreads = static_cast<std::size_t>(
        requirePositive(loader, "processing.worker_threads", static_cast<int>(std::max<std::size_t>(1, config.workerThreads))));
    config.defaultResolution = requirePositive(loader, "processing.default_resolution", config.defaultResolution);
    return config;
}

CacheConfig GeoBridgeConfigFactory::cacheConfig(const AppConfigLoader& loader) {
    CacheConfig config;
    const std::string root = loader.getString("cache.root_dir", "~/.geobridge/cache");
    if (root.empty()) {
        GEOBRIDGE_THROW(ConfigurationException, "cache.root_dir must not be empty");
    }
    config.rootDirectory = common_utils::FilesystemUtils::expandUser(root);
    config.ttl = std::chrono::hours(requirePositive(loader, "cache.ttl_hours", 24));
    config.inlineSizeLimitBytes = static_cast<std::size_t>(
        requirePositive(loader, "cache.inline_size_limit_bytes", static_cast<int>(config.inlineSizeLimitBytes)));
    config.featureCountLimit = static_cast<std::size_t>(
        requirePositive(loader, "cache.feature_count_limit", static_cast<int>(config.featureCountLimit)));
    return config;
}

GeoBridgeSettings GeoBridgeConfigFactory::build(const AppConfigLoader& loader) {
    GeoBridgeSettings settings;
    settings.logging = loggingConfig(loader);
    settings.processing = processingConfig(loader);
    settings.cache = cacheConfig(loader);
    return settings;
}

} // namespace geobridge::application
