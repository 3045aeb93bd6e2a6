/**
 * @file geobridge_config_factory.h
 * @brief 将分层配置（AppConfigLoader）映射为各服务的配置结构
 *
 * 识别的配置键：
 * - logging.level / logging.file
 * - processing.worker_threads / processing.default_resolution
 * - cache.root_dir / cache.ttl_hours / cache.inline_size_limit_bytes / cache.feature_count_limit
 */
#pragma once

#include "common_utils/utilities/app_config_loader.h"
#include "common_utils/utilities/logging_utils.h"
#include "core_services/geo_processing/geo_processing_config.h"
#include "core_services/result_cache/result_cache_types.h"

namespace geobridge::application {

struct GeoBridgeSettings {
    common_utils::LoggingConfig logging;
    core_services::geo_processing::GeoProcessingConfig processing;
    core_services::result_cache::CacheConfig cache;
};

class GeoBridgeConfigFactory {
public:
    /**
     * @brief 注册全部配置键的默认值，应在加载文件/环境变量之前调用
     */
    static void registerDefaults(common_utils::AppConfigLoader& loader);

    static common_utils::LoggingConfig loggingConfig(const common_utils::AppConfigLoader& loader);

    /**
     * @throws ConfigurationException worker_threads 或 default_resolution 小于 1
     */
    static core_services::geo_processing::GeoProcessingConfig processingConfig(
        const common_utils::AppConfigLoader& loader);

    /**
     * @throws ConfigurationException ttl、大小阈值非正或根目录为空
     */
    static core_services::result_cache::CacheConfig cacheConfig(const common_utils::AppConfigLoader& loader);

    static GeoBridgeSettings build(const common_utils::AppConfigLoader& loader);
};

} // namespace geobridge::application
