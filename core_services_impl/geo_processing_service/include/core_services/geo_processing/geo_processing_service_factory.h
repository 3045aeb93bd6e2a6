#pragma once

#include "core_services/geo_processing/i_geo_processing_service.h"
#include "core_services/geo_processing/geo_processing_config.h"
#include "common_utils/infrastructure/unified_thread_pool_manager.h"

#include <memory>

namespace geobridge::core_services::geo_processing {

/**
 * @brief 地理处理服务工厂类
 * 负责校验配置并创建服务实例，线程池可由调用方注入以便多个服务共享
 */
class GeoProcessingServiceFactory {
public:
    /**
     * @brief 创建服务实例（使用默认配置）
     */
    static std::unique_ptr<IGeoProcessingService> createService();

    /**
     * @brief 创建服务实例，自建大小为 config.workerThreads 的线程池
     * @throws ServiceCreationException 配置无效
     */
    static std::unique_ptr<IGeoProcessingService> createService(const GeoProcessingConfig& config);

    /**
     * @brief 创建服务实例（注入线程池）
     */
    static std::unique_ptr<IGeoProcessingService> createService(
        const GeoProcessingConfig& config,
        std::shared_ptr<common_utils::infrastructure::UnifiedThreadPoolManager> threadPool);

    static bool validateConfig(const GeoProcessingConfig& config);

    static GeoProcessingConfig getDefaultConfig();
};

} // namespace geobridge::core_services::geo_processing
