#include "core_services/geo_processing/geo_processing_service_factory.h"
#include "core_services/exceptions.h"
#include "geo_processing_service_impl.h"
#include "common_utils/utilities/logging_utils.h"

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace geobridge::core_services::geo_processing {

using common_utils::infrastructure::UnifiedThreadPoolManager;

std::unique_ptr<IGeoProcessingService> GeoProcessingServiceFactory::createService() {
    return createService(getDefaultConfig());
}

std::unique_ptr<IGeoProcessingService> GeoProcessingServiceFactory::createService(
    const GeoProcessingConfig& config) {
    UnifiedThreadPoolManager::PoolConfiguration poolConfig;
    poolConfig.threadCount = std::max<std::size_t>(1, config.workerThreads);
    return createService(config, std::make_shared<UnifiedThreadPoolManager>(poolConfig));
}

std::unique_ptr<IGeoProcessingService> GeoProcessingServiceFactory::createService(
    const GeoProcessingConfig& config,
    std::shared_ptr<UnifiedThreadPoolManager> threadPool) {
    if (!validateConfig(config)) {
        GEOBRIDGE_THROW(ServiceCreationException, "Invalid geo processing configuration");
    }
    if (!threadPool) {
        GEOBRIDGE_THROW(ServiceCreationException, "GeoProcessingService requires a thread pool");
    }

    try {
        return std::make_unique<impl::GeoProcessingServiceImpl>(config, std::move(threadPool));
    } catch (const std::bad_alloc& ba_ex) {
        GEOBRIDGE_THROW(ServiceCreationException,
                        "Failed to allocate memory for GeoProcessingService: " + std::string(ba_ex.what()));
    }
}

bool GeoProcessingServiceFactory::validateConfig(const GeoProcessingConfig& config) {
    if (config.defaultResolution < 1) {
        GEOBRIDGE_LOG_ERROR("GeoProcessingServiceFactory", "defaultResolution must be at least 1, got {}",
                            config.defaultResolution);
        return false;
    }
    return true;
}

GeoProcessingConfig GeoProcessingServiceFactory::getDefaultConfig() {
    GeoProcessingConfig config;
    if (config.workerThreads == 0) {
        config.workerThreads = 1;
    }
    return config;
}

} // namespace geobridge::core_services::geo_processing
