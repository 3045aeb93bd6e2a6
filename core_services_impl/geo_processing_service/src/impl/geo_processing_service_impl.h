/**
 * @file geo_processing_service_impl.h
 * @brief Thread-pool backed implementation of IGeoProcessingService.
 */
#pragma once

#include "core_services/geo_processing/i_geo_processing_service.h"
#include "core_services/geo_processing/geo_processing_config.h"
#include "common_utils/infrastructure/unified_thread_pool_manager.h"
#include "engine/geometry_operation_engine.h"

#include <memory>

namespace geobridge::core_services::geo_processing::impl {

class GeoProcessingServiceImpl : public IGeoProcessingService {
public:
    GeoProcessingServiceImpl(const GeoProcessingConfig& config,
                             std::shared_ptr<common_utils::infrastructure::UnifiedThreadPoolManager> threadPool);
    ~GeoProcessingServiceImpl() override;

    // --- Service Management ---
    boost::future<std::vector<std::string>> getCapabilities() const override;
    GeoProcessingConfig getConfiguration() const override;
    std::string getVersion() const override;
    bool isReady() const override;

    // --- Geometry Operations ---
    boost::future<GeodataEnvelope> reproject(const ReprojectRequest& request) override;
    boost::future<GeodataEnvelope> buffer(const BufferRequest& request) override;
    boost::future<GeodataEnvelope> intersect(const IntersectRequest& request) override;
    boost::future<GeodataEnvelope> clip(const ClipRequest& request) override;
    boost::future<GeodataEnvelope> convert(const ConvertRequest& request) override;
    boost::future<BoundingBox> bbox(const BboxRequest& request) override;
    boost::future<GeodataEnvelope> dissolve(const DissolveRequest& request) override;
    boost::future<GeodataEnvelope> explode(const ExplodeRequest& request) override;

private:
    GeoProcessingConfig m_config;
    engine::GeometryOperationEngine m_engine;
    std::shared_ptr<common_utils::infrastructure::UnifiedThreadPoolManager> m_threadPool;
};

} // namespace geobridge::core_services::geo_processing::impl
