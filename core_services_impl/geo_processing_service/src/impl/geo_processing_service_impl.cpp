#include "geo_processing_service_impl.h"
#include "gdal_environment.h"
#include "common_utils/utilities/logging_utils.h"

namespace geobridge::core_services::geo_processing::impl {

GeoProcessingServiceImpl::GeoProcessingServiceImpl(
    const GeoProcessingConfig& config,
    std::shared_ptr<common_utils::infrastructure::UnifiedThreadPoolManager> threadPool)
    : m_config(config)
    , m_engine(config)
    , m_threadPool(std::move(threadPool)) {
    GEOBRIDGE_LOG_INFO("GeoProcessingService", "GeoProcessingService created with {} worker threads",
                       m_threadPool->getThreadCount());
}

GeoProcessingServiceImpl::~GeoProcessingServiceImpl() = default;

boost::future<std::vector<std::string>> GeoProcessingServiceImpl::getCapabilities() const {
    return boost::make_ready_future(std::vector<std::string>{
        "reproject", "buffer", "intersect", "clip", "convert", "bbox", "dissolve", "explode",
        "geojson", "kml", "gpkg", "shapefile"});
}

GeoProcessingConfig GeoProcessingServiceImpl::getConfiguration() const {
    return m_config;
}

std::string GeoProcessingServiceImpl::getVersion() const {
    return "1.0.0";
}

bool GeoProcessingServiceImpl::isReady() const {
    return m_threadPool && !m_threadPool->isShuttingDown() && GdalEnvironment::available();
}

boost::future<GeodataEnvelope> GeoProcessingServiceImpl::reproject(const ReprojectRequest& request) {
    return m_threadPool->submitTask([engine = m_engine, request]() { return engine.reproject(request); });
}

boost::future<GeodataEnvelope> GeoProcessingServiceImpl::buffer(const BufferRequest& request) {
    return m_threadPool->submitTask([engine = m_engine, request]() { return engine.buffer(request); });
}

boost::future<GeodataEnvelope> GeoProcessingServiceImpl::intersect(const IntersectRequest& request) {
    return m_threadPool->submitTask([engine = m_engine, request]() { return engine.intersect(request); });
}

boost::future<GeodataEnvelope> GeoProcessingServiceImpl::clip(const ClipRequest& request) {
    return m_threadPool->submitTask([engine = m_engine, request]() { return engine.clip(request); });
}

boost::future<GeodataEnvelope> GeoProcessingServiceImpl::convert(const ConvertRequest& request) {
    return m_threadPool->submitTask([engine = m_engine, request]() { return engine.convert(request); });
}

boost::future<BoundingBox> GeoProcessingServiceImpl::bbox(const BboxRequest& request) {
    return m_threadPool->submitTask([engine = m_engine, request]() { return engine.bbox(request); });
}

boost::future<GeodataEnvelope> GeoProcessingServiceImpl::dissolve(const DissolveRequest& request) {
    return m_threadPool->submitTask([engine = m_engine, request]() { return engine.dissolve(request); });
}

boost::future<GeodataEnvelope> GeoProcessingServiceImpl::explode(const ExplodeRequest& request) {
    return m_threadPool->submitTask([engine = m_engine, request]() { return engine.explode(request); });
}

} // namespace geobridge::core_services::geo_processing::impl
