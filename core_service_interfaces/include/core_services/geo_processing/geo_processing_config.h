#pragma once

#include <cstddef>
#include <thread>

namespace geobridge::core_services::geo_processing {

/**
 * @brief Runtime configuration of the geo-processing service
 */
struct GeoProcessingConfig {
    std::size_t workerThreads = std::thread::hardware_concurrency();
    int defaultResolution = 16;  ///< buffer quadrant segments when a request leaves it unset
};

} // namespace geobridge::core_services::geo_processing
