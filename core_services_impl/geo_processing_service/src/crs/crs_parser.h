#pragma once

#include <optional>
#include <string>

namespace geobridge::core_services::geo_processing::crs {

/**
 * @brief PROJ-backed identification of coordinate reference systems
 *
 * Every call creates and destroys its own PROJ context so the parser can be
 * used from any worker thread.
 */
class CrsParser {
public:
    /// Minimum proj_identify confidence for a match to be reported.
    static constexpr int MIN_IDENTIFY_CONFIDENCE = 70;

    /**
     * @brief Finds the EPSG code matching a CRS definition.
     * @param definition WKT, PROJ string or authority identifier
     * @return the EPSG code, or std::nullopt when no EPSG entry matches with
     *         at least MIN_IDENTIFY_CONFIDENCE
     */
    static std::optional<int> identifyEpsg(const std::string& definition);
};

} // namespace geobridge::core_services::geo_processing::crs
