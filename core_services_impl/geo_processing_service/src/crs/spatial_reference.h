#pragma once

#include <memory>
#include <string>

class OGRSpatialReference;

namespace geobridge::core_services::geo_processing::crs {

/**
 * @class SpatialReference
 * @brief Immutable, shareable coordinate reference system handle.
 *
 * Wraps an OGRSpatialReference configured with traditional GIS axis order
 * (x = longitude/easting), so coordinates are always read as (x, y).
 */
class SpatialReference {
public:
    /**
     * @brief Parses a user supplied CRS string.
     *
     * Accepts everything OGRSpatialReference::SetFromUserInput accepts:
     * "EPSG:n", "urn:ogc:def:crs:EPSG::n", WKT and PROJ strings.
     * @throws InvalidParameterException if the string cannot be parsed.
     */
    static SpatialReference fromUserInput(const std::string& definition);

    /**
     * @brief Takes a copy of an OGR spatial reference (e.g. a layer's CRS).
     */
    static SpatialReference fromOgr(const OGRSpatialReference& srs);

    const OGRSpatialReference* get() const { return srs_.get(); }

    bool isSame(const SpatialReference& other) const;

    bool isGeographic() const;

    std::string toWkt() const;

    /**
     * @brief "EPSG:<code>" when the CRS can be identified, otherwise its WKT.
     */
    std::string toIdentifier() const;

private:
    explicit SpatialReference(std::shared_ptr<const OGRSpatialReference> srs);

    std::shared_ptr<const OGRSpatialReference> srs_;
};

} // namespace geobridge::core_services::geo_processing::crs
