#include "crs/spatial_reference.h"
#include "crs/crs_parser.h"

#include "core_services/geo_processing/geo_processing_exceptions.h"

#include <ogr_spatialref.h>
#include <cpl_conv.h>

namespace geobridge::core_services::geo_processing::crs {

SpatialReference::SpatialReference(std::shared_ptr<const OGRSpatialReference> srs)
    : srs_(std::move(srs)) {}

SpatialReference SpatialReference::fromUserInput(const std::string& definition) {
    if (definition.empty()) {
        GEOBRIDGE_THROW(InvalidParameterException, "crs", "empty CRS definition");
    }

    auto srs = std::make_shared<OGRSpatialReference>();
    srs->SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    if (srs->SetFromUserInput(definition.c_str()) != OGRERR_NONE) {
        GEOBRIDGE_THROW(InvalidParameterException, "crs", "cannot parse CRS definition '" + definition + "'");
    }
    return SpatialReference(std::move(srs));
}

SpatialReference SpatialReference::fromOgr(const OGRSpatialReference& srs) {
    auto copy = std::make_shared<OGRSpatialReference>(srs);
    copy->SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return SpatialReference(std::move(copy));
}

bool SpatialReference::isSame(const SpatialReference& other) const {
    if (srs_ == other.srs_) {
        return true;
    }
    return srs_->IsSame(other.srs_.get()) != FALSE;
}

bool SpatialReference::isGeographic() const {
    return srs_->IsGeographic() != FALSE;
}

std::string SpatialReference::toWkt() const {
    char* wkt = nullptr;
    const char* const options[] = {"FORMAT=WKT2_2019", nullptr};
    if (srs_->exportToWkt(&wkt, options) != OGRERR_NONE || !wkt) {
        CPLFree(wkt);
        GEOBRIDGE_THROW(OperationFailedException, "crs export", "cannot export CRS to WKT");
    }
    std::string result(wkt);
    CPLFree(wkt);
    return result;
}

std::string SpatialReference::toIdentifier() const {
    const std::string wkt = toWkt();
    if (auto code = CrsParser::identifyEpsg(wkt)) {
        return "EPSG:" + std::to_string(*code);
    }
    return wkt;
}

} // namespace geobridge::core_services::geo_processing::crs
