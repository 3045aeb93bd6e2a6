#include "engine/geometry_engine.h"
#include "core_services/geo_processing/geo_processing_exceptions.h"
#include "common_utils/utilities/logging_utils.h"

// GEOS includes
#include <geos_c.h>

#include <ogr_api.h>

#include <cstddef>
#include <string>
#include <vector>

namespace geobridge::core_services::geo_processing::engine {

// GEOS message handlers route into the logger
void GeometryEngine::geosErrorHandler(const char* message, void* /*userdata*/) {
    GEOBRIDGE_LOG_WARN("GEOS", "{}", message ? message : "");
}

void GeometryEngine::geosNoticeHandler(const char* message, void* /*userdata*/) {
    GEOBRIDGE_LOG_DEBUG("GEOS", "{}", message ? message : "");
}

GeometryEngine::GeometryEngine()
    : geosContext_(nullptr)
    , wkbReader_(nullptr)
    , wkbWriter_(nullptr) {
    initializeGeos();
}

GeometryEngine::~GeometryEngine() {
    cleanupGeos();
}

void GeometryEngine::initializeGeos() {
    geosContext_ = GEOS_init_r();
    if (!geosContext_) {
        GEOBRIDGE_THROW(OperationFailedException, "Failed to initialize GEOS context");
    }

    GEOSContext_setErrorMessageHandler_r(geosContext_, geosErrorHandler, nullptr);
    GEOSContext_setNoticeMessageHandler_r(geosContext_, geosNoticeHandler, nullptr);

    wkbReader_ = GEOSWKBReader_create_r(geosContext_);
    if (!wkbReader_) {
        cleanupGeos(); // Clean up partially initialized GEOS
        GEOBRIDGE_THROW(OperationFailedException, "Failed to create GEOS WKB reader");
    }

    wkbWriter_ = GEOSWKBWriter_create_r(geosContext_);
    if (!wkbWriter_) {
        cleanupGeos();
        GEOBRIDGE_THROW(OperationFailedException, "Failed to create GEOS WKB writer");
    }

    GEOSWKBWriter_setOutputDimension_r(geosContext_, wkbWriter_, 2);
    GEOSWKBWriter_setByteOrder_r(geosContext_, wkbWriter_, GEOS_WKB_NDR);
}

void GeometryEngine::cleanupGeos() {
    if (wkbWriter_) {
        GEOSWKBWriter_destroy_r(geosContext_, wkbWriter_);
        wkbWriter_ = nullptr;
    }

    if (wkbReader_) {
        GEOSWKBReader_destroy_r(geosContext_, wkbReader_);
        wkbReader_ = nullptr;
    }

    if (geosContext_) {
        GEOS_finish_r(geosContext_);
        geosContext_ = nullptr;
    }
}

GEOSGeometry* GeometryEngine::ogrToGeos(const OGRGeometry& geom) const {
    std::vector<unsigned char> wkb(static_cast<std::size_t>(geom.WkbSize()));
    if (geom.exportToWkb(wkbNDR, wkb.data(), wkbVariantIso) != OGRERR_NONE) {
        GEOBRIDGE_THROW(OperationFailedException, "Failed to export OGR geometry to WKB");
    }

    GEOSGeometry* result = GEOSWKBReader_read_r(geosContext_, wkbReader_, wkb.data(), wkb.size());
    if (!result) {
        GEOBRIDGE_THROW(OperationFailedException, "GEOS could not read geometry of type " +
                                                  std::string(geom.getGeometryName()));
    }
    return result;
}

OGRGeometryUniquePtr GeometryEngine::geosToOgr(const GEOSGeometry* geom) const {
    if (!geom) {
        GEOBRIDGE_THROW(InvalidParameterException, "Input GEOS geometry is null");
    }

    std::size_t size = 0;
    unsigned char* wkb = GEOSWKBWriter_write_r(geosContext_, wkbWriter_, geom, &size);
    if (!wkb) {
        GEOBRIDGE_THROW(OperationFailedException, "Failed to convert GEOS geometry to WKB");
    }

    OGRGeometry* result = nullptr;
    const OGRErr err = OGRGeometryFactory::createFromWkb(wkb, nullptr, &result, size, wkbVariantIso);
    GEOSFree_r(geosContext_, wkb);
    if (err != OGRERR_NONE || !result) {
        GEOBRIDGE_THROW(OperationFailedException, "Failed to read GEOS result as OGR geometry");
    }
    return OGRGeometryUniquePtr(result);
}

void GeometryEngine::cleanupGeosGeometry(GEOSGeometry* geom) const {
    if (geom) {
        GEOSGeom_destroy_r(geosContext_, geom);
    }
}

OGRGeometryUniquePtr GeometryEngine::buffer(const OGRGeometry& geom, double distance,
                                            const BufferOptions& options) const {
    GEOSGeometry* inputGeom = nullptr;
    GEOSGeometry* bufferedGeom = nullptr;
    GEOSBufferParams* params = nullptr;
    try {
        inputGeom = ogrToGeos(geom);

        params = GEOSBufferParams_create_r(geosContext_);
        if (!params) {
            GEOBRIDGE_THROW(OperationFailedException, "Failed to create GEOS buffer parameters");
        }
        GEOSBufferParams_setEndCapStyle_r(geosContext_, params, static_cast<int>(options.capStyle));
        GEOSBufferParams_setJoinStyle_r(geosContext_, params, static_cast<int>(options.joinStyle));
        GEOSBufferParams_setMitreLimit_r(geosContext_, params, options.mitreLimit);
        GEOSBufferParams_setQuadrantSegments_r(geosContext_, params, options.quadrantSegments);
        GEOSBufferParams_setSingleSided_r(geosContext_, params, options.singleSided ? 1 : 0);

        bufferedGeom = GEOSBufferWithParams_r(geosContext_, params, inputGeom, distance);
        if (!bufferedGeom) {
            GEOBRIDGE_THROW(OperationFailedException, "buffer", "GEOS buffer operation returned null");
        }

        auto result = geosToOgr(bufferedGeom);

        GEOSBufferParams_destroy_r(geosContext_, params);
        cleanupGeosGeometry(inputGeom);
        cleanupGeosGeometry(bufferedGeom);
        return result;
    } catch (...) {
        if (params) {
            GEOSBufferParams_destroy_r(geosContext_, params);
        }
        cleanupGeosGeometry(inputGeom);
        cleanupGeosGeometry(bufferedGeom);
        throw;
    }
}

OGRGeometryUniquePtr GeometryEngine::intersection(const OGRGeometry& geom1,
                                                  const OGRGeometry& geom2) const {
    GEOSGeometry* g1 = nullptr;
    GEOSGeometry* g2 = nullptr;
    GEOSGeometry* resultGeom = nullptr;
    try {
        g1 = ogrToGeos(geom1);
        g2 = ogrToGeos(geom2);

        resultGeom = GEOSIntersection_r(geosContext_, g1, g2);
        if (!resultGeom) {
            GEOBRIDGE_THROW(OperationFailedException, "intersection", "GEOS intersection operation returned null");
        }

        auto result = geosToOgr(resultGeom);

        cleanupGeosGeometry(g1);
        cleanupGeosGeometry(g2);
        cleanupGeosGeometry(resultGeom);
        return result;
    } catch (...) {
        cleanupGeosGeometry(g1);
        cleanupGeosGeometry(g2);
        cleanupGeosGeometry(resultGeom);
        throw;
    }
}

OGRGeometryUniquePtr GeometryEngine::unaryUnion(const std::vector<const OGRGeometry*>& geometries) const {
    if (geometries.empty()) {
        GEOBRIDGE_THROW(InvalidParameterException, "geometries", "union of an empty set");
    }

    OGRGeometryCollection collection;
    for (const auto* geom : geometries) {
        if (geom) {
            collection.addGeometry(geom);
        }
    }

    GEOSGeometry* input = nullptr;
    GEOSGeometry* unioned = nullptr;
    try {
        input = ogrToGeos(collection);

        unioned = GEOSUnaryUnion_r(geosContext_, input);
        if (!unioned) {
            GEOBRIDGE_THROW(OperationFailedException, "union", "GEOS unary union returned null");
        }

        auto result = geosToOgr(unioned);

        cleanupGeosGeometry(input);
        cleanupGeosGeometry(unioned);
        return result;
    } catch (...) {
        cleanupGeosGeometry(input);
        cleanupGeosGeometry(unioned);
        throw;
    }
}

bool GeometryEngine::intersects(const OGRGeometry& geom1, const OGRGeometry& geom2) const {
    GEOSGeometry* g1 = nullptr;
    GEOSGeometry* g2 = nullptr;
    try {
        g1 = ogrToGeos(geom1);
        g2 = ogrToGeos(geom2);

        const char result = GEOSIntersects_r(geosContext_, g1, g2);
        if (result == 2) {
            GEOBRIDGE_THROW(OperationFailedException, "intersects", "GEOS predicate evaluation failed");
        }

        cleanupGeosGeometry(g1);
        cleanupGeosGeometry(g2);
        return result == 1;
    } catch (...) {
        cleanupGeosGeometry(g1);
        cleanupGeosGeometry(g2);
        throw;
    }
}

OGREnvelope GeometryEngine::envelope(const OGRGeometry& geom) const {
    if (geom.IsEmpty()) {
        GEOBRIDGE_THROW(InvalidParameterException, "geometry", "envelope of an empty geometry");
    }

    GEOSGeometry* g = nullptr;
    try {
        g = ogrToGeos(geom);

        OGREnvelope env;
        if (GEOSGeom_getXMin_r(geosContext_, g, &env.MinX) == 0 ||
            GEOSGeom_getYMin_r(geosContext_, g, &env.MinY) == 0 ||
            GEOSGeom_getXMax_r(geosContext_, g, &env.MaxX) == 0 ||
            GEOSGeom_getYMax_r(geosContext_, g, &env.MaxY) == 0) {
            GEOBRIDGE_THROW(OperationFailedException, "envelope", "GEOS envelope computation failed");
        }

        cleanupGeosGeometry(g);
        return env;
    } catch (...) {
        cleanupGeosGeometry(g);
        throw;
    }
}

} // namespace geobridge::core_services::geo_processing::engine
