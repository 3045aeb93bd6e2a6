#pragma once

#include "core_services/geo_processing/geo_processing_types.h"

#include <ogr_geometry.h>

#include <string>
#include <vector>

// Forward declare GEOS types
typedef struct GEOSContextHandle_HS *GEOSContextHandle_t;
typedef struct GEOSGeom_t GEOSGeometry;
typedef struct GEOSWKBReader_t GEOSWKBReader;
typedef struct GEOSWKBWriter_t GEOSWKBWriter;

namespace geobridge::core_services::geo_processing::engine {

/**
 * @class GeometryEngine
 * @brief Geometry kernel backed by the GEOS C API.
 *
 * Geometries cross the OGR/GEOS boundary as ISO WKB. Each engine owns its own
 * GEOS context, so one engine is created per operation invocation and never
 * shared between threads.
 */
class GeometryEngine {
public:
    GeometryEngine();
    ~GeometryEngine();

    // Disable copy constructor and assignment operator
    GeometryEngine(const GeometryEngine&) = delete;
    GeometryEngine& operator=(const GeometryEngine&) = delete;

    /**
     * @brief Buffers a geometry by a signed distance in its own units.
     * @param options end cap, join style, mitre limit, quadrant segments, single-sided
     * @return the buffered geometry; may be empty when a negative distance erodes it away
     * @throws OperationFailedException if GEOS fails
     */
    OGRGeometryUniquePtr buffer(const OGRGeometry& geom, double distance,
                                const BufferOptions& options) const;

    /**
     * @brief Computes the intersection of two geometries.
     * @return the intersection, empty when the inputs do not overlap
     */
    OGRGeometryUniquePtr intersection(const OGRGeometry& geom1, const OGRGeometry& geom2) const;

    /**
     * @brief Unary union of a set of geometries.
     * @throws InvalidParameterException if the set is empty
     */
    OGRGeometryUniquePtr unaryUnion(const std::vector<const OGRGeometry*>& geometries) const;

    bool intersects(const OGRGeometry& geom1, const OGRGeometry& geom2) const;

    /**
     * @brief Envelope of a non-empty geometry.
     */
    OGREnvelope envelope(const OGRGeometry& geom) const;

private:
    void initializeGeos();
    void cleanupGeos();

    GEOSGeometry* ogrToGeos(const OGRGeometry& geom) const;
    OGRGeometryUniquePtr geosToOgr(const GEOSGeometry* geom) const;
    void cleanupGeosGeometry(GEOSGeometry* geom) const;

    static void geosErrorHandler(const char* message, void* userdata);
    static void geosNoticeHandler(const char* message, void* userdata);

    GEOSContextHandle_t geosContext_;
    GEOSWKBReader* wkbReader_;
    GEOSWKBWriter* wkbWriter_;
};

} // namespace geobridge::core_services::geo_processing::engine
