#pragma once

#include "core_services/common_data_types.h"
#include "core_services/geo_processing/geo_processing_config.h"
#include "core_services/geo_processing/geo_processing_types.h"

#include <ogr_geometry.h>

namespace geobridge::core_services::geo_processing::engine {

/**
 * @class GeometryOperationEngine
 * @brief Synchronous implementation of the eight geodata operations.
 *
 * Every operation validates formats and parameters first, then decodes its
 * input(s), reconciles CRS, applies the geometry kernel and encodes the
 * result. Operations are pure functions of their requests; a fresh
 * GeometryEngine (and GEOS context) is created per call.
 */
class GeometryOperationEngine {
public:
    explicit GeometryOperationEngine(const GeoProcessingConfig& config = {});

    GeodataEnvelope reproject(const ReprojectRequest& request) const;

    GeodataEnvelope buffer(const BufferRequest& request) const;

    /**
     * @brief Pairwise overlay, one row per overlapping (a, b) pair in a-major order.
     *
     * Only parts with the dimension of the a geometry are kept. Columns that
     * exist in both inputs are suffixed "_1" (from a) and "_2" (from b).
     */
    GeodataEnvelope intersect(const IntersectRequest& request) const;

    GeodataEnvelope clip(const ClipRequest& request) const;

    GeodataEnvelope convert(const ConvertRequest& request) const;

    BoundingBox bbox(const BboxRequest& request) const;

    GeodataEnvelope dissolve(const DissolveRequest& request) const;

    GeodataEnvelope explode(const ExplodeRequest& request) const;

    /**
     * @brief Validates the style parameters of a buffer request.
     * @throws InvalidStyleParameterException for unknown cap or join styles
     * @throws InvalidParameterException when resolution < 1
     */
    static BufferOptions resolveBufferOptions(const BufferRequest& request, int defaultResolution);

    /**
     * @brief Keeps only the parts of @p geom whose dimension is @p dimension.
     * @return null when no such part exists
     */
    static OGRGeometryUniquePtr keepDimension(const OGRGeometry& geom, int dimension);

private:
    GeoProcessingConfig config_;
};

} // namespace geobridge::core_services::geo_processing::engine
