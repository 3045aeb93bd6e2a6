#pragma once

#include "crs/spatial_reference.h"
#include "engine/feature_table.h"

#include <optional>
#include <string>
#include <utility>

namespace geobridge::core_services::geo_processing::crs {

/**
 * @class CrsReconciler
 * @brief Assigns, resolves and aligns the CRS of one or two feature tables.
 */
class CrsReconciler {
public:
    /**
     * @brief Brings two tables into one CRS for a binary operation.
     *
     * - targetCrs given: both tables are reprojected to it.
     * - both CRS known and equal: tables returned unchanged.
     * - both CRS known and different: @p b is reprojected to the CRS of @p a.
     * - either CRS unknown: IncompatibleCrsException.
     */
    static std::pair<engine::FeatureTable, engine::FeatureTable> reconcile(
        engine::FeatureTable a,
        engine::FeatureTable b,
        const std::optional<std::string>& targetCrs = std::nullopt);

    /**
     * @brief Working CRS of a single-input operation.
     *
     * The preferred CRS when given, otherwise the table's own CRS.
     * @throws MissingCrsException when neither is available
     */
    static SpatialReference resolveWorkingCrs(const engine::FeatureTable& table,
                                              const std::optional<std::string>& preferred = std::nullopt);

    static SpatialReference resolveWorkingCrs(const engine::FeatureTable& table,
                                              const std::optional<SpatialReference>& preferred);

    /**
     * @brief Transforms every geometry of the table into @p target.
     * @throws IncompatibleCrsException if the table has no CRS
     * @throws OperationFailedException if a coordinate transformation fails
     */
    static engine::FeatureTable reproject(engine::FeatureTable table, const SpatialReference& target);

    static engine::FeatureTable reproject(engine::FeatureTable table, const std::string& target);
};

} // namespace geobridge::core_services::geo_processing::crs
