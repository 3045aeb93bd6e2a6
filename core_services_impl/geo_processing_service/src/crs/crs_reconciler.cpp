#include "crs/crs_reconciler.h"
#include "core_services/geo_processing/geo_processing_exceptions.h"
#include "common_utils/utilities/logging_utils.h"

#include <ogr_spatialref.h>

#include <memory>

namespace geobridge::core_services::geo_processing::crs {

using engine::FeatureTable;

namespace {

struct TransformationDeleter {
    void operator()(OGRCoordinateTransformation* ct) const {
        OGRCoordinateTransformation::DestroyCT(ct);
    }
};

using TransformationPtr = std::unique_ptr<OGRCoordinateTransformation, TransformationDeleter>;

} // anonymous namespace

std::pair<FeatureTable, FeatureTable> CrsReconciler::reconcile(FeatureTable a,
                                                               FeatureTable b,
                                                               const std::optional<std::string>& targetCrs) {
    if (targetCrs && !targetCrs->empty()) {
        const auto target = SpatialReference::fromUserInput(*targetCrs);
        a = reproject(std::move(a), target);
        b = reproject(std::move(b), target);
        return {std::move(a), std::move(b)};
    }

    if (!a.crs() || !b.crs()) {
        GEOBRIDGE_THROW(IncompatibleCrsException,
                        "The CRS of one or both inputs is unknown. "
                        "Provide a source CRS for each input or a target CRS.");
    }

    if (a.crs()->isSame(*b.crs())) {
        return {std::move(a), std::move(b)};
    }

    GEOBRIDGE_LOG_DEBUG("CrsReconciler", "Reprojecting second input into the CRS of the first");
    const auto first = *a.crs();
    b = reproject(std::move(b), first);
    return {std::move(a), std::move(b)};
}

SpatialReference CrsReconciler::resolveWorkingCrs(const FeatureTable& table,
                                                  const std::optional<std::string>& preferred) {
    if (preferred && !preferred->empty()) {
        return SpatialReference::fromUserInput(*preferred);
    }
    return resolveWorkingCrs(table, std::optional<SpatialReference>{});
}

SpatialReference CrsReconciler::resolveWorkingCrs(const FeatureTable& table,
                                                  const std::optional<SpatialReference>& preferred) {
    if (preferred) {
        return *preferred;
    }
    if (table.crs()) {
        return *table.crs();
    }
    GEOBRIDGE_THROW(MissingCrsException,
                    "Cannot determine a working CRS. Provide a source CRS or a buffer CRS.");
}

FeatureTable CrsReconciler::reproject(FeatureTable table, const SpatialReference& target) {
    if (!table.crs()) {
        GEOBRIDGE_THROW(IncompatibleCrsException,
                        "Cannot reproject data whose CRS is unknown. Provide a source CRS.");
    }

    if (table.crs()->isSame(target)) {
        table.setCrs(target);
        return table;
    }

    TransformationPtr transformation(
        OGRCreateCoordinateTransformation(table.crs()->get(), target.get()));
    if (!transformation) {
        GEOBRIDGE_THROW(OperationFailedException, "reproject",
                        "no coordinate transformation between the source and target CRS");
    }

    std::size_t index = 0;
    for (auto& row : table.rows()) {
        if (row.geometry && row.geometry->transform(transformation.get()) != OGRERR_NONE) {
            GEOBRIDGE_THROW(OperationFailedException, "reproject",
                            "coordinate transformation failed for feature " + std::to_string(index));
        }
        ++index;
    }

    table.setCrs(target);
    return table;
}

FeatureTable CrsReconciler::reproject(FeatureTable table, const std::string& target) {
    return reproject(std::move(table), SpatialReference::fromUserInput(target));
}

} // namespace geobridge::core_services::geo_processing::crs
