#pragma once

#include "core_services/common_data_types.h"

#include <string>
#include <vector>

namespace geobridge::core_services::geo_processing::engine {

/**
 * @brief Per-column reduction used by dissolve.
 */
enum class AggregationKind {
    FIRST,
    LAST,
    SUM,
    MEAN,
    MIN,
    MAX,
    COUNT
};

/**
 * @brief Parses first|last|sum|mean|min|max|count (case-insensitive).
 * @throws InvalidParameterException for any other name
 */
AggregationKind parseAggregationKind(const std::string& name);

std::string toString(AggregationKind kind);

/**
 * @class AttributeAggregator
 * @brief Reduces the values of one column within a dissolve group.
 *
 * Null values are skipped by every reduction. first/last return the first or
 * last non-null value; min/max/mean are null when a group has no values; sum
 * of no values is zero; count is the number of non-null values.
 */
class AttributeAggregator {
public:
    /**
     * @brief Type of the output column for a reduction over an input column.
     */
    static FieldType resultType(AggregationKind kind, FieldType inputType);

    /**
     * @brief Checks that the reduction is defined for the column type.
     * @throws InvalidParameterException for sum/mean on a string column
     */
    static void validate(AggregationKind kind, const std::string& column, FieldType inputType);

    static AttributeValue aggregate(AggregationKind kind,
                                    const std::vector<AttributeValue>& values,
                                    FieldType inputType);
};

} // namespace geobridge::core_services::geo_processing::engine
