#pragma once

#include "core_services/common_data_types.h"
#include "crs/spatial_reference.h"

#include <ogr_geometry.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace geobridge::core_services::geo_processing::engine {

/**
 * @brief One feature: attribute values keyed by field name plus an owned geometry.
 */
struct FeatureRow {
    std::map<std::string, AttributeValue> attributes;
    OGRGeometryUniquePtr geometry;
};

/**
 * @class FeatureTable
 * @brief In-memory geometry collection shared by the codec and the operations.
 *
 * Holds an ordered field schema, ordered rows and a nullable CRS. The table
 * owns its geometries and is therefore move-only.
 */
class FeatureTable {
public:
    FeatureTable() = default;
    FeatureTable(FeatureTable&&) = default;
    FeatureTable& operator=(FeatureTable&&) = default;
    FeatureTable(const FeatureTable&) = delete;
    FeatureTable& operator=(const FeatureTable&) = delete;

    const std::vector<FieldDefinition>& fields() const { return fields_; }

    /**
     * @brief Appends a field; a field with the same name is left untouched.
     */
    void addField(const FieldDefinition& field);
    /// Drops the field and its value in every row.
    void removeField(const std::string& name);
    bool hasField(const std::string& name) const;
    std::optional<FieldType> fieldType(const std::string& name) const;

    std::vector<FeatureRow>& rows() { return rows_; }
    const std::vector<FeatureRow>& rows() const { return rows_; }
    void addRow(FeatureRow row) { rows_.push_back(std::move(row)); }

    std::size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    const std::optional<crs::SpatialReference>& crs() const { return crs_; }
    void setCrs(std::optional<crs::SpatialReference> crs) { crs_ = std::move(crs); }

    /**
     * @brief Removes rows whose geometry is null.
     * @return number of rows removed
     */
    std::size_t dropNullGeometries();

    /**
     * @brief New empty table with the same schema and CRS.
     */
    FeatureTable cloneSchema() const;

    /**
     * @brief Deep copy of schema, rows and CRS.
     */
    FeatureTable clone() const;

private:
    std::vector<FieldDefinition> fields_;
    std::vector<FeatureRow> rows_;
    std::optional<crs::SpatialReference> crs_;
};

} // namespace geobridge::core_services::geo_processing::engine
