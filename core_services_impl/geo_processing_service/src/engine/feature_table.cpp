#include "engine/feature_table.h"

#include <algorithm>

namespace geobridge::core_services::geo_processing::engine {

void FeatureTable::addField(const FieldDefinition& field) {
    if (!hasField(field.name)) {
        fields_.push_back(field);
    }
}

void FeatureTable::removeField(const std::string& name) {
    fields_.erase(std::remove_if(fields_.begin(), fields_.end(),
                                 [&name](const FieldDefinition& f) { return f.name == name; }),
                  fields_.end());
    for (auto& row : rows_) {
        row.attributes.erase(name);
    }
}

bool FeatureTable::hasField(const std::string& name) const {
    return fieldType(name).has_value();
}

std::optional<FieldType> FeatureTable::fieldType(const std::string& name) const {
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [&name](const FieldDefinition& f) { return f.name == name; });
    if (it == fields_.end()) {
        return std::nullopt;
    }
    return it->type;
}

std::size_t FeatureTable::dropNullGeometries() {
    const auto before = rows_.size();
    rows_.erase(std::remove_if(rows_.begin(), rows_.end(),
                               [](const FeatureRow& row) { return !row.geometry; }),
                rows_.end());
    return before - rows_.size();
}

FeatureTable FeatureTable::cloneSchema() const {
    FeatureTable table;
    table.fields_ = fields_;
    table.crs_ = crs_;
    return table;
}

FeatureTable FeatureTable::clone() const {
    FeatureTable table = cloneSchema();
    table.rows_.reserve(rows_.size());
    for (const auto& row : rows_) {
        FeatureRow copy;
        copy.attributes = row.attributes;
        if (row.geometry) {
            copy.geometry.reset(row.geometry->clone());
        }
        table.rows_.push_back(std::move(copy));
    }
    return table;
}

} // namespace geobridge::core_services::geo_processing::engine
