#include "engine/geometry_operation_engine.h"
#include "engine/attribute_aggregator.h"
#include "engine/feature_table.h"
#include "engine/geometry_engine.h"
#include "codec/format_codec.h"
#include "crs/crs_reconciler.h"
#include "crs/spatial_reference.h"
#include "core_services/geo_processing/geo_processing_exceptions.h"
#include "common_utils/utilities/logging_utils.h"
#include "common_utils/utilities/string_utils.h"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace geobridge::core_services::geo_processing::engine {

using codec::FormatCodec;
using common_utils::StringUtils;
using crs::CrsReconciler;
using crs::SpatialReference;

namespace {

std::optional<SpatialReference> parseOptionalCrs(const std::optional<std::string>& definition) {
    if (!definition || definition->empty()) {
        return std::nullopt;
    }
    return SpatialReference::fromUserInput(*definition);
}

bool isCollection(const OGRGeometry& geom) {
    return OGR_GT_IsSubClassOf(wkbFlatten(geom.getGeometryType()), wkbGeometryCollection) != FALSE;
}

void collectParts(const OGRGeometry& geom, int dimension, std::vector<const OGRGeometry*>& parts) {
    if (isCollection(geom)) {
        const OGRGeometryCollection* collection = geom.toGeometryCollection();
        for (int i = 0; i < collection->getNumGeometries(); ++i) {
            collectParts(*collection->getGeometryRef(i), dimension, parts);
        }
    } else if (!geom.IsEmpty() && geom.getDimension() == dimension) {
        parts.push_back(&geom);
    }
}

// base, then base_2, base_3, ... until the name is free; the result is reserved in taken
std::string reserveFieldName(std::set<std::string>& taken, const std::string& base) {
    std::string name = base;
    for (int n = 2; taken.count(name); ++n) {
        name = base + "_" + std::to_string(n);
    }
    taken.insert(name);
    return name;
}

// Null keys sort after every value
struct GroupKeyLess {
    bool operator()(const AttributeValue& a, const AttributeValue& b) const {
        const bool aNull = std::holds_alternative<std::monostate>(a);
        const bool bNull = std::holds_alternative<std::monostate>(b);
        if (aNull || bNull) {
            return !aNull && bNull;
        }
        return a < b;
    }
};

} // anonymous namespace

GeometryOperationEngine::GeometryOperationEngine(const GeoProcessingConfig& config)
    : config_(config) {}

BufferOptions GeometryOperationEngine::resolveBufferOptions(const BufferRequest& request, int defaultResolution) {
    static const std::map<std::string, BufferCapStyle> capStyles = {
        {"round", BufferCapStyle::ROUND},
        {"flat", BufferCapStyle::FLAT},
        {"square", BufferCapStyle::SQUARE}};
    static const std::map<std::string, BufferJoinStyle> joinStyles = {
        {"round", BufferJoinStyle::ROUND},
        {"mitre", BufferJoinStyle::MITRE},
        {"miter", BufferJoinStyle::MITRE},
        {"bevel", BufferJoinStyle::BEVEL}};

    BufferOptions options;
    options.quadrantSegments = request.resolution.value_or(defaultResolution);
    if (options.quadrantSegments < 1) {
        GEOBRIDGE_THROW(InvalidParameterException, "resolution", "must be at least 1");
    }

    if (request.capStyle && !request.capStyle->empty()) {
        auto it = capStyles.find(StringUtils::toLower(*request.capStyle));
        if (it == capStyles.end()) {
            GEOBRIDGE_THROW(InvalidStyleParameterException, "cap_style", *request.capStyle, "round, flat, square");
        }
        options.capStyle = it->second;
    }

    if (request.joinStyle && !request.joinStyle->empty()) {
        auto it = joinStyles.find(StringUtils::toLower(*request.joinStyle));
        if (it == joinStyles.end()) {
            GEOBRIDGE_THROW(InvalidStyleParameterException, "join_style", *request.joinStyle, "round, mitre, miter, bevel");
        }
        options.joinStyle = it->second;
    }

    if (request.mitreLimit) {
        options.mitreLimit = *request.mitreLimit;
    }
    if (request.singleSided) {
        options.singleSided = *request.singleSided;
    }
    return options;
}

OGRGeometryUniquePtr GeometryOperationEngine::keepDimension(const OGRGeometry& geom, int dimension) {
    if (geom.IsEmpty()) {
        return nullptr;
    }
    if (wkbFlatten(geom.getGeometryType()) != wkbGeometryCollection) {
        if (geom.getDimension() != dimension) {
            return nullptr;
        }
        return OGRGeometryUniquePtr(geom.clone());
    }

    std::vector<const OGRGeometry*> parts;
    collectParts(geom, dimension, parts);
    if (parts.empty()) {
        return nullptr;
    }
    if (parts.size() == 1) {
        return OGRGeometryUniquePtr(parts.front()->clone());
    }

    std::unique_ptr<OGRGeometryCollection> multi;
    switch (dimension) {
        case 0: multi = std::make_unique<OGRMultiPoint>(); break;
        case 1: multi = std::make_unique<OGRMultiLineString>(); break;
        default: multi = std::make_unique<OGRMultiPolygon>(); break;
    }
    for (const auto* part : parts) {
        if (multi->addGeometry(part) != OGRERR_NONE) {
            GEOBRIDGE_THROW(OperationFailedException, "overlay",
                            std::string("cannot collect part of type ") + part->getGeometryName());
        }
    }
    return OGRGeometryUniquePtr(multi.release());
}

GeodataEnvelope GeometryOperationEngine::reproject(const ReprojectRequest& request) const {
    FormatCodec::parseFormat(request.inputFormat);
    const auto outputFormat = FormatCodec::parseOutputFormat(request.outputFormat);
    if (!request.targetCrs || request.targetCrs->empty()) {
        GEOBRIDGE_THROW(MissingParameterException, "target_crs");
    }
    const auto target = SpatialReference::fromUserInput(*request.targetCrs);

    auto table = FormatCodec::load(request.data, request.inputFormat, request.sourceCrs);
    table = CrsReconciler::reproject(std::move(table), target);

    GEOBRIDGE_LOG_INFO("GeometryOperationEngine", "reproject: {} features to {}", table.size(), *request.targetCrs);
    return FormatCodec::dump(std::move(table), outputFormat);
}

GeodataEnvelope GeometryOperationEngine::buffer(const BufferRequest& request) const {
    if (!request.distance) {
        GEOBRIDGE_THROW(MissingParameterException, "distance");
    }
    FormatCodec::parseFormat(request.inputFormat);
    const auto outputFormat = FormatCodec::parseOutputFormat(request.outputFormat);
    const auto options = resolveBufferOptions(request, config_.defaultResolution);
    const auto bufferCrs = parseOptionalCrs(request.bufferCrs);
    const auto outputCrs = parseOptionalCrs(request.outputCrs);

    auto table = FormatCodec::load(request.data, request.inputFormat, request.sourceCrs);
    const auto working = CrsReconciler::resolveWorkingCrs(table, bufferCrs);
    table = CrsReconciler::reproject(std::move(table), working);

    GeometryEngine kernel;
    FeatureTable result = table.cloneSchema();
    std::size_t eroded = 0;
    for (auto& row : table.rows()) {
        auto buffered = kernel.buffer(*row.geometry, *request.distance, options);
        if (!buffered || buffered->IsEmpty()) {
            ++eroded;
            continue;
        }
        row.geometry = std::move(buffered);
        result.addRow(std::move(row));
    }
    if (result.empty()) {
        GEOBRIDGE_THROW(EmptyResultException, "Every geometry vanished with buffer distance " +
                                              std::to_string(*request.distance));
    }
    if (eroded > 0) {
        GEOBRIDGE_LOG_DEBUG("GeometryOperationEngine", "buffer: {} features eroded to empty and dropped", eroded);
    }

    if (outputCrs) {
        result = CrsReconciler::reproject(std::move(result), *outputCrs);
    }

    GEOBRIDGE_LOG_INFO("GeometryOperationEngine", "buffer: {} features, distance {}", result.size(), *request.distance);
    return FormatCodec::dump(std::move(result), outputFormat);
}

GeodataEnvelope GeometryOperationEngine::intersect(const IntersectRequest& request) const {
    FormatCodec::parseFormat(request.inputFormatA);
    FormatCodec::parseFormat(request.inputFormatB);
    const auto outputFormat = FormatCodec::parseOutputFormat(request.outputFormat);
    parseOptionalCrs(request.targetCrs);

    auto reconciled = CrsReconciler::reconcile(
        FormatCodec::load(request.dataA, request.inputFormatA, request.sourceCrsA),
        FormatCodec::load(request.dataB, request.inputFormatB, request.sourceCrsB),
        request.targetCrs);
    const FeatureTable& a = reconciled.first;
    const FeatureTable& b = reconciled.second;

    std::set<std::string> namesA;
    for (const auto& field : a.fields()) {
        namesA.insert(field.name);
    }
    std::set<std::string> shared;
    for (const auto& field : b.fields()) {
        if (namesA.count(field.name)) {
            shared.insert(field.name);
        }
    }
    // Shared names get _1/_2, bumped past any column already using that name
    std::set<std::string> taken = namesA;
    for (const auto& field : b.fields()) {
        taken.insert(field.name);
    }
    std::map<std::string, std::string> renamedA;
    std::map<std::string, std::string> renamedB;
    for (const auto& name : shared) {
        renamedA[name] = reserveFieldName(taken, name + "_1");
        renamedB[name] = reserveFieldName(taken, name + "_2");
    }
    auto columnName = [](const std::map<std::string, std::string>& renamed, const std::string& name) {
        auto it = renamed.find(name);
        return it == renamed.end() ? name : it->second;
    };

    FeatureTable result;
    result.setCrs(a.crs());
    for (const auto& field : a.fields()) {
        result.addField(FieldDefinition{columnName(renamedA, field.name), field.type});
    }
    for (const auto& field : b.fields()) {
        result.addField(FieldDefinition{columnName(renamedB, field.name), field.type});
    }

    std::vector<OGREnvelope> envelopesB(b.size());
    for (std::size_t j = 0; j < b.size(); ++j) {
        b.rows()[j].geometry->getEnvelope(&envelopesB[j]);
    }

    GeometryEngine kernel;
    for (const auto& rowA : a.rows()) {
        OGREnvelope envelopeA;
        rowA.geometry->getEnvelope(&envelopeA);
        const int dimension = rowA.geometry->getDimension();

        for (std::size_t j = 0; j < b.size(); ++j) {
            if (!envelopeA.Intersects(envelopesB[j])) {
                continue;
            }
            const auto& rowB = b.rows()[j];
            auto overlap = kernel.intersection(*rowA.geometry, *rowB.geometry);
            auto kept = keepDimension(*overlap, dimension);
            if (!kept) {
                continue;
            }

            FeatureRow row;
            for (const auto& [name, value] : rowA.attributes) {
                row.attributes[columnName(renamedA, name)] = value;
            }
            for (const auto& [name, value] : rowB.attributes) {
                row.attributes[columnName(renamedB, name)] = value;
            }
            row.geometry = std::move(kept);
            result.addRow(std::move(row));
        }
    }

    if (result.empty()) {
        GEOBRIDGE_THROW(EmptyResultException, "The two inputs do not overlap");
    }

    GEOBRIDGE_LOG_INFO("GeometryOperationEngine", "intersect: {} x {} features -> {} overlaps",
                       a.size(), b.size(), result.size());
    return FormatCodec::dump(std::move(result), outputFormat);
}

GeodataEnvelope GeometryOperationEngine::clip(const ClipRequest& request) const {
    FormatCodec::parseFormat(request.inputFormat);
    FormatCodec::parseFormat(request.clipFormat);
    const auto outputFormat = FormatCodec::parseOutputFormat(request.outputFormat);
    parseOptionalCrs(request.targetCrs);

    auto reconciled = CrsReconciler::reconcile(
        FormatCodec::load(request.data, request.inputFormat, request.sourceCrs),
        FormatCodec::load(request.clipData, request.clipFormat, request.clipSourceCrs),
        request.targetCrs);
    FeatureTable& subject = reconciled.first;
    const FeatureTable& mask = reconciled.second;

    GeometryEngine kernel;
    std::vector<const OGRGeometry*> maskParts;
    for (const auto& row : mask.rows()) {
        maskParts.push_back(row.geometry.get());
    }
    const auto maskGeometry = kernel.unaryUnion(maskParts);
    OGREnvelope maskEnvelope;
    maskGeometry->getEnvelope(&maskEnvelope);

    FeatureTable result = subject.cloneSchema();
    const std::size_t inputCount = subject.size();
    for (auto& row : subject.rows()) {
        OGREnvelope envelope;
        row.geometry->getEnvelope(&envelope);
        if (maskGeometry->IsEmpty() || !envelope.Intersects(maskEnvelope) ||
            !kernel.intersects(*row.geometry, *maskGeometry)) {
            continue;
        }
        auto clipped = keepDimension(*kernel.intersection(*row.geometry, *maskGeometry),
                                     row.geometry->getDimension());
        if (!clipped) {
            continue;
        }
        row.geometry = std::move(clipped);
        result.addRow(std::move(row));
    }

    if (result.empty()) {
        GEOBRIDGE_THROW(EmptyResultException, "No feature intersects the clip geometry");
    }

    GEOBRIDGE_LOG_INFO("GeometryOperationEngine", "clip: kept {} of {} features", result.size(), inputCount);
    return FormatCodec::dump(std::move(result), outputFormat);
}

GeodataEnvelope GeometryOperationEngine::convert(const ConvertRequest& request) const {
    FormatCodec::parseFormat(request.inputFormat);
    if (request.outputFormat.empty()) {
        GEOBRIDGE_THROW(MissingParameterException, "output_format");
    }
    const auto outputFormat = FormatCodec::parseFormat(request.outputFormat);

    auto table = FormatCodec::load(request.data, request.inputFormat, request.sourceCrs);
    GEOBRIDGE_LOG_INFO("GeometryOperationEngine", "convert: {} features {} -> {}",
                       table.size(), request.inputFormat, toString(outputFormat));
    return FormatCodec::dump(std::move(table), outputFormat);
}

BoundingBox GeometryOperationEngine::bbox(const BboxRequest& request) const {
    FormatCodec::parseFormat(request.inputFormat);
    const auto target = parseOptionalCrs(request.targetCrs);

    auto table = FormatCodec::load(request.data, request.inputFormat, request.sourceCrs);
    if (target) {
        table = CrsReconciler::reproject(std::move(table), *target);
    }

    GeometryEngine kernel;
    OGREnvelope total;
    bool any = false;
    for (const auto& row : table.rows()) {
        if (row.geometry->IsEmpty()) {
            continue;
        }
        const OGREnvelope envelope = kernel.envelope(*row.geometry);
        if (any) {
            total.Merge(envelope);
        } else {
            total = envelope;
            any = true;
        }
    }
    if (!any) {
        GEOBRIDGE_THROW(EmptyResultException, "All geometries of the input are empty");
    }

    BoundingBox box;
    box.minX = total.MinX;
    box.minY = total.MinY;
    box.maxX = total.MaxX;
    box.maxY = total.MaxY;
    box.crs = FormatCodec::crsIdentifier(table);
    return box;
}

GeodataEnvelope GeometryOperationEngine::dissolve(const DissolveRequest& request) const {
    FormatCodec::parseFormat(request.inputFormat);
    const auto outputFormat = FormatCodec::parseOutputFormat(request.outputFormat);
    const auto target = parseOptionalCrs(request.targetCrs);

    std::map<std::string, AggregationKind> reductions;
    for (const auto& [column, name] : request.aggregations) {
        reductions[column] = parseAggregationKind(name);
    }
    const bool grouped = request.by && !request.by->empty();

    auto table = FormatCodec::load(request.data, request.inputFormat, request.sourceCrs);
    if (target) {
        table = CrsReconciler::reproject(std::move(table), *target);
    }

    if (grouped && !table.hasField(*request.by)) {
        GEOBRIDGE_THROW(InvalidParameterException, "by", "unknown column '" + *request.by + "'");
    }
    for (const auto& [column, kind] : reductions) {
        auto type = table.fieldType(column);
        if (!type) {
            GEOBRIDGE_THROW(InvalidParameterException, "aggregations", "unknown column '" + column + "'");
        }
        AttributeAggregator::validate(kind, column, *type);
    }

    std::map<AttributeValue, std::vector<std::size_t>, GroupKeyLess> groups;
    for (std::size_t i = 0; i < table.size(); ++i) {
        AttributeValue key;
        if (grouped) {
            auto it = table.rows()[i].attributes.find(*request.by);
            if (it != table.rows()[i].attributes.end()) {
                key = it->second;
            }
        }
        groups[key].push_back(i);
    }

    FeatureTable result;
    result.setCrs(table.crs());
    if (grouped) {
        result.addField(FieldDefinition{*request.by, *table.fieldType(*request.by)});
    }
    for (const auto& field : table.fields()) {
        if (grouped && field.name == *request.by) {
            continue;
        }
        auto it = reductions.find(field.name);
        const auto kind = it == reductions.end() ? AggregationKind::FIRST : it->second;
        result.addField(FieldDefinition{field.name, AttributeAggregator::resultType(kind, field.type)});
    }

    GeometryEngine kernel;
    for (const auto& [key, indices] : groups) {
        FeatureRow row;
        std::vector<const OGRGeometry*> geometries;
        for (auto index : indices) {
            geometries.push_back(table.rows()[index].geometry.get());
        }
        row.geometry = kernel.unaryUnion(geometries);

        if (grouped) {
            row.attributes[*request.by] = key;
        }
        for (const auto& field : table.fields()) {
            if (grouped && field.name == *request.by) {
                continue;
            }
            std::vector<AttributeValue> values;
            values.reserve(indices.size());
            for (auto index : indices) {
                const auto& attributes = table.rows()[index].attributes;
                auto it = attributes.find(field.name);
                values.push_back(it == attributes.end() ? AttributeValue{} : it->second);
            }
            auto reduction = reductions.find(field.name);
            const auto kind = reduction == reductions.end() ? AggregationKind::FIRST : reduction->second;
            row.attributes[field.name] = AttributeAggregator::aggregate(kind, values, field.type);
        }
        result.addRow(std::move(row));
    }

    GEOBRIDGE_LOG_INFO("GeometryOperationEngine", "dissolve: {} features into {} groups", table.size(), result.size());
    return FormatCodec::dump(std::move(result), outputFormat);
}

GeodataEnvelope GeometryOperationEngine::explode(const ExplodeRequest& request) const {
    FormatCodec::parseFormat(request.inputFormat);
    const auto outputFormat = FormatCodec::parseOutputFormat(request.outputFormat);

    auto table = FormatCodec::load(request.data, request.inputFormat, request.sourceCrs);

    FeatureTable result = table.cloneSchema();
    std::string sourceIndexField;
    std::string partIndexField;
    if (request.keepIndex) {
        // An input column named source_index is kept and the index column renamed
        std::set<std::string> taken;
        for (const auto& field : table.fields()) {
            taken.insert(field.name);
        }
        sourceIndexField = reserveFieldName(taken, "source_index");
        partIndexField = reserveFieldName(taken, "part_index");
        result.addField(FieldDefinition{sourceIndexField, FieldType::INTEGER});
        result.addField(FieldDefinition{partIndexField, FieldType::INTEGER});
    }

    auto addPart = [&](const FeatureRow& source, OGRGeometryUniquePtr geometry,
                       std::size_t sourceIndex, std::size_t partIndex) {
        FeatureRow row;
        row.attributes = source.attributes;
        if (request.keepIndex) {
            row.attributes[sourceIndexField] = static_cast<std::int64_t>(sourceIndex);
            row.attributes[partIndexField] = static_cast<std::int64_t>(partIndex);
        }
        row.geometry = std::move(geometry);
        result.addRow(std::move(row));
    };

    for (std::size_t i = 0; i < table.size(); ++i) {
        auto& row = table.rows()[i];
        if (!isCollection(*row.geometry)) {
            addPart(row, std::move(row.geometry), i, 0);
            continue;
        }
        const OGRGeometryCollection* collection = row.geometry->toGeometryCollection();
        // part_index is the position in the collection, so skipped empty parts leave a gap
        for (int part = 0; part < collection->getNumGeometries(); ++part) {
            const OGRGeometry* member = collection->getGeometryRef(part);
            if (member->IsEmpty()) {
                continue;
            }
            addPart(row, OGRGeometryUniquePtr(member->clone()), i, static_cast<std::size_t>(part));
        }
    }

    if (result.empty()) {
        GEOBRIDGE_THROW(EmptyResultException, "Every part of the input is empty");
    }

    GEOBRIDGE_LOG_INFO("GeometryOperationEngine", "explode: {} features into {} parts", table.size(), result.size());
    return FormatCodec::dump(std::move(result), outputFormat);
}

} // namespace geobridge::core_services::geo_processing::engine
