#include "engine/attribute_aggregator.h"
#include "core_services/geo_processing/geo_processing_exceptions.h"
#include "common_utils/utilities/string_utils.h"

#include <algorithm>
#include <cstdint>

namespace geobridge::core_services::geo_processing::engine {

using common_utils::StringUtils;

namespace {

bool isNull(const AttributeValue& value) {
    return std::holds_alternative<std::monostate>(value);
}

double toDouble(const AttributeValue& value) {
    if (auto i = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (auto d = std::get_if<double>(&value)) {
        return *d;
    }
    if (auto b = std::get_if<bool>(&value)) {
        return *b ? 1.0 : 0.0;
    }
    return 0.0;
}

std::int64_t toInt(const AttributeValue& value) {
    if (auto i = std::get_if<std::int64_t>(&value)) {
        return *i;
    }
    if (auto b = std::get_if<bool>(&value)) {
        return *b ? 1 : 0;
    }
    return static_cast<std::int64_t>(toDouble(value));
}

// Orders two non-null values of the same column type
bool lessThan(const AttributeValue& a, const AttributeValue& b) {
    if (a.index() == b.index()) {
        return a < b;
    }
    return toDouble(a) < toDouble(b);
}

} // anonymous namespace

AggregationKind parseAggregationKind(const std::string& name) {
    const std::string key = StringUtils::toLower(StringUtils::trim(name));
    if (key == "first") return AggregationKind::FIRST;
    if (key == "last") return AggregationKind::LAST;
    if (key == "sum") return AggregationKind::SUM;
    if (key == "mean") return AggregationKind::MEAN;
    if (key == "min") return AggregationKind::MIN;
    if (key == "max") return AggregationKind::MAX;
    if (key == "count") return AggregationKind::COUNT;
    GEOBRIDGE_THROW(InvalidParameterException, "aggregations",
                    "unknown reduction '" + name + "', expected one of: first, last, sum, mean, min, max, count");
}

std::string toString(AggregationKind kind) {
    switch (kind) {
        case AggregationKind::FIRST: return "first";
        case AggregationKind::LAST: return "last";
        case AggregationKind::SUM: return "sum";
        case AggregationKind::MEAN: return "mean";
        case AggregationKind::MIN: return "min";
        case AggregationKind::MAX: return "max";
        case AggregationKind::COUNT: return "count";
    }
    return "first";
}

FieldType AttributeAggregator::resultType(AggregationKind kind, FieldType inputType) {
    switch (kind) {
        case AggregationKind::COUNT:
            return FieldType::INTEGER;
        case AggregationKind::MEAN:
            return FieldType::REAL;
        case AggregationKind::SUM:
            return inputType == FieldType::REAL ? FieldType::REAL : FieldType::INTEGER;
        default:
            return inputType;
    }
}

void AttributeAggregator::validate(AggregationKind kind, const std::string& column, FieldType inputType) {
    if (inputType == FieldType::STRING &&
        (kind == AggregationKind::SUM || kind == AggregationKind::MEAN)) {
        GEOBRIDGE_THROW(InvalidParameterException, "aggregations",
                        "reduction '" + toString(kind) + "' is not defined for string column '" + column + "'");
    }
}

AttributeValue AttributeAggregator::aggregate(AggregationKind kind,
                                              const std::vector<AttributeValue>& values,
                                              FieldType inputType) {
    std::vector<const AttributeValue*> present;
    present.reserve(values.size());
    for (const auto& value : values) {
        if (!isNull(value)) {
            present.push_back(&value);
        }
    }

    switch (kind) {
        case AggregationKind::FIRST:
            return present.empty() ? AttributeValue{} : *present.front();

        case AggregationKind::LAST:
            return present.empty() ? AttributeValue{} : *present.back();

        case AggregationKind::COUNT:
            return static_cast<std::int64_t>(present.size());

        case AggregationKind::SUM: {
            if (inputType == FieldType::REAL) {
                double total = 0.0;
                for (const auto* v : present) total += toDouble(*v);
                return total;
            }
            std::int64_t total = 0;
            for (const auto* v : present) total += toInt(*v);
            return total;
        }

        case AggregationKind::MEAN: {
            if (present.empty()) {
                return AttributeValue{};
            }
            double total = 0.0;
            for (const auto* v : present) total += toDouble(*v);
            return total / static_cast<double>(present.size());
        }

        case AggregationKind::MIN:
        case AggregationKind::MAX: {
            if (present.empty()) {
                return AttributeValue{};
            }
            auto cmp = [](const AttributeValue* a, const AttributeValue* b) { return lessThan(*a, *b); };
            auto it = kind == AggregationKind::MIN
                ? std::min_element(present.begin(), present.end(), cmp)
                : std::max_element(present.begin(), present.end(), cmp);
            return **it;
        }
    }
    return AttributeValue{};
}

} // namespace geobridge::core_services::geo_processing::engine
