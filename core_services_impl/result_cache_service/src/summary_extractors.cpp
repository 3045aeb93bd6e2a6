#include "summary_extractors.h"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <string>

namespace geobridge::core_services::result_cache::summary {

using nlohmann::json;

namespace {

// 缺失的成员与非对象输入统一返回 null
json member(const json& data, const char* key) {
    if (!data.is_object()) {
        return nullptr;
    }
    auto it = data.find(key);
    return it == data.end() ? json(nullptr) : *it;
}

json copyMembers(const json& data, std::initializer_list<const char*> keys) {
    json out = json::object();
    for (const char* key : keys) {
        out[key] = member(data, key);
    }
    return out;
}

const json& emptyArray() {
    static const json empty = json::array();
    return empty;
}

const json& arrayMember(const json& data, const char* key) {
    if (data.is_object()) {
        auto it = data.find(key);
        if (it != data.end() && it->is_array()) {
            return *it;
        }
    }
    return emptyArray();
}

std::string geometryType(const json& geometry) {
    if (geometry.is_object()) {
        auto it = geometry.find("type");
        if (it != geometry.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return {};
}

} // anonymous namespace

json summarizeRoute(const json& result, const json& /*params*/) {
    json out = copyMembers(result, {"distance", "duration", "bbox", "start", "end", "profile", "resource"});

    const json geometry = member(result, "geometry");
    if (geometryType(geometry) == "LineString") {
        const json& coords = arrayMember(geometry, "coordinates");
        out["geometry_points_count"] = coords.size();
        if (!coords.empty()) {
            json sample = coords.size() >= 2 ? json::array({coords.front(), coords.back()}) : coords;
            out["geometry_sample"] = {{"type", "LineString"}, {"coordinates", sample}};
        }
    }

    std::size_t steps = 0;
    for (const auto& portion : arrayMember(result, "portions")) {
        steps += arrayMember(portion, "steps").size();
    }
    out["steps_count"] = steps;
    return out;
}

json summarizeIsochrone(const json& result, const json& /*params*/) {
    json out = copyMembers(result, {"point", "time", "distance", "direction", "profile", "resource", "bbox"});

    const json geometry = member(result, "geometry");
    const std::string type = geometryType(geometry);
    const json& coords = arrayMember(geometry, "coordinates");
    if (type == "Polygon") {
        out["geometry_points_count"] = coords.empty() || !coords.front().is_array() ? 0 : coords.front().size();
    } else if (type == "MultiPolygon") {
        std::size_t points = 0;
        std::size_t rings = 0;
        for (const auto& polygon : coords) {
            if (!polygon.is_array()) continue;
            for (const auto& ring : polygon) {
                ++rings;
                points += ring.is_array() ? ring.size() : 0;
            }
        }
        out["geometry_points_count"] = points;
        out["polygons_count"] = coords.size();
        out["rings_count"] = rings;
        out["note"] = "MultiPolygon is too complex to summarize further; export the entry for the full geometry";
    }
    return out;
}

json summarizeFeatureCollection(const json& result, const json& params) {
    const json& features = arrayMember(result, "features");
    json out = {
        {"type", "FeatureCollection"},
        {"features_count", features.size()},
        {"typename", member(result, "typename")},
        {"bbox_filter", member(result, "bbox_filter")},
        {"query_params", params}
    };

    if (!features.empty()) {
        json sample = features.front();
        if (sample.is_object() && sample.contains("geometry") && sample["geometry"].is_object()) {
            const json& geometry = sample["geometry"];
            const json coords = geometry.value("coordinates", json::array());
            sample["geometry"] = {
                {"type", member(geometry, "type")},
                {"coordinates_count", coords.dump().size()}
            };
        }
        out["sample_feature"] = sample;
    }
    return out;
}

json summarizeElevationProfile(const json& result, const json& /*params*/) {
    json out = copyMembers(result, {"sampling", "lon", "lat"});

    const json& elevations = arrayMember(result, "elevations");
    out["points_count"] = elevations.size();

    bool any = false;
    double minZ = 0.0;
    double maxZ = 0.0;
    for (const auto& point : elevations) {
        if (!point.is_object()) continue;
        auto z = point.find("z");
        if (z == point.end() || !z->is_number()) continue;
        const double value = z->get<double>();
        minZ = any ? std::min(minZ, value) : value;
        maxZ = any ? std::max(maxZ, value) : value;
        any = true;
    }
    if (any) {
        out["altitude_min"] = minZ;
        out["altitude_max"] = maxZ;
        out["altitude_range"] = maxZ - minZ;
    }

    if (elevations.size() > 4) {
        out["elevations_sample"] = json::array({elevations[0], elevations[1],
                                                elevations[elevations.size() - 2], elevations.back()});
    } else {
        out["elevations_sample"] = elevations;
    }
    return out;
}

json summarizeGeneric(const json& result, const json& /*params*/) {
    json keys = nullptr;
    if (result.is_object()) {
        keys = json::array();
        for (const auto& item : result.items()) {
            keys.push_back(item.key());
        }
    }
    return {{"data_size_bytes", result.dump().size()}, {"keys", keys}};
}

const std::map<OperationKind, SummaryExtractor>& extractorTable() {
    static const std::map<OperationKind, SummaryExtractor> table = {
        {OperationKind::ROUTE, &summarizeRoute},
        {OperationKind::ISOCHRONE, &summarizeIsochrone},
        {OperationKind::FEATURE_COLLECTION, &summarizeFeatureCollection},
        {OperationKind::ELEVATION_PROFILE, &summarizeElevationProfile},
        {OperationKind::GENERIC, &summarizeGeneric}};
    return table;
}

json extract(OperationKind kind, const json& result, const json& params) {
    const auto& table = extractorTable();
    auto it = table.find(kind);
    const auto& extractor = it == table.end() ? table.at(OperationKind::GENERIC) : it->second;
    return extractor(result, params);
}

} // namespace geobridge::core_services::result_cache::summary
